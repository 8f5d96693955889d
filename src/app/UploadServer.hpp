/**
 * @file UploadServer.hpp
 * @brief HTTP surface for submitting uploads and polling job status.
 */

#pragma once

#include "application/JobQueue.hpp"
#include "application/JobRegistry.hpp"
#include "domain/Configuration.hpp"
#include "domain/ReadinessReport.hpp"
#include "domain/Workspace.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace httplib {
class Server;
}

namespace audioscribe::app {

/**
 * @class UploadServer
 * @brief JSON API over the job queue.
 *
 * Routes:
 *  - POST /api/jobs               multipart `file`, optional `model` and `language`
 *  - GET  /api/jobs               every job, in submission order
 *  - GET  /api/jobs/<id>          one job
 *  - GET  /download/<id>/<file>   a result file of a finished job
 *  - GET  /api/system             fresh readiness report
 */
class UploadServer {
public:
    using SystemCheck = std::function<domain::ReadinessReport()>;

    UploadServer(application::JobQueue& queue,
                 application::JobRegistry& registry,
                 domain::Workspace workspace,
                 domain::Configuration baseConfig,
                 SystemCheck systemCheck);
    ~UploadServer();

    /** @brief Binds the listening socket; reports an occupied or invalid address immediately. */
    bool Bind(const std::string& host, int port);

    /** @brief Serves requests on the bound socket until Stop(). Blocks. */
    bool Serve();

    /**
     * @brief Waits until Serve() has entered its accept loop.
     * Stop() has no effect before that point.
     */
    bool WaitUntilRunning(std::chrono::milliseconds budget) const;

    void Stop();

    /**
     * @brief Stores an upload as `<input>/<id>-<name>` and queues it.
     * @return The new job id, or nullopt with `error` set.
     */
    std::optional<std::string> SubmitUpload(const std::string& fileName,
                                            const std::string& content,
                                            const std::string& model,
                                            const std::string& language,
                                            std::string& error);

    static nlohmann::json StatusToJson(const application::JobStatus& status);
    static nlohmann::json ReportToJson(const domain::ReadinessReport& report);

    /** @brief Final path component with anything but [A-Za-z0-9._-] replaced by '_'. */
    static std::string SanitizeFileName(const std::string& name);

    /** @brief Override values must be plain tokens; they end up on the worker's command line. */
    static bool IsSafeOverride(const std::string& value);

private:
    void RegisterRoutes();

    application::JobQueue& m_queue;
    application::JobRegistry& m_registry;
    domain::Workspace m_workspace;
    domain::Configuration m_baseConfig;
    SystemCheck m_systemCheck;
    std::unique_ptr<httplib::Server> m_server;
    std::string m_host;
    int m_port = 0;
};

} // namespace audioscribe::app
