#include "app/UploadServer.hpp"

#include "application/JobRunner.hpp"
#include "application/Reporter.hpp"
#include "infrastructure/JobIdGenerator.hpp"
#include "infrastructure/WorkspaceManager.hpp"

#include <httplib.h>

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace audioscribe::app {

using json = nlohmann::json;

namespace {

void SendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(2, ' ', false, json::error_handler_t::replace), "application/json");
}

void SendError(httplib::Response& res, int status, const std::string& message) {
    SendJson(res, status, json{{"error", message}});
}

std::string ContentTypeFor(const fs::path& file) {
    std::string ext = file.extension().string();
    if (ext == ".json") return "application/json";
    if (ext == ".txt" || ext == ".srt" || ext == ".tsv") return "text/plain; charset=utf-8";
    if (ext == ".vtt") return "text/vtt; charset=utf-8";
    return "application/octet-stream";
}

} // namespace

UploadServer::UploadServer(application::JobQueue& queue,
                           application::JobRegistry& registry,
                           domain::Workspace workspace,
                           domain::Configuration baseConfig,
                           SystemCheck systemCheck)
    : m_queue(queue),
      m_registry(registry),
      m_workspace(std::move(workspace)),
      m_baseConfig(std::move(baseConfig)),
      m_systemCheck(std::move(systemCheck)),
      m_server(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

UploadServer::~UploadServer() = default;

bool UploadServer::Bind(const std::string& host, int port) {
    if (!m_server->bind_to_port(host, port)) {
        std::cerr << "[UploadServer] Could not bind " << host << ":" << port << std::endl;
        return false;
    }
    m_host = host;
    m_port = port;
    return true;
}

bool UploadServer::Serve() {
    std::cout << "[UploadServer] Listening on http://" << m_host << ":" << m_port << std::endl;
    if (!m_server->listen_after_bind()) {
        std::cerr << "[UploadServer] Listener on " << m_host << ":" << m_port << " failed" << std::endl;
        return false;
    }
    return true;
}

bool UploadServer::WaitUntilRunning(std::chrono::milliseconds budget) const {
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (!m_server->is_running()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

void UploadServer::Stop() {
    m_server->stop();
}

std::string UploadServer::SanitizeFileName(const std::string& name) {
    std::string base = fs::path(name).filename().string();
    std::string out;
    out.reserve(base.size());
    for (unsigned char c : base) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            out += static_cast<char>(c);
        } else {
            out += '_';
        }
    }
    if (out.empty() || out == "." || out == "..") return "upload";
    return out;
}

bool UploadServer::IsSafeOverride(const std::string& value) {
    if (value.empty() || value.size() > 64 || value.front() == '-') return false;
    for (unsigned char c : value) {
        if (!std::isalnum(c) && c != '.' && c != '_' && c != '-') return false;
    }
    return true;
}

std::optional<std::string> UploadServer::SubmitUpload(const std::string& fileName,
                                                      const std::string& content,
                                                      const std::string& model,
                                                      const std::string& language,
                                                      std::string& error) {
    std::string safeName = SanitizeFileName(fileName);
    if (!infrastructure::WorkspaceManager::IsMediaFile(safeName)) {
        error = "Unsupported file type: " + safeName;
        return std::nullopt;
    }
    if (content.empty()) {
        error = "Uploaded file is empty";
        return std::nullopt;
    }

    domain::Configuration config = m_baseConfig;
    if (!model.empty()) {
        if (!IsSafeOverride(model)) {
            error = "Invalid model name";
            return std::nullopt;
        }
        config = config.With("WHISPER_MODEL", model);
    }
    if (!language.empty()) {
        if (!IsSafeOverride(language)) {
            error = "Invalid language code";
            return std::nullopt;
        }
        config = config.With("LANGUAGE", language);
    }

    const std::string id = infrastructure::JobIdGenerator::Generate();
    fs::path stored = m_workspace.input / (id + "-" + safeName);
    {
        std::ofstream out(stored, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error = "Cannot store upload at " + stored.string();
            return std::nullopt;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (out.fail()) {
            error = "Write failed for " + stored.string();
            return std::nullopt;
        }
    }

    domain::Job job = application::JobRunner::MakeJob(id, stored, m_workspace);
    if (!m_queue.Submit(job, config)) {
        std::error_code ec;
        fs::remove(stored, ec);
        error = "Job queue is not accepting work";
        return std::nullopt;
    }
    return id;
}

json UploadServer::StatusToJson(const application::JobStatus& status) {
    json files = json::array();
    for (const auto& file : status.outputFiles) {
        files.push_back(file.filename().string());
    }
    json out = {
        {"job_id", status.job.id},
        {"file", status.job.inputFile.filename().string()},
        {"state", domain::JobStateName(status.state)},
        {"phase", domain::PhaseName(status.phase)},
        {"progress", application::Reporter::PhaseLabel(status.phase)},
        {"error", domain::ErrorKindName(status.error)},
        {"error_message", status.errorMessage},
        {"excerpt", status.diagnosticExcerpt},
        {"output_files", files},
        {"elapsed_seconds", status.elapsedSeconds}
    };
    out["exit_code"] = status.exitCode ? json(*status.exitCode) : json(nullptr);
    return out;
}

json UploadServer::ReportToJson(const domain::ReadinessReport& report) {
    json checks = json::array();
    for (const auto& check : report.checks) {
        const char* severity = "passed";
        if (check.severity == domain::CheckSeverity::Warning) severity = "warning";
        if (check.severity == domain::CheckSeverity::HardFailure) severity = "failed";
        checks.push_back({
            {"name", check.name},
            {"severity", severity},
            {"message", check.message}
        });
    }
    return json{
        {"ready", report.Ready()},
        {"device", report.effective.Device()},
        {"model", report.effective.Model()},
        {"checks", checks}
    };
}

void UploadServer::RegisterRoutes() {
    m_server->Post("/api/jobs", [this](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_file("file")) {
            SendError(res, 400, "Missing multipart field 'file'");
            return;
        }
        const auto upload = req.get_file_value("file");
        std::string model = req.has_file("model") ? req.get_file_value("model").content : std::string();
        std::string language = req.has_file("language") ? req.get_file_value("language").content : std::string();

        std::string error;
        auto id = SubmitUpload(upload.filename, upload.content, model, language, error);
        if (!id) {
            std::cerr << "[UploadServer] Rejected upload: " << error << std::endl;
            SendError(res, 400, error);
            return;
        }
        SendJson(res, 202, json{{"job_id", *id}});
    });

    m_server->Get("/api/jobs", [this](const httplib::Request&, httplib::Response& res) {
        json jobs = json::array();
        for (const auto& status : m_registry.List()) {
            jobs.push_back(StatusToJson(status));
        }
        SendJson(res, 200, json{{"jobs", jobs}, {"pending", m_queue.PendingCount()}});
    });

    m_server->Get(R"(/api/jobs/([A-Za-z0-9-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto status = m_registry.Get(req.matches[1]);
        if (!status) {
            SendError(res, 404, "Unknown job");
            return;
        }
        SendJson(res, 200, StatusToJson(*status));
    });

    m_server->Get(R"(/download/([A-Za-z0-9-]+)/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto status = m_registry.Get(req.matches[1]);
        if (!status) {
            SendError(res, 404, "Unknown job");
            return;
        }
        const std::string wanted = req.matches[2];
        for (const auto& file : status->outputFiles) {
            if (file.filename().string() != wanted) continue;

            std::ifstream in(file, std::ios::binary);
            if (!in.is_open()) {
                SendError(res, 404, "Result file is no longer available");
                return;
            }
            std::stringstream buffer;
            buffer << in.rdbuf();
            res.set_header("Content-Disposition", "attachment; filename=\"" + wanted + "\"");
            res.set_content(buffer.str(), ContentTypeFor(file));
            return;
        }
        SendError(res, 404, "No such result file");
    });

    m_server->Get("/api/system", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, ReportToJson(m_systemCheck()));
    });
}

} // namespace audioscribe::app
