/**
 * @file TranscriptReportWriter.hpp
 * @brief Consolidates the worker's per-file results into batch-level report files.
 */

#pragma once

#include "domain/BatchResult.hpp"
#include "domain/Transcript.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace audioscribe::infrastructure {

/**
 * @class TranscriptReportWriter
 * @brief Writes transcripts_detailed.json and all_transcripts.txt into the results root.
 *
 * Reads `<stem>.json` and `<stem>.txt` from the output directory of every succeeded job.
 * A job whose result files cannot be read is skipped with a warning; it does not fail the report.
 */
class TranscriptReportWriter {
public:
    static constexpr const char* kDetailedJsonName = "transcripts_detailed.json";
    static constexpr const char* kAllTextName = "all_transcripts.txt";

    explicit TranscriptReportWriter(std::filesystem::path resultsRoot);

    /**
     * @brief Collects every succeeded job, fills in missing subtitles and writes both reports.
     * @return false if a report file could not be written; `error` holds the reason.
     */
    bool WriteBatchReport(const domain::BatchResult& batch, std::string& error) const;

    /** @brief Parses the worker result files in `outputDir` for the input `inputFile`. */
    static std::optional<domain::TranscriptRecord> ReadTranscript(const std::filesystem::path& inputFile,
                                                                   const std::filesystem::path& outputDir,
                                                                   std::string& error);

    /** @brief Renders `<stem>.srt` when the worker produced segments but no subtitle file. */
    static bool EnsureSubtitles(const domain::TranscriptRecord& record,
                                const std::filesystem::path& inputFile,
                                const std::filesystem::path& outputDir,
                                std::string& error);

    static std::string RenderDetailedJson(const std::vector<domain::TranscriptRecord>& records);
    static std::string RenderAllText(const std::vector<domain::TranscriptRecord>& records);

    /** @brief Writes `content` to a temp file beside `target`, then renames it into place. */
    static bool WriteAtomic(const std::filesystem::path& target, const std::string& content, std::string& error);

private:
    std::filesystem::path m_resultsRoot;
};

} // namespace audioscribe::infrastructure
