#include "infrastructure/TranscriptReportWriter.hpp"

#include "application/SubtitleFormatter.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace audioscribe::infrastructure {

using json = nlohmann::json;

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::optional<std::string> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

TranscriptReportWriter::TranscriptReportWriter(fs::path resultsRoot)
    : m_resultsRoot(std::move(resultsRoot)) {}

std::optional<domain::TranscriptRecord> TranscriptReportWriter::ReadTranscript(const fs::path& inputFile,
                                                                               const fs::path& outputDir,
                                                                               std::string& error) {
    const std::string stem = inputFile.stem().string();
    domain::TranscriptRecord record;
    record.file = inputFile.string();

    bool found = false;
    auto jsonText = ReadFile(outputDir / (stem + ".json"));
    if (jsonText) {
        try {
            auto doc = json::parse(*jsonText);
            if (doc.contains("language") && doc["language"].is_string()) {
                record.language = doc["language"].get<std::string>();
            }
            if (doc.contains("segments") && doc["segments"].is_array()) {
                for (const auto& item : doc["segments"]) {
                    domain::TranscriptSegment segment;
                    segment.start = item.value("start", 0.0);
                    segment.end = item.value("end", 0.0);
                    segment.text = Trim(item.value("text", std::string()));
                    segment.speaker = item.value("speaker", std::string());
                    record.segments.push_back(std::move(segment));
                }
            }
            found = true;
        } catch (const json::exception& e) {
            error = "Invalid worker JSON for " + record.file + ": " + e.what();
            return std::nullopt;
        }
    }

    auto plain = ReadFile(outputDir / (stem + ".txt"));
    if (plain) {
        record.text = Trim(*plain);
        found = true;
    } else {
        std::string joined;
        for (const auto& segment : record.segments) {
            if (segment.text.empty()) continue;
            if (!joined.empty()) joined += ' ';
            joined += segment.text;
        }
        record.text = joined;
    }

    if (!found) {
        error = "No worker result files for " + record.file + " in " + outputDir.string();
        return std::nullopt;
    }
    return record;
}

bool TranscriptReportWriter::EnsureSubtitles(const domain::TranscriptRecord& record,
                                             const fs::path& inputFile,
                                             const fs::path& outputDir,
                                             std::string& error) {
    if (record.segments.empty()) return true;
    fs::path srtPath = outputDir / (inputFile.stem().string() + ".srt");
    std::error_code ec;
    if (fs::exists(srtPath, ec)) return true;
    return WriteAtomic(srtPath, application::SubtitleFormatter::RenderSrt(record.segments), error);
}

std::string TranscriptReportWriter::RenderDetailedJson(const std::vector<domain::TranscriptRecord>& records) {
    json out = json::array();
    for (const auto& record : records) {
        json segments = json::array();
        for (const auto& segment : record.segments) {
            json item = {
                {"start", segment.start},
                {"end", segment.end},
                {"text", segment.text}
            };
            if (!segment.speaker.empty()) item["speaker"] = segment.speaker;
            segments.push_back(std::move(item));
        }
        out.push_back({
            {"file", record.file},
            {"text", record.text},
            {"segments", std::move(segments)},
            {"language", record.language}
        });
    }
    // Transcripts are not ASCII in general; keep invalid sequences instead of throwing.
    return out.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

std::string TranscriptReportWriter::RenderAllText(const std::vector<domain::TranscriptRecord>& records) {
    std::string out;
    for (const auto& record : records) {
        out += "=== " + fs::path(record.file).filename().string() + " ===\n";
        out += record.text + "\n\n";
    }
    return out;
}

bool TranscriptReportWriter::WriteAtomic(const fs::path& target, const std::string& content, std::string& error) {
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Cannot create " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            error = "Cannot open temp file " + tempPath.string();
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            error = "Write failed for " + tempPath.string();
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, target, ec);
    if (ec) {
        error = "Rename to " + target.string() + " failed: " + ec.message();
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return false;
    }
    return true;
}

bool TranscriptReportWriter::WriteBatchReport(const domain::BatchResult& batch, std::string& error) const {
    std::vector<domain::TranscriptRecord> records;
    for (const auto& result : batch.jobs) {
        if (!result.Succeeded()) continue;

        std::string readError;
        auto record = ReadTranscript(result.job.inputFile, result.job.outputDir, readError);
        if (!record) {
            std::cerr << "[TranscriptReportWriter] Skipping " << result.job.inputFile.filename().string()
                      << ": " << readError << std::endl;
            continue;
        }

        std::string srtError;
        if (!EnsureSubtitles(*record, result.job.inputFile, result.job.outputDir, srtError)) {
            std::cerr << "[TranscriptReportWriter] Could not write subtitles: " << srtError << std::endl;
        }
        records.push_back(std::move(*record));
    }

    if (!WriteAtomic(m_resultsRoot / kDetailedJsonName, RenderDetailedJson(records), error)) return false;
    if (!WriteAtomic(m_resultsRoot / kAllTextName, RenderAllText(records), error)) return false;

    std::cout << "[TranscriptReportWriter] Wrote " << records.size() << " transcript(s) to "
              << m_resultsRoot.string() << std::endl;
    return true;
}

} // namespace audioscribe::infrastructure
