#include "application/SubtitleFormatter.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace audioscribe::application {

namespace {

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::string SubtitleFormatter::FormatTimestamp(double seconds) {
    if (!(seconds > 0.0)) seconds = 0.0;
    long long totalMs = std::llround(seconds * 1000.0);
    long long hours = totalMs / 3600000;
    long long minutes = (totalMs / 60000) % 60;
    long long secs = (totalMs / 1000) % 60;
    long long millis = totalMs % 1000;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld", hours, minutes, secs, millis);
    return buf;
}

std::string SubtitleFormatter::RenderSrt(const std::vector<domain::TranscriptSegment>& segments) {
    std::ostringstream out;
    int index = 1;
    for (const auto& segment : segments) {
        out << index++ << "\n";
        out << FormatTimestamp(segment.start) << " --> " << FormatTimestamp(segment.end) << "\n";
        if (!segment.speaker.empty()) {
            out << "[" << segment.speaker << "]: ";
        }
        out << Trim(segment.text) << "\n\n";
    }
    return out.str();
}

} // namespace audioscribe::application
