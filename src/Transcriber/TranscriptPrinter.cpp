#include "TranscriptPrinter.hpp"

#include <cstdio>

namespace {

const std::string kRule(50, '=');

} // namespace

std::string JoinSegments(const std::vector<TranscriptSegment>& segments) {
    std::string joined;
    for (const auto& segment : segments) {
        if (segment.text.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += segment.text;
    }
    return joined;
}

std::string FormatTimestamp(int64_t ms) {
    if (ms < 0) {
        ms = 0;
    }
    const long long minutes = ms / 60000;
    const int seconds = static_cast<int>((ms / 1000) % 60);
    const int millis = static_cast<int>(ms % 1000);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02d.%03d", minutes, seconds, millis);
    return buffer;
}

void PrintTranscript(std::ostream& out, const std::vector<TranscriptSegment>& segments, bool withTimestamps) {
    out << "\n" << kRule << "\n";
    out << "TRANSCRIPTION RESULT:\n";
    out << kRule << "\n";
    if (withTimestamps) {
        for (const auto& segment : segments) {
            out << "[" << FormatTimestamp(segment.startMs) << " --> " << FormatTimestamp(segment.endMs) << "] "
                << segment.text << "\n";
        }
    } else {
        out << JoinSegments(segments) << "\n";
    }
    out << kRule << std::endl;
}
