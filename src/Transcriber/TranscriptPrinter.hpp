#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "ITranscriptionEngine.hpp"

// Segment texts joined by single spaces.
std::string JoinSegments(const std::vector<TranscriptSegment>& segments);

// mm:ss.mmm
std::string FormatTimestamp(int64_t ms);

void PrintTranscript(std::ostream& out, const std::vector<TranscriptSegment>& segments, bool withTimestamps);
