#pragma once

#include <ctime>
#include <optional>
#include <string>

// recording_<YYYYmmdd>_<HHMMSS>[_N].wav inside `directory`. A numeric suffix
// is appended when the plain name is already taken.
std::string MakeRecordingPath(const std::string& directory, std::time_t when);

// Local date-time encoded in a recording file name, if it is one.
std::optional<std::tm> ParseRecordingTimestamp(const std::string& path);

// Creates the directory (and parents). Throws SavingWorkerException on failure.
void EnsureOutputDirectory(const std::string& directory);
