#include "RecordingNaming.hpp"
#include "ISavingWorker.hpp"

#include <filesystem>
#include <iomanip>
#include <regex>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const char* kPrefix = "recording_";
const char* kExtension = ".wav";

std::tm ToLocalTime(std::time_t when) {
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &when);
#else
    localtime_r(&when, &local);
#endif
    return local;
}

} // namespace

std::string MakeRecordingPath(const std::string& directory, std::time_t when) {
    const std::tm local = ToLocalTime(when);

    std::ostringstream stem;
    stem << kPrefix << std::put_time(&local, "%Y%m%d_%H%M%S");

    fs::path candidate = fs::path(directory) / (stem.str() + kExtension);
    for (int suffix = 1; fs::exists(candidate); ++suffix) {
        candidate = fs::path(directory) / (stem.str() + "_" + std::to_string(suffix) + kExtension);
    }
    return candidate.string();
}

std::optional<std::tm> ParseRecordingTimestamp(const std::string& path) {
    static const std::regex pattern(R"(^recording_(\d{8}_\d{6})(_\d+)?\.wav$)");

    const std::string filename = fs::path(path).filename().string();
    std::smatch match;
    if (!std::regex_match(filename, match, pattern)) {
        return std::nullopt;
    }

    std::tm parsed{};
    std::istringstream in(match[1].str());
    in >> std::get_time(&parsed, "%Y%m%d_%H%M%S");
    if (in.fail()) {
        return std::nullopt;
    }

    // Round-trip through mktime to reject dates like 20240231.
    std::tm normalized = parsed;
    normalized.tm_isdst = -1;
    if (std::mktime(&normalized) == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    if (normalized.tm_year != parsed.tm_year || normalized.tm_mon != parsed.tm_mon ||
        normalized.tm_mday != parsed.tm_mday) {
        return std::nullopt;
    }
    // The name holds wall-clock fields; keep them even inside a DST gap.
    parsed.tm_wday = normalized.tm_wday;
    parsed.tm_yday = normalized.tm_yday;
    parsed.tm_isdst = -1;
    return parsed;
}

void EnsureOutputDirectory(const std::string& directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw SavingWorkerException("Could not create directory " + directory + ": " + ec.message());
    }
}
