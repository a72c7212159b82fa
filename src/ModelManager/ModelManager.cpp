#include "ModelManager.hpp"
#include "common/debug_log.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const char* kRepoBase = "https://huggingface.co/ggerganov/whisper.cpp";
const char* kTreeUrl = "https://huggingface.co/api/models/ggerganov/whisper.cpp/tree/main";

struct CurlDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct FileDeleter {
    void operator()(std::FILE* file) const noexcept { std::fclose(file); }
};

class CurlGlobal {
public:
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void EnsureCurl() {
    static CurlGlobal global;
}

CurlHandle MakeHandle(const std::string& url) {
    EnsureCurl();
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw ModelException("Failed to initialize CURL");
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "local-asr/1.0");
    return curl;
}

size_t AppendToString(char* data, size_t size, size_t nmemb, void* userData) {
    static_cast<std::string*>(userData)->append(data, size * nmemb);
    return size * nmemb;
}

size_t WriteToFile(char* data, size_t size, size_t nmemb, void* userData) {
    return std::fwrite(data, size, nmemb, static_cast<std::FILE*>(userData)) * size;
}

int ReportProgress(void* userData, curl_off_t total, curl_off_t now, curl_off_t, curl_off_t) {
    auto* progress = static_cast<DownloadProgress*>(userData);
    const bool keepGoing = progress->Update(total > 0 ? static_cast<uint64_t>(total) : 0,
                                            now > 0 ? static_cast<uint64_t>(now) : 0);
    return keepGoing ? 0 : 1;
}

void WatchTransfer(CURL* curl, DownloadProgress* progress) {
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &ReportProgress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, progress);
}

} // namespace

bool DownloadProgress::Update(uint64_t total, uint64_t now) {
    if (_interrupt && _interrupt->load()) {
        return false;
    }
    if (total == 0) {
        return true;
    }
    const int percent = static_cast<int>(now * 100 / total);
    if (percent / 10 != _last_percent / 10) {
        _last_percent = percent;
        DEBUG_LOG("download " << percent << "%" << DEBUG_LOG_ENDL);
    }
    return true;
}

std::string ModelFileName(ModelSize size) {
    if (size == ModelSize::Large) {
        return "ggml-large-v3.bin";
    }
    return "ggml-" + ModelSizeName(size) + ".bin";
}

std::string ModelDownloadUrl(ModelSize size) {
    return std::string(kRepoBase) + "/resolve/main/" + ModelFileName(size);
}

std::optional<ModelRevision> ParseRemoteRevision(const std::string& treeJson, const std::string& fileName) {
    json tree = json::parse(treeJson, nullptr, false);
    if (tree.is_discarded() || !tree.is_array()) {
        throw ModelException("Unexpected model listing format");
    }

    for (const auto& entry : tree) {
        if (!entry.is_object() || entry.value("path", "") != fileName) {
            continue;
        }
        ModelRevision revision;
        // LFS files carry the content hash in "lfs.oid"; "oid" is the git blob id.
        if (entry.contains("lfs") && entry["lfs"].is_object()) {
            revision.oid = entry["lfs"].value("oid", "");
            revision.size = entry["lfs"].value("size", uint64_t{0});
        } else {
            revision.oid = entry.value("oid", "");
            revision.size = entry.value("size", uint64_t{0});
        }
        if (revision.oid.empty()) {
            return std::nullopt;
        }
        return revision;
    }
    return std::nullopt;
}

std::string SerializeRevision(const ModelRevision& revision) {
    json sidecar = {{"oid", revision.oid}, {"size", revision.size}};
    return sidecar.dump(2);
}

std::optional<ModelRevision> ParseLocalRevision(const std::string& sidecarJson) {
    json sidecar = json::parse(sidecarJson, nullptr, false);
    if (sidecar.is_discarded() || !sidecar.is_object() || !sidecar.contains("oid")) {
        return std::nullopt;
    }
    ModelRevision revision;
    revision.oid = sidecar.value("oid", "");
    revision.size = sidecar.value("size", uint64_t{0});
    return revision;
}

ModelManager::ModelManager(std::string modelsDir, std::ostream& out)
    : _models_dir(std::move(modelsDir)), _out(out), _interrupt(nullptr) {}

std::string ModelManager::ModelPath(ModelSize size) const {
    return (fs::path(_models_dir) / ModelFileName(size)).string();
}

std::string ModelManager::SidecarPath(ModelSize size) const {
    return ModelPath(size) + ".json";
}

std::optional<ModelRevision> ModelManager::ReadLocalRevision(ModelSize size) const {
    std::ifstream in(SidecarPath(size));
    if (!in) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return ParseLocalRevision(buffer.str());
}

ModelRevision ModelManager::FetchRemoteRevision(ModelSize size) const {
    CurlHandle curl = MakeHandle(kTreeUrl);
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &AppendToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 30L);
    DownloadProgress progress(_interrupt);
    WatchTransfer(curl.get(), &progress);

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw ModelException("Model listing query interrupted");
    }
    if (res != CURLE_OK) {
        throw ModelException(std::string("Could not query model listing: ") + curl_easy_strerror(res));
    }

    auto revision = ParseRemoteRevision(body, ModelFileName(size));
    if (!revision) {
        throw ModelException("Model " + ModelFileName(size) + " is not published upstream");
    }
    return *revision;
}

void ModelManager::Download(ModelSize size, const std::optional<ModelRevision>& revision) {
    std::error_code ec;
    fs::create_directories(_models_dir, ec);
    if (ec) {
        throw ModelException("Could not create " + _models_dir + ": " + ec.message());
    }

    const std::string target = ModelPath(size);
    const std::string partial = target + ".part";
    const std::string url = ModelDownloadUrl(size);

    _out << "Downloading " << ModelFileName(size) << " from " << url << "..." << std::endl;

    {
        std::unique_ptr<std::FILE, FileDeleter> file(std::fopen(partial.c_str(), "wb"));
        if (!file) {
            throw ModelException("Could not write " + partial);
        }

        DownloadProgress progress(_interrupt);
        CurlHandle curl = MakeHandle(url);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &WriteToFile);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file.get());
        WatchTransfer(curl.get(), &progress);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            file.reset();
            fs::remove(partial, ec);
            if (res == CURLE_ABORTED_BY_CALLBACK) {
                throw ModelException("Download of " + ModelFileName(size) + " interrupted");
            }
            throw ModelException(std::string("Download failed: ") + curl_easy_strerror(res));
        }
    }

    fs::rename(partial, target, ec);
    if (ec) {
        throw ModelException("Could not move model into place: " + ec.message());
    }

    if (revision) {
        std::ofstream sidecar(SidecarPath(size));
        sidecar << SerializeRevision(*revision);
        if (!sidecar) {
            throw ModelException("Could not write " + SidecarPath(size));
        }
    }
    _out << "Model saved to " << target << std::endl;
}

std::string ModelManager::EnsureModel(ModelSize size, bool checkForUpdate) {
    if (Interrupted()) {
        throw ModelException("Model preparation interrupted");
    }
    const std::string path = ModelPath(size);
    const bool present = fs::exists(path);

    if (!checkForUpdate) {
        if (!present) {
            Download(size, std::nullopt);
        }
        return path;
    }

    _out << "Checking for latest " << ModelSizeName(size) << " model and downloading if needed..." << std::endl;
    ModelRevision remote = FetchRemoteRevision(size);
    std::optional<ModelRevision> local = ReadLocalRevision(size);

    if (!present) {
        Download(size, remote);
    } else if (!local || *local != remote) {
        DEBUG_LOG("Local revision " << (local ? local->oid : std::string("<unknown>"))
                  << " differs from upstream " << remote.oid << DEBUG_LOG_ENDL);
        _out << "A newer " << ModelFileName(size) << " is available." << std::endl;
        Download(size, remote);
    }

    _out << "Latest model downloaded or already up to date." << std::endl;
    return path;
}
