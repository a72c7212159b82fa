#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "Config/AppConfig.hpp"

class ModelException : public std::runtime_error {
public:
    explicit ModelException(const std::string& message) : std::runtime_error(message) {}
};

// Identity of a model file as published upstream (LFS object id + byte size).
struct ModelRevision {
    std::string oid;
    uint64_t size = 0;

    bool operator==(const ModelRevision& other) const { return oid == other.oid && size == other.size; }
    bool operator!=(const ModelRevision& other) const { return !(*this == other); }
};

std::string ModelFileName(ModelSize size);
std::string ModelDownloadUrl(ModelSize size);

// Picks `fileName` out of a Hugging Face tree listing. Throws ModelException
// on malformed JSON.
std::optional<ModelRevision> ParseRemoteRevision(const std::string& treeJson, const std::string& fileName);

std::string SerializeRevision(const ModelRevision& revision);
std::optional<ModelRevision> ParseLocalRevision(const std::string& sidecarJson);

// Transfer progress of one download. Update() returns false once the
// interrupt flag is raised, which makes libcurl abort the transfer.
class DownloadProgress {
public:
    explicit DownloadProgress(const std::atomic<bool>* interrupt = nullptr) : _interrupt(interrupt) {}

    bool Update(uint64_t total, uint64_t now);
    int LastPercent() const { return _last_percent; }

private:
    const std::atomic<bool>* _interrupt;
    int _last_percent = 0;
};

class ModelManager {
public:
    ModelManager(std::string modelsDir, std::ostream& out);

    // Raised flag aborts a running download or listing query with ModelException.
    void SetInterruptFlag(const std::atomic<bool>* flag) { _interrupt = flag; }

    // Returns the path of a usable model file, downloading it if missing or,
    // with checkForUpdate, if the upstream revision changed.
    std::string EnsureModel(ModelSize size, bool checkForUpdate);

    std::string ModelPath(ModelSize size) const;

private:
    std::string SidecarPath(ModelSize size) const;
    std::optional<ModelRevision> ReadLocalRevision(ModelSize size) const;
    ModelRevision FetchRemoteRevision(ModelSize size) const;
    void Download(ModelSize size, const std::optional<ModelRevision>& revision);
    bool Interrupted() const { return _interrupt && _interrupt->load(); }

    std::string _models_dir;
    std::ostream& _out;
    const std::atomic<bool>* _interrupt;
};
