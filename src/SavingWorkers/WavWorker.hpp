#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ISavingWorker.hpp"

// 16-bit PCM mono WAV through libsndfile.
class WavWorker : public ISavingWorker {
public:
    explicit WavWorker(std::string filename) : _filename(std::move(filename)) {}

    bool Save() override;
    std::string GetFilename() const override { return _filename; }

private:
    std::string _filename;
};

struct WavData {
    std::vector<int16_t> samples;
    unsigned int sampleRate = 0;
    int channels = 0;
};

// Throws SavingWorkerException if the file cannot be opened or read.
WavData LoadWav(const std::string& filename);
