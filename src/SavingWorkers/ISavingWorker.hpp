#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class SavingWorkerException : public std::runtime_error {
public:
    explicit SavingWorkerException(const std::string& message) : std::runtime_error(message) {}
};

class ISavingWorker {
public:
    virtual ~ISavingWorker() = default;

    void SetSampleRate(unsigned int sampleRate) {
        _sampleRate = sampleRate;
        _setter_called = true;
    }
    void SetAudioData(std::vector<int16_t> audioData) { _audioData = std::move(audioData); }

    const std::vector<int16_t>& GetAudioData() const { return _audioData; }
    unsigned int GetSampleRate() const { return _sampleRate; }

    // Returns false on an ordinary I/O failure; throws SavingWorkerException
    // when the worker was never given a sample rate.
    virtual bool Save() = 0;

    virtual std::string GetFilename() const { return {}; }

    // Reason for the last Save() that returned false.
    const std::string& GetLastError() const { return _last_error; }

protected:
    std::string _last_error;
    std::vector<int16_t> _audioData;
    unsigned int _sampleRate = 0;
    bool _setter_called = false;
};
