#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "RecordData.hpp"
#include "AudioInput/IAudioInput.hpp"
#include "SavingWorkers/ISavingWorker.hpp"

class AudioRecorder {
public:
    AudioRecorder(std::shared_ptr<IAudioInput> input, std::shared_ptr<ISavingWorker> saving_worker);
    ~AudioRecorder();

    // Blocks until `seconds` of audio are captured. Returns false if the
    // interrupt flag was raised first. Throws AudioInputException if the
    // device cannot be opened or started.
    bool Record(int seconds, unsigned int sampleRate);
    bool SaveData();

    const std::vector<float>& GetAudioData() const { return _record_data.audioData; }
    unsigned int GetSampleRate() const { return _record_data.sampleRate; }

    // Called with the whole seconds still to record, once per change.
    void SetOnProgressCallback(std::function<void(int)> cb) { _on_progress = std::move(cb); }

    // Flag is owned by the caller; typically raised from a signal handler.
    void SetInterruptFlag(const std::atomic<bool>* flag) { _interrupt = flag; }

private:
    void OnBuffer(const float* samples, size_t frames);
    bool Interrupted() const { return _interrupt && _interrupt->load(); }

    RecordData _record_data;
    std::shared_ptr<IAudioInput> _input;
    std::shared_ptr<ISavingWorker> _saving_worker;
    std::function<void(int)> _on_progress;
    const std::atomic<bool>* _interrupt;
    unsigned int _buffer_frames;
};
