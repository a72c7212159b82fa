#include "AudioRecorder.hpp"
#include "SampleConverter.hpp"
#include "common/debug_log.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

AudioRecorder::AudioRecorder(std::shared_ptr<IAudioInput> input, std::shared_ptr<ISavingWorker> saving_worker)
    : _input(std::move(input))
    , _saving_worker(std::move(saving_worker))
    , _interrupt(nullptr)
    , _buffer_frames(512) {
    if (!_input) {
        throw std::invalid_argument("AudioRecorder requires an audio input");
    }
}

AudioRecorder::~AudioRecorder() {
    if (_input->IsOpen()) {
        _input->Close();
    }
}

void AudioRecorder::OnBuffer(const float* samples, size_t frames) {
    {
        std::lock_guard<std::mutex> lock(_record_data.mutex);
        if (!_record_data.isRecording) {
            return;
        }
        const size_t remaining = _record_data.targetFrames - _record_data.audioData.size();
        const size_t take = std::min(frames, remaining);
        _record_data.audioData.insert(_record_data.audioData.end(), samples, samples + take);
        if (_record_data.audioData.size() >= _record_data.targetFrames) {
            _record_data.isRecording = false;
        }
    }
    _record_data.filled.notify_one();
}

bool AudioRecorder::Record(int seconds, unsigned int sampleRate) {
    if (seconds <= 0) {
        throw std::invalid_argument("Duration must be a positive integer");
    }
    if (sampleRate == 0) {
        throw std::invalid_argument("Sample rate must be positive");
    }

    _input->Open(sampleRate, _buffer_frames);
    const unsigned int captureRate = _input->GetSampleRate() ? _input->GetSampleRate() : sampleRate;
    DEBUG_LOG("Buffer frames granted: " << _input->GetBufferFrames()
              << ", capture rate: " << captureRate << DEBUG_LOG_ENDL);

    {
        std::lock_guard<std::mutex> lock(_record_data.mutex);
        _record_data.audioData.clear();
        _record_data.sampleRate = sampleRate;
        _record_data.captureRate = captureRate;
        _record_data.targetFrames = static_cast<size_t>(seconds) * captureRate;
        _record_data.audioData.reserve(_record_data.targetFrames);
        _record_data.isRecording = true;
    }

    try {
        _input->Start([this](const float* samples, size_t frames) { OnBuffer(samples, frames); });
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(_record_data.mutex);
            _record_data.isRecording = false;
        }
        _input->Close();
        throw;
    }

    DEBUG_LOG("=== Starting recording ===" << DEBUG_LOG_ENDL);

    bool completed = false;
    int lastReported = -1;
    {
        std::unique_lock<std::mutex> lock(_record_data.mutex);
        while (true) {
            if (!_record_data.isRecording) {
                completed = true;
                break;
            }
            if (Interrupted()) {
                _record_data.isRecording = false;
                break;
            }

            const size_t missing = _record_data.targetFrames - _record_data.audioData.size();
            const int remaining = static_cast<int>((missing + captureRate - 1) / captureRate);
            if (remaining != lastReported && _on_progress) {
                lastReported = remaining;
                lock.unlock();
                _on_progress(remaining);
                lock.lock();
                continue;
            }

            _record_data.filled.wait_for(lock, std::chrono::milliseconds(100));
        }
    }

    _input->Stop();
    _input->Close();

    DEBUG_LOG("Recording stopped. Recorded " << _record_data.audioData.size() << " samples" << DEBUG_LOG_ENDL);

    if (!completed) {
        return false;
    }

    if (captureRate != sampleRate) {
        std::vector<float> resampled = sample_converter::Resample(
            _record_data.audioData.data(), _record_data.audioData.size(), captureRate, sampleRate);
        resampled.resize(static_cast<size_t>(seconds) * sampleRate, 0.0f);
        _record_data.audioData.swap(resampled);
        DEBUG_LOG("Resampled " << captureRate << " Hz capture to " << _record_data.audioData.size()
                  << " samples at " << sampleRate << " Hz" << DEBUG_LOG_ENDL);
    }

    if (_saving_worker) {
        _saving_worker->SetSampleRate(sampleRate);
        _saving_worker->SetAudioData(sample_converter::FloatToPcm16(_record_data.audioData.data(),
                                                                    _record_data.audioData.size()));
    }
    return true;
}

bool AudioRecorder::SaveData() {
    if (!_saving_worker) {
        throw SavingWorkerException("No saving worker configured");
    }
    if (_saving_worker->Save()) {
        DEBUG_LOG("File saved successfully!" << DEBUG_LOG_ENDL);
        return true;
    }
    DEBUG_LOG("Error saving file!" << DEBUG_LOG_ENDL);
    return false;
}
