#pragma once

#include <RtAudio.h>

#include <memory>
#include <mutex>
#include <ostream>

#include "IAudioInput.hpp"

class RtAudioInput : public IAudioInput {
public:
    RtAudioInput();
    ~RtAudioInput() override;

    void Open(unsigned int sampleRate, unsigned int bufferFrames) override;
    void Start(BufferCallback callback) override;
    void Stop() override;
    void Close() override;
    bool IsOpen() const override { return _audio.isStreamOpen(); }
    unsigned int GetBufferFrames() const override { return _buffer_frames; }
    unsigned int GetSampleRate() const override { return _sample_rate; }

    static void ListDevices(std::ostream& out);

private:
    static int Capture(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                       double streamTime, RtAudioStreamStatus status, void* userData);

    unsigned int FindInputDevice();

    RtAudio _audio;
    RtAudio::StreamParameters _parameters;
    BufferCallback _callback;
    std::mutex _callback_mutex;
    unsigned int _buffer_frames;
    unsigned int _sample_rate;
};
