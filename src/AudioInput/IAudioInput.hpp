#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

class AudioInputException : public std::runtime_error {
public:
    explicit AudioInputException(const std::string& message) : std::runtime_error(message) {}
};

// Capture backend. The callback is invoked from the backend's own thread
// with mono float samples in [-1, 1].
class IAudioInput {
public:
    using BufferCallback = std::function<void(const float* samples, size_t frames)>;

    virtual ~IAudioInput() = default;

    // Opens at `sampleRate` or, when the device refuses it, at a rate it
    // supports; GetSampleRate() reports the one granted. Throws
    // AudioInputException if no usable input device exists.
    virtual void Open(unsigned int sampleRate, unsigned int bufferFrames) = 0;
    virtual void Start(BufferCallback callback) = 0;
    virtual void Stop() = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    // Frames per callback actually granted by the backend.
    virtual unsigned int GetBufferFrames() const = 0;
    virtual unsigned int GetSampleRate() const = 0;
};
