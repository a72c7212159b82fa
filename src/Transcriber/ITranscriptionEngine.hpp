#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class TranscriptionException : public std::runtime_error {
public:
    explicit TranscriptionException(const std::string& message) : std::runtime_error(message) {}
};

struct TranscriptSegment {
    std::string text;
    int64_t startMs = 0;
    int64_t endMs = 0;
};

// Opaque recognizer. Input is always 16 kHz mono float in [-1, 1].
class ITranscriptionEngine {
public:
    static constexpr unsigned int kSampleRate = 16000;

    virtual ~ITranscriptionEngine() = default;

    // Throws TranscriptionException on failure.
    virtual std::vector<TranscriptSegment> Transcribe(const std::vector<float>& pcm16k) = 0;
};
