#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "ITranscriptionEngine.hpp"

struct whisper_context;

struct WhisperContextDeleter {
    void operator()(whisper_context* ctx) const noexcept;
};

struct WhisperOptions {
    std::string language = "auto";
    int threads = 4;
    bool useGpu = true;
    int beamSize = 5;
    std::string vadModelPath;           // empty disables the VAD filter
    int minSilenceDurationMs = 500;
    const std::atomic<bool>* interrupt = nullptr;  // raised flag aborts decoding
};

class WhisperEngine : public ITranscriptionEngine {
public:
    // Throws TranscriptionException if the model cannot be loaded or the
    // language is unknown.
    WhisperEngine(const std::string& modelPath, WhisperOptions options);
    ~WhisperEngine() override;

    std::vector<TranscriptSegment> Transcribe(const std::vector<float>& pcm16k) override;

private:
    std::unique_ptr<whisper_context, WhisperContextDeleter> _ctx;
    WhisperOptions _options;
};
