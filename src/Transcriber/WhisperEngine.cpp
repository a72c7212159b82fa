#include "WhisperEngine.hpp"
#include "common/debug_log.hpp"

#include <whisper.h>

#include <cstdio>
#include <cstdlib>

namespace {

bool IsVerbose() {
    return std::getenv("ASR_WHISPER_DEBUG") != nullptr;
}

bool AbortRequested(void* userData) {
    return static_cast<const std::atomic<bool>*>(userData)->load();
}

// Keep errors and warnings; info/debug only when ASR_WHISPER_DEBUG is set.
void FilterWhisperLog(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    default:
        if (IsVerbose()) std::fputs(text, stderr);
        break;
    }
}

std::string Trim(const std::string& text) {
    const size_t a = text.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) {
        return {};
    }
    const size_t b = text.find_last_not_of(" \t\r\n");
    return text.substr(a, b - a + 1);
}

} // namespace

void WhisperContextDeleter::operator()(whisper_context* ctx) const noexcept {
    if (ctx) {
        whisper_free(ctx);
    }
}

WhisperEngine::WhisperEngine(const std::string& modelPath, WhisperOptions options)
    : _options(std::move(options)) {
    if (_options.language != "auto" && whisper_lang_id(_options.language.c_str()) == -1) {
        throw TranscriptionException("Unknown language '" + _options.language + "'");
    }

    whisper_log_set(FilterWhisperLog, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = _options.useGpu;

    _ctx.reset(whisper_init_from_file_with_params(modelPath.c_str(), cparams));
    if (!_ctx) {
        throw TranscriptionException("Failed to load Whisper model from " + modelPath);
    }

    DEBUG_LOG("whisper system info: " << whisper_print_system_info() << DEBUG_LOG_ENDL);
}

WhisperEngine::~WhisperEngine() = default;

std::vector<TranscriptSegment> WhisperEngine::Transcribe(const std::vector<float>& pcm16k) {
    if (pcm16k.empty()) {
        return {};
    }

    const whisper_sampling_strategy strategy =
        _options.beamSize > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY;
    whisper_full_params wparams = whisper_full_default_params(strategy);
    wparams.print_progress   = false;
    wparams.print_realtime   = false;
    wparams.print_special    = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.token_timestamps = true;
    wparams.language         = _options.language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = _options.threads;
    if (strategy == WHISPER_SAMPLING_BEAM_SEARCH) {
        wparams.beam_search.beam_size = _options.beamSize;
    }

    if (!_options.vadModelPath.empty()) {
        wparams.vad = true;
        wparams.vad_model_path = _options.vadModelPath.c_str();
        wparams.vad_params = whisper_vad_default_params();
        wparams.vad_params.min_silence_duration_ms = _options.minSilenceDurationMs;
    }

    if (_options.interrupt) {
        wparams.abort_callback = &AbortRequested;
        wparams.abort_callback_user_data = const_cast<std::atomic<bool>*>(_options.interrupt);
    }

    DEBUG_LOG("running whisper on " << pcm16k.size() << " samples, threads=" << wparams.n_threads << DEBUG_LOG_ENDL);

    const int ret = whisper_full(_ctx.get(), wparams, pcm16k.data(), static_cast<int>(pcm16k.size()));
    if (_options.interrupt && _options.interrupt->load()) {
        throw TranscriptionException("Transcription interrupted");
    }
    if (ret != 0) {
        throw TranscriptionException("whisper_full failed with code " + std::to_string(ret));
    }

    std::vector<TranscriptSegment> segments;
    const int n = whisper_full_n_segments(_ctx.get());
    segments.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        const char* text = whisper_full_get_segment_text(_ctx.get(), i);
        if (!text) {
            continue;
        }
        TranscriptSegment segment;
        segment.text = Trim(text);
        // whisper reports times in 10 ms ticks
        segment.startMs = whisper_full_get_segment_t0(_ctx.get(), i) * 10;
        segment.endMs = whisper_full_get_segment_t1(_ctx.get(), i) * 10;
        if (!segment.text.empty()) {
            segments.push_back(std::move(segment));
        }
    }

    if (IsVerbose()) {
        whisper_print_timings(_ctx.get());
    }
    return segments;
}
