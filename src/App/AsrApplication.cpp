#include "AsrApplication.hpp"
#include "AudioRecorder/AudioRecorder.hpp"
#include "AudioRecorder/SampleConverter.hpp"
#include "SavingWorkers/RecordingNaming.hpp"
#include "SavingWorkers/WavWorker.hpp"
#include "Transcriber/TranscriptPrinter.hpp"
#include "common/debug_log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

AsrApplication::AsrApplication(AppConfig config, Factories factories, std::ostream& out, std::ostream& err)
    : _config(std::move(config))
    , _factories(std::move(factories))
    , _out(out)
    , _err(err)
    , _interrupt(nullptr) {}

int AsrApplication::Fail(const std::string& stage, const std::string& message) {
    _err << "Error " << stage << ": " << message << std::endl;
    if (!_recording_path.empty()) {
        _err << "Recorded audio preserved at: " << _recording_path << std::endl;
    }
    return 1;
}

bool AsrApplication::Interrupted() const {
    return _interrupt && _interrupt->load();
}

int AsrApplication::ExitInterrupted() {
    _out << "\nProcess interrupted by user. Exiting." << std::endl;
    return 0;
}

int AsrApplication::Run() {
    _recording_path.clear();

    if (_config.listDevices) {
        if (_factories.listDevices) {
            _factories.listDevices(_out);
        }
        return 0;
    }

    try {
        EnsureOutputDirectory(_config.outputDir);
    } catch (const std::exception& e) {
        return Fail("preparing output directory", e.what());
    }

    std::unique_ptr<ITranscriptionEngine> engine;
    try {
        _out << "Loading " << ModelSizeName(_config.model) << " model..." << std::endl;
        engine = _factories.makeEngine(_config, _out);
    } catch (const std::exception& e) {
        if (Interrupted()) {
            return ExitInterrupted();
        }
        return Fail("loading Whisper model", e.what());
    }
    if (Interrupted()) {
        return ExitInterrupted();
    }
    _out << "Model loaded successfully." << std::endl;

    const std::string path = MakeRecordingPath(_config.outputDir, std::time(nullptr));
    auto worker = std::make_shared<WavWorker>(path);

    std::vector<float> recorded;
    try {
        AudioRecorder recorder(_factories.makeInput(_config), worker);
        recorder.SetInterruptFlag(_interrupt);
        recorder.SetOnProgressCallback([this](int remaining) {
            _out << "\rRecording: " << remaining << " seconds remaining..." << std::flush;
        });

        _out << "Recording audio for " << _config.duration << " seconds..." << std::endl;
        _out << "Speak now..." << std::endl;

        if (!recorder.Record(_config.duration, _config.sampleRate)) {
            return ExitInterrupted();
        }
        _out << "\nRecording complete." << std::endl;
        recorded = recorder.GetAudioData();
    } catch (const std::exception& e) {
        return Fail("recording audio", e.what());
    }

    try {
        if (!worker->Save()) {
            const std::string& reason = worker->GetLastError();
            return Fail("saving audio file", reason.empty() ? "could not write " + path : reason);
        }
    } catch (const std::exception& e) {
        return Fail("saving audio file", e.what());
    }
    _recording_path = path;
    _out << "Audio saved to: " << path << std::endl;

    std::vector<TranscriptSegment> segments;
    try {
        _out << "Transcribing audio..." << std::endl;
        const auto start = std::chrono::steady_clock::now();

        std::vector<float> pcm16k = sample_converter::Resample(recorded.data(), recorded.size(),
                                                               _config.sampleRate,
                                                               ITranscriptionEngine::kSampleRate);
        DEBUG_LOG("Resampled " << recorded.size() << " -> " << pcm16k.size() << " samples" << DEBUG_LOG_ENDL);
        segments = engine->Transcribe(pcm16k);

        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        _out << "Transcription completed in " << std::fixed << std::setprecision(2) << elapsed.count()
             << " seconds." << std::endl;
        _out.unsetf(std::ios::floatfield);
    } catch (const std::exception& e) {
        if (Interrupted()) {
            return ExitInterrupted();
        }
        return Fail("transcribing audio", e.what());
    }
    // An aborted decode can return partial segments.
    if (Interrupted()) {
        return ExitInterrupted();
    }

    PrintTranscript(_out, segments, _config.printTimestamps);
    return 0;
}

int RunAsrCli(const std::vector<std::string>& args, AsrApplication::Factories factories,
              std::ostream& out, std::ostream& err, const std::atomic<bool>* interrupt) {
    const std::string program = args.empty() ? "local_asr" : args.front();

    AppConfig config;
    try {
        config = ParseArguments(args);
    } catch (const ArgumentException& e) {
        err << "Error: " << e.what() << "\n\n" << Usage(program);
        return 1;
    }

    if (config.showHelp) {
        out << Usage(program);
        return 0;
    }

    AsrApplication app(std::move(config), std::move(factories), out, err);
    app.SetInterruptFlag(interrupt);
    return app.Run();
}
