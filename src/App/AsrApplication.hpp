#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "Config/AppConfig.hpp"
#include "AudioInput/IAudioInput.hpp"
#include "Transcriber/ITranscriptionEngine.hpp"

class AsrApplication {
public:
    struct Factories {
        std::function<std::shared_ptr<IAudioInput>(const AppConfig&)> makeInput;
        // Resolves/downloads the model and loads the engine.
        std::function<std::unique_ptr<ITranscriptionEngine>(const AppConfig&, std::ostream&)> makeEngine;
        std::function<void(std::ostream&)> listDevices;
    };

    AsrApplication(AppConfig config, Factories factories, std::ostream& out, std::ostream& err);

    void SetInterruptFlag(const std::atomic<bool>* flag) { _interrupt = flag; }

    // Exit status: 0 on success or user interrupt, 1 on any stage failure.
    int Run();

    // Path of the WAV written by the last Run(), empty if none.
    const std::string& GetRecordingPath() const { return _recording_path; }

private:
    bool Interrupted() const;
    int ExitInterrupted();
    int Fail(const std::string& stage, const std::string& message);

    AppConfig _config;
    Factories _factories;
    std::ostream& _out;
    std::ostream& _err;
    const std::atomic<bool>* _interrupt;
    std::string _recording_path;
};

// Parses `args` (args[0] = program name) and runs the pipeline.
int RunAsrCli(const std::vector<std::string>& args, AsrApplication::Factories factories,
              std::ostream& out, std::ostream& err, const std::atomic<bool>* interrupt = nullptr);
