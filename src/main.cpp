#include "App/AsrApplication.hpp"
#include "AudioInput/RtAudioInput.hpp"
#include "ModelManager/ModelManager.hpp"
#include "Transcriber/WhisperEngine.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void HandleSigint(int) {
    g_interrupted = true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, HandleSigint);

    AsrApplication::Factories factories;
    factories.makeInput = [](const AppConfig&) {
        return std::make_shared<RtAudioInput>();
    };
    factories.makeEngine = [](const AppConfig& config, std::ostream& out) -> std::unique_ptr<ITranscriptionEngine> {
        ModelManager models(config.modelsDir, out);
        models.SetInterruptFlag(&g_interrupted);
        const std::string modelPath = models.EnsureModel(config.model, config.downloadLatest);

        out << (config.useGpu ? "GPU inference requested (falls back to CPU if unavailable)."
                              : "Using CPU for inference.") << std::endl;

        WhisperOptions options;
        options.language = config.language;
        options.threads = config.threads;
        options.useGpu = config.useGpu;
        options.vadModelPath = config.vadModelPath;
        options.interrupt = &g_interrupted;
        return std::make_unique<WhisperEngine>(modelPath, options);
    };
    factories.listDevices = [](std::ostream& out) {
        RtAudioInput::ListDevices(out);
    };

    std::vector<std::string> args(argv, argv + argc);
    return RunAsrCli(args, std::move(factories), std::cout, std::cerr, &g_interrupted);
}
