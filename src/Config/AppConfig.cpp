#include "AppConfig.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

namespace {

int ParseInt(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ArgumentException(flag + " expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ArgumentException(flag + " expects an integer, got '" + value + "'");
    }
    return result;
}

int DefaultThreadCount() {
    const unsigned int hw = std::thread::hardware_concurrency();
    return static_cast<int>(std::max(1u, std::min(4u, hw)));
}

} // namespace

const std::vector<unsigned int>& SupportedSampleRates() {
    static const std::vector<unsigned int> rates = {8000, 16000, 22050, 32000, 44100, 48000};
    return rates;
}

std::string ModelSizeName(ModelSize size) {
    switch (size) {
        case ModelSize::Tiny: return "tiny";
        case ModelSize::Base: return "base";
        case ModelSize::Small: return "small";
        case ModelSize::Medium: return "medium";
        case ModelSize::Large: return "large";
    }
    return "base";
}

std::optional<ModelSize> ParseModelSize(const std::string& name) {
    if (name == "tiny") return ModelSize::Tiny;
    if (name == "base") return ModelSize::Base;
    if (name == "small") return ModelSize::Small;
    if (name == "medium") return ModelSize::Medium;
    if (name == "large") return ModelSize::Large;
    return std::nullopt;
}

AppConfig ParseArguments(const std::vector<std::string>& args) {
    AppConfig config;
    config.threads = DefaultThreadCount();

    // args[0] is the program name
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto nextValue = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw ArgumentException(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else if (arg == "--duration") {
            config.duration = ParseInt(arg, nextValue());
            if (config.duration <= 0) {
                throw ArgumentException("Duration must be a positive integer");
            }
        } else if (arg == "--model") {
            const std::string& name = nextValue();
            auto size = ParseModelSize(name);
            if (!size) {
                throw ArgumentException("Unsupported model '" + name +
                                        "' (choose from tiny, base, small, medium, large)");
            }
            config.model = *size;
        } else if (arg == "--sample-rate") {
            const int rate = ParseInt(arg, nextValue());
            const auto& rates = SupportedSampleRates();
            if (rate <= 0 || std::find(rates.begin(), rates.end(), static_cast<unsigned int>(rate)) == rates.end()) {
                throw ArgumentException("Unsupported sample rate " + std::to_string(rate));
            }
            config.sampleRate = static_cast<unsigned int>(rate);
        } else if (arg == "--download-latest") {
            config.downloadLatest = true;
        } else if (arg == "--output-dir") {
            config.outputDir = nextValue();
        } else if (arg == "--models-dir") {
            config.modelsDir = nextValue();
        } else if (arg == "--language") {
            config.language = nextValue();
        } else if (arg == "--threads") {
            config.threads = ParseInt(arg, nextValue());
            if (config.threads <= 0) {
                throw ArgumentException("--threads must be positive");
            }
        } else if (arg == "--no-gpu") {
            config.useGpu = false;
        } else if (arg == "--vad-model") {
            config.vadModelPath = nextValue();
        } else if (arg == "--timestamps") {
            config.printTimestamps = true;
        } else if (arg == "--list-devices") {
            config.listDevices = true;
        } else {
            throw ArgumentException("Unknown argument: " + arg);
        }
    }

    return config;
}

std::string Usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --duration N        recording length in seconds (default: 60)\n"
        << "  --model NAME        tiny | base | small | medium | large (default: base)\n"
        << "  --sample-rate N     8000 | 16000 | 22050 | 32000 | 44100 | 48000 (default: 16000)\n"
        << "  --download-latest   check for and download the latest model\n"
        << "  --output-dir DIR    where recordings are saved (default: recordings)\n"
        << "  --models-dir DIR    where models are stored (default: models)\n"
        << "  --language LANG     spoken language or 'auto' (default: auto)\n"
        << "  --threads N         inference threads\n"
        << "  --no-gpu            run inference on the CPU only\n"
        << "  --vad-model PATH    Silero VAD model, enables silence filtering\n"
        << "  --timestamps        print one line per segment with timestamps\n"
        << "  --list-devices      list capture devices and exit\n"
        << "  -h, --help          show this help\n";
    return out.str();
}
