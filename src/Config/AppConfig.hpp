#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class ModelSize {
    Tiny,
    Base,
    Small,
    Medium,
    Large
};

class ArgumentException : public std::runtime_error {
public:
    explicit ArgumentException(const std::string& message) : std::runtime_error(message) {}
};

struct AppConfig {
    int duration = 60;                  // seconds
    ModelSize model = ModelSize::Base;
    unsigned int sampleRate = 16000;
    bool downloadLatest = false;

    std::string outputDir = "recordings";
    std::string modelsDir = "models";
    std::string language = "auto";
    int threads = 4;
    bool useGpu = true;
    std::string vadModelPath;           // empty = VAD filter off
    bool printTimestamps = false;

    bool listDevices = false;
    bool showHelp = false;
};

const std::vector<unsigned int>& SupportedSampleRates();

std::string ModelSizeName(ModelSize size);
std::optional<ModelSize> ParseModelSize(const std::string& name);

// Throws ArgumentException on any invalid input. Never touches audio or models.
AppConfig ParseArguments(const std::vector<std::string>& args);

std::string Usage(const std::string& program);
