#include "App/AsrApplication.hpp"
#include "ModelManager/ModelManager.hpp"
#include "SavingWorkers/RecordingNaming.hpp"
#include "SavingWorkers/WavWorker.hpp"
#include "Transcriber/TranscriptPrinter.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <sstream>

namespace {

const std::string kRule(50, '=');

struct Harness {
    std::shared_ptr<test_utils::SyntheticAudioInput> input =
        std::make_shared<test_utils::SyntheticAudioInput>();
    std::vector<TranscriptSegment> segments;
    bool engineFails = false;
    bool engineLoadFails = false;
    bool interruptDuringLoad = false;
    bool interruptDuringTranscribe = false;
    std::atomic<bool> interrupted{false};
    int inputRequests = 0;
    int engineRequests = 0;
    size_t samplesSeenByEngine = 0;

    AsrApplication::Factories Factories() {
        AsrApplication::Factories factories;
        factories.makeInput = [this](const AppConfig&) {
            ++inputRequests;
            return input;
        };
        factories.makeEngine = [this](const AppConfig&, std::ostream&) -> std::unique_ptr<ITranscriptionEngine> {
            ++engineRequests;
            if (interruptDuringLoad) {
                interrupted = true;
                throw ModelException("Download of ggml-base.bin interrupted");
            }
            if (engineLoadFails) {
                throw TranscriptionException("model file is corrupt");
            }
            return std::make_unique<RecordingStub>(*this, segments, engineFails);
        };
        factories.listDevices = [](std::ostream& out) { out << "- ID 0: Synthetic" << std::endl; };
        return factories;
    }

    class RecordingStub : public test_utils::StubTranscriptionEngine {
    public:
        RecordingStub(Harness& owner, std::vector<TranscriptSegment> segments, bool fail)
            : StubTranscriptionEngine(std::move(segments), fail), _owner(owner) {}
        std::vector<TranscriptSegment> Transcribe(const std::vector<float>& pcm16k) override {
            _owner.samplesSeenByEngine = pcm16k.size();
            if (_owner.interruptDuringTranscribe) {
                _owner.interrupted = true;
            }
            return StubTranscriptionEngine::Transcribe(pcm16k);
        }

    private:
        Harness& _owner;
    };
};

std::vector<std::string> Args(const test_utils::TempDir& dir, std::initializer_list<std::string> rest) {
    std::vector<std::string> args{"local_asr", "--output-dir", dir.File("recordings"), "--duration", "1"};
    args.insert(args.end(), rest.begin(), rest.end());
    return args;
}

std::vector<std::filesystem::path> Recordings(const test_utils::TempDir& dir) {
    std::vector<std::filesystem::path> files;
    const auto root = std::filesystem::path(dir.File("recordings"));
    if (!std::filesystem::exists(root)) {
        return files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(root)) {
        files.push_back(entry.path());
    }
    return files;
}

} // namespace

TEST(AsrApplicationTest, PrintsStubSegmentsVerbatim) {
    test_utils::TempDir dir;
    Harness harness;
    harness.segments = {{"The quick brown fox", 0, 1200}, {"jumps over the lazy dog.", 1200, 2400}};

    std::ostringstream out, err;
    const int code = RunAsrCli(Args(dir, {}), harness.Factories(), out, err);

    ASSERT_EQ(code, 0) << err.str();
    const std::string expected = "\n" + kRule + "\nTRANSCRIPTION RESULT:\n" + kRule + "\n" +
                                 "The quick brown fox jumps over the lazy dog.\n" + kRule + "\n";
    const std::string printed = out.str();
    ASSERT_GE(printed.size(), expected.size());
    EXPECT_EQ(printed.substr(printed.size() - expected.size()), expected);
    EXPECT_TRUE(err.str().empty());
}

TEST(AsrApplicationTest, TimestampedOutputMatchesSegments) {
    test_utils::TempDir dir;
    Harness harness;
    harness.segments = {{"one", 0, 500}, {"two", 500, 990}};

    std::ostringstream out, err;
    ASSERT_EQ(RunAsrCli(Args(dir, {"--timestamps"}), harness.Factories(), out, err), 0) << err.str();

    std::ostringstream expected;
    PrintTranscript(expected, harness.segments, true);
    const std::string printed = out.str();
    EXPECT_EQ(printed.substr(printed.size() - expected.str().size()), expected.str());
}

TEST(AsrApplicationTest, SavesOneTimestampedWavPerRun) {
    test_utils::TempDir dir;
    Harness harness;
    harness.segments = {{"hi", 0, 100}};

    std::ostringstream out, err;
    ASSERT_EQ(RunAsrCli(Args(dir, {"--sample-rate", "48000"}), harness.Factories(), out, err), 0) << err.str();

    auto files = Recordings(dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_TRUE(ParseRecordingTimestamp(files[0].string()).has_value());

    WavData wav = LoadWav(files[0].string());
    EXPECT_EQ(wav.sampleRate, 48000u);
    EXPECT_EQ(wav.samples.size(), 48000u);

    // The engine always receives 16 kHz audio.
    EXPECT_EQ(harness.samplesSeenByEngine, 16000u);
    EXPECT_NE(out.str().find("Audio saved to: " + files[0].string()), std::string::npos);
}

TEST(AsrApplicationTest, UnsupportedModelFailsBeforeRecording) {
    test_utils::TempDir dir;
    Harness harness;

    std::ostringstream out, err;
    const int code = RunAsrCli(Args(dir, {"--model", "gigantic"}), harness.Factories(), out, err);

    EXPECT_EQ(code, 1);
    EXPECT_EQ(harness.inputRequests, 0);
    EXPECT_EQ(harness.engineRequests, 0);
    EXPECT_EQ(harness.input->openCalls.load(), 0);
    EXPECT_TRUE(Recordings(dir).empty());
    EXPECT_NE(err.str().find("Unsupported model"), std::string::npos);
}

TEST(AsrApplicationTest, TranscriptionFailureKeepsRecording) {
    test_utils::TempDir dir;
    Harness harness;
    harness.engineFails = true;

    std::ostringstream out, err;
    AppConfig config = ParseArguments(Args(dir, {}));
    AsrApplication app(config, harness.Factories(), out, err);

    EXPECT_EQ(app.Run(), 1);
    ASSERT_FALSE(app.GetRecordingPath().empty());
    EXPECT_TRUE(std::filesystem::exists(app.GetRecordingPath()));
    EXPECT_NE(err.str().find("Error transcribing audio"), std::string::npos);
    EXPECT_NE(err.str().find(app.GetRecordingPath()), std::string::npos);
}

TEST(AsrApplicationTest, ModelLoadFailureHappensBeforeCapture) {
    test_utils::TempDir dir;
    Harness harness;
    harness.engineLoadFails = true;

    std::ostringstream out, err;
    EXPECT_EQ(RunAsrCli(Args(dir, {}), harness.Factories(), out, err), 1);
    EXPECT_EQ(harness.inputRequests, 0);
    EXPECT_NE(err.str().find("Error loading Whisper model"), std::string::npos);
}

TEST(AsrApplicationTest, MissingMicrophoneExitsNonZero) {
    test_utils::TempDir dir;
    Harness harness;
    harness.input = std::make_shared<test_utils::SyntheticAudioInput>(256, true);

    std::ostringstream out, err;
    EXPECT_EQ(RunAsrCli(Args(dir, {}), harness.Factories(), out, err), 1);
    EXPECT_NE(err.str().find("Error recording audio"), std::string::npos);
    EXPECT_TRUE(Recordings(dir).empty());
}

TEST(AsrApplicationTest, InterruptExitsCleanly) {
    test_utils::TempDir dir;
    Harness harness;
    std::atomic<bool> interrupted{true};

    std::ostringstream out, err;
    EXPECT_EQ(RunAsrCli(Args(dir, {}), harness.Factories(), out, err, &interrupted), 0);
    EXPECT_NE(out.str().find("Process interrupted by user"), std::string::npos);
    EXPECT_TRUE(Recordings(dir).empty());
}

TEST(AsrApplicationTest, HelpAndDeviceListingSkipThePipeline) {
    test_utils::TempDir dir;
    Harness harness;

    std::ostringstream out, err;
    EXPECT_EQ(RunAsrCli({"local_asr", "--help"}, harness.Factories(), out, err), 0);
    EXPECT_NE(out.str().find("--duration"), std::string::npos);

    std::ostringstream devices;
    EXPECT_EQ(RunAsrCli(Args(dir, {"--list-devices"}), harness.Factories(), devices, err), 0);
    EXPECT_NE(devices.str().find("Synthetic"), std::string::npos);
    EXPECT_EQ(harness.inputRequests, 0);
    EXPECT_EQ(harness.engineRequests, 0);
}

TEST(AsrApplicationTest, InterruptDuringModelDownloadExitsCleanly) {
    test_utils::TempDir dir;
    Harness harness;
    harness.interruptDuringLoad = true;

    std::ostringstream out, err;
    const int code = RunAsrCli(Args(dir, {}), harness.Factories(), out, err, &harness.interrupted);

    EXPECT_EQ(code, 0);
    EXPECT_NE(out.str().find("Process interrupted by user. Exiting."), std::string::npos);
    EXPECT_EQ(out.str().find("Model loaded successfully."), std::string::npos);
    EXPECT_TRUE(err.str().empty());
    EXPECT_EQ(harness.inputRequests, 0);
    EXPECT_TRUE(Recordings(dir).empty());
}

TEST(AsrApplicationTest, InterruptDuringTranscriptionExitsCleanlyAndKeepsWav) {
    test_utils::TempDir dir;
    Harness harness;
    harness.segments = {{"partial", 0, 400}};
    harness.interruptDuringTranscribe = true;

    std::ostringstream out, err;
    const int code = RunAsrCli(Args(dir, {}), harness.Factories(), out, err, &harness.interrupted);

    EXPECT_EQ(code, 0);
    EXPECT_NE(out.str().find("Process interrupted by user. Exiting."), std::string::npos);
    EXPECT_EQ(out.str().find("TRANSCRIPTION RESULT:"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
    EXPECT_EQ(Recordings(dir).size(), 1u);
}
