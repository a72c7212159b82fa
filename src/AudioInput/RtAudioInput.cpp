#include "RtAudioInput.hpp"
#include "common/debug_log.hpp"

#include <algorithm>
#include <string>
#include <vector>

int RtAudioInput::Capture(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                          double /*streamTime*/, RtAudioStreamStatus status, void* userData)
{
    RtAudioInput* input = static_cast<RtAudioInput*>(userData);

    if (status) {
        DEBUG_LOG("Stream overflow detected!" << DEBUG_LOG_ENDL);
    }

    if (inputBuffer) {
        std::lock_guard<std::mutex> lock(input->_callback_mutex);
        if (input->_callback) {
            input->_callback(static_cast<const float*>(inputBuffer), nBufferFrames);
        }
    }

    return 0;
}

RtAudioInput::RtAudioInput()
    : _buffer_frames(512)
    , _sample_rate(0) {
    _audio.showWarnings(false);
}

RtAudioInput::~RtAudioInput() {
    Close();
}

unsigned int RtAudioInput::FindInputDevice() {
    std::vector<unsigned int> deviceIds = _audio.getDeviceIds();
    if (deviceIds.empty()) {
        throw AudioInputException("No audio devices found");
    }

    unsigned int device = _audio.getDefaultInputDevice();
    RtAudio::DeviceInfo info = _audio.getDeviceInfo(device);

    if (info.inputChannels < 1) {
        DEBUG_LOG("Default device has no input channels! Searching for alternative..." << DEBUG_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo candidate = _audio.getDeviceInfo(id);
            if (candidate.inputChannels > 0) {
                device = id;
                info = candidate;
                break;
            }
        }
    }

    if (info.inputChannels < 1) {
        throw AudioInputException("No microphone available: no device has input channels");
    }

    DEBUG_LOG("Using input device: " << info.name << DEBUG_LOG_ENDL);
    return device;
}

void RtAudioInput::Open(unsigned int sampleRate, unsigned int bufferFrames) {
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }

    const unsigned int device = FindInputDevice();
    RtAudio::DeviceInfo info = _audio.getDeviceInfo(device);

    // Requested rate first (unless the device says it cannot do it), then the
    // device's preferred rate, then the common hardware rates.
    std::vector<unsigned int> candidates;
    auto addCandidate = [&candidates](unsigned int rate) {
        if (rate > 0 && std::find(candidates.begin(), candidates.end(), rate) == candidates.end()) {
            candidates.push_back(rate);
        }
    };
    const bool rateListed = info.sampleRates.empty() ||
                            std::find(info.sampleRates.begin(), info.sampleRates.end(), sampleRate)
                                != info.sampleRates.end();
    if (rateListed) {
        addCandidate(sampleRate);
    } else {
        DEBUG_LOG(sampleRate << " Hz not supported by device, preferred rate is "
                  << info.preferredSampleRate << DEBUG_LOG_ENDL);
    }
    addCandidate(info.preferredSampleRate);
    addCandidate(48000);
    addCandidate(44100);

    _parameters.deviceId = device;
    _parameters.nChannels = 1;
    _parameters.firstChannel = 0;

    RtAudio::StreamOptions options;
    options.streamName = "LocalASR";

    std::string lastError;
    for (unsigned int rate : candidates) {
        _buffer_frames = bufferFrames;
        DEBUG_LOG("Opening stream: " << rate << " Hz, " << _buffer_frames
                  << " frames, FLOAT32" << DEBUG_LOG_ENDL);

        if (_audio.openStream(nullptr, &_parameters, RTAUDIO_FLOAT32,
                              rate, &_buffer_frames, &RtAudioInput::Capture, this, &options) == RTAUDIO_NO_ERROR) {
            _sample_rate = rate;
            if (rate != sampleRate) {
                DEBUG_LOG("Capturing at " << rate << " Hz, will resample to " << sampleRate << DEBUG_LOG_ENDL);
            }
            return;
        }
        lastError = _audio.getErrorText();
        DEBUG_LOG("Error opening stream at " << rate << " Hz: " << lastError << DEBUG_LOG_ENDL);
    }

    throw AudioInputException("Could not open capture stream at " + std::to_string(sampleRate) +
                              " Hz or any fallback rate: " + lastError);
}

void RtAudioInput::Start(BufferCallback callback) {
    if (!_audio.isStreamOpen()) {
        throw AudioInputException("Capture stream is not open");
    }
    {
        std::lock_guard<std::mutex> lock(_callback_mutex);
        _callback = std::move(callback);
    }
    if (_audio.startStream()) {
        throw AudioInputException("Error starting stream: " + _audio.getErrorText());
    }
}

void RtAudioInput::Stop() {
    if (_audio.isStreamRunning() && _audio.stopStream()) {
        DEBUG_LOG("Error stopping stream: " << _audio.getErrorText() << DEBUG_LOG_ENDL);
    }
    std::lock_guard<std::mutex> lock(_callback_mutex);
    _callback = nullptr;
}

void RtAudioInput::Close() {
    Stop();
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
}

void RtAudioInput::ListDevices(std::ostream& out) {
    RtAudio audio;
    audio.showWarnings(false);

    std::vector<unsigned int> deviceIds = audio.getDeviceIds();
    if (deviceIds.empty()) {
        out << "No audio devices found." << std::endl;
        return;
    }

    out << "Capture devices:" << std::endl;
    for (unsigned int id : deviceIds) {
        RtAudio::DeviceInfo info = audio.getDeviceInfo(id);
        if (info.inputChannels < 1) {
            continue;
        }
        out << "- ID " << id << ": " << info.name << " (" << info.inputChannels << "ch)";
        if (info.isDefaultInput) {
            out << " [default]";
        }
        out << std::endl;
        out << "  Supported sample rates:";
        for (unsigned int sr : info.sampleRates) {
            out << " " << sr;
        }
        out << std::endl;
    }
}
