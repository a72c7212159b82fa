#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <vector>

// Shared between the capture thread and the waiting caller.
struct RecordData {
    std::vector<float> audioData;
    size_t targetFrames = 0;
    unsigned int sampleRate = 0;        // rate of the finished recording
    unsigned int captureRate = 0;       // rate granted by the device
    bool isRecording = false;

    std::mutex mutex;
    std::condition_variable filled;
};
