#include "WavWorker.hpp"
#include "common/debug_log.hpp"

#include <sndfile.h>

bool WavWorker::Save() {
    _last_error.clear();
    if (!_setter_called) {
        throw SavingWorkerException("Sample rate must be specified");
    }
    if (_audioData.empty()) {
        _last_error = "no audio data to save";
        DEBUG_LOG("No audio data to save!" << DEBUG_LOG_ENDL);
        return false;
    }

    SF_INFO sfinfo{};
    sfinfo.samplerate = static_cast<int>(_sampleRate);
    sfinfo.channels = 1;
    sfinfo.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SNDFILE* outfile = sf_open(_filename.c_str(), SFM_WRITE, &sfinfo);
    if (!outfile) {
        _last_error = "could not open " + _filename + ": " + sf_strerror(nullptr);
        DEBUG_LOG("Error: " << _last_error << DEBUG_LOG_ENDL);
        return false;
    }

    sf_count_t framesWritten = sf_write_short(outfile, _audioData.data(),
                                              static_cast<sf_count_t>(_audioData.size()));
    const std::string writeError = sf_strerror(outfile);
    const int closeError = sf_close(outfile);

    if (framesWritten != static_cast<sf_count_t>(_audioData.size())) {
        _last_error = "wrote " + std::to_string(framesWritten) + " of " + std::to_string(_audioData.size()) +
                      " samples to " + _filename + ": " + writeError;
        DEBUG_LOG("Error: " << _last_error << DEBUG_LOG_ENDL);
        return false;
    }
    if (closeError != 0) {
        _last_error = "could not finalize " + _filename + ": " + sf_error_number(closeError);
        DEBUG_LOG("Error: " << _last_error << DEBUG_LOG_ENDL);
        return false;
    }

    DEBUG_LOG("Successfully saved " << _audioData.size() << " samples to " << _filename << DEBUG_LOG_ENDL);
    return true;
}

WavData LoadWav(const std::string& filename) {
    SF_INFO sfinfo{};
    SNDFILE* infile = sf_open(filename.c_str(), SFM_READ, &sfinfo);
    if (!infile) {
        throw SavingWorkerException("Could not open " + filename + ": " + sf_strerror(nullptr));
    }

    WavData wav;
    wav.sampleRate = static_cast<unsigned int>(sfinfo.samplerate);
    wav.channels = sfinfo.channels;
    wav.samples.resize(static_cast<size_t>(sfinfo.frames) * static_cast<size_t>(sfinfo.channels));

    sf_count_t read = sf_read_short(infile, wav.samples.data(), static_cast<sf_count_t>(wav.samples.size()));
    sf_close(infile);

    if (read != static_cast<sf_count_t>(wav.samples.size())) {
        throw SavingWorkerException("Short read from " + filename);
    }
    return wav;
}
