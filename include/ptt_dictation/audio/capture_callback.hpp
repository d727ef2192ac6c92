#ifndef PTT_DICTATION_AUDIO_CAPTURE_CALLBACK_HPP
#define PTT_DICTATION_AUDIO_CAPTURE_CALLBACK_HPP

#include "ptt_dictation/audio/capture_config.hpp"
#include "ptt_dictation/audio/channel.hpp"

#include <cstdint>

namespace ptt_dictation {

// Runs on the audio device thread. Down-mixes every interleaved frame to one
// mono float and hands the chunk to the worker. Delivery is best effort: a
// chunk the worker can no longer receive is dropped.
class CaptureCallback {
public:
    CaptureCallback(const CaptureConfig& config, Sender<SampleBuffer> samples);

    void operator()(const uint8_t* stream, int len);

    // SDL_AudioCallback trampoline, userdata is a CaptureCallback*
    static void sdl_entry(void* userdata, uint8_t* stream, int len);

    const CaptureConfig& config() const { return config_; }

private:
    CaptureConfig config_;
    std::size_t frame_bytes_;
    Sender<SampleBuffer> samples_;
};

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_CAPTURE_CALLBACK_HPP
