#ifndef PTT_DICTATION_AUDIO_RESAMPLER_HPP
#define PTT_DICTATION_AUDIO_RESAMPLER_HPP

#include "ptt_dictation/audio/capture_config.hpp"

namespace ptt_dictation {

// Linear-interpolation sample-rate conversion of a mono buffer.
// Returns the input unchanged when in_rate == out_rate. Output length is
// floor(input.size() / (in_rate / out_rate)).
SampleBuffer resample_linear(const SampleBuffer& input, int in_rate, int out_rate);

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_RESAMPLER_HPP
