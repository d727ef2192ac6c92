#ifndef PTT_DICTATION_AUDIO_SILENCE_TRIMMER_HPP
#define PTT_DICTATION_AUDIO_SILENCE_TRIMMER_HPP

#include "ptt_dictation/audio/capture_config.hpp"

#include <cstddef>

namespace ptt_dictation {

constexpr float kDefaultSilenceThreshold = 0.01f;
constexpr std::size_t kDefaultTrimPadding = 3200;  // 200 ms at 16 kHz

// Keeps [first - padding, last + padding] around the samples whose magnitude
// exceeds threshold. Clips with no such span come back empty.
void trim_silence(SampleBuffer& samples, float threshold = kDefaultSilenceThreshold,
                  std::size_t padding = kDefaultTrimPadding);

// Largest absolute sample value, 0 for an empty buffer
float peak_amplitude(const SampleBuffer& samples);

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_SILENCE_TRIMMER_HPP
