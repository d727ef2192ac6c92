#ifndef PTT_DICTATION_AUDIO_CAPTURE_CONFIG_HPP
#define PTT_DICTATION_AUDIO_CAPTURE_CONFIG_HPP

#include <cstddef>
#include <vector>

namespace ptt_dictation {

// Rate expected by the downstream transcriber
constexpr int kTargetSampleRate = 16000;

// Mono float PCM in [-1, 1]
using SampleBuffer = std::vector<float>;

// Native-endian sample encodings accepted from the capture device
enum class SampleFormat {
    F32,
    S32,
    S16,
    U16,
    S8,
    U8
};

std::size_t bytes_per_sample(SampleFormat format);
const char* sample_format_name(SampleFormat format);

// Negotiated once per stream, never changes afterwards
struct CaptureConfig {
    int sample_rate = kTargetSampleRate;
    int channels = 1;
    SampleFormat format = SampleFormat::F32;
};

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_CAPTURE_CONFIG_HPP
