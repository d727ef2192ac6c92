#include "ptt_dictation/audio/resampler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ptt_dictation {

SampleBuffer resample_linear(const SampleBuffer& input, int in_rate, int out_rate) {
    if (in_rate <= 0 || out_rate <= 0) {
        throw std::invalid_argument("resample_linear: sample rates must be positive");
    }
    if (in_rate == out_rate || input.empty()) {
        return input;
    }

    const double ratio = static_cast<double>(in_rate) / static_cast<double>(out_rate);
    const size_t out_len = static_cast<size_t>(std::floor(static_cast<double>(input.size()) / ratio));
    const size_t last = input.size() - 1;

    SampleBuffer output;
    output.reserve(out_len);

    for (size_t i = 0; i < out_len; ++i) {
        const double pos = static_cast<double>(i) * ratio;
        const size_t lo = std::min(static_cast<size_t>(pos), last);
        const size_t hi = std::min(lo + 1, last);
        const float t = static_cast<float>(pos - static_cast<double>(lo));

        output.push_back(input[lo] * (1.0f - t) + input[hi] * t);
    }

    return output;
}

} // namespace ptt_dictation
