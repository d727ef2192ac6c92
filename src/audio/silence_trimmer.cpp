#include "ptt_dictation/audio/silence_trimmer.hpp"

#include <algorithm>
#include <cmath>

namespace ptt_dictation {

void trim_silence(SampleBuffer& samples, float threshold, std::size_t padding) {
    auto loud = [threshold](float x) { return std::fabs(x) > threshold; };

    auto first_it = std::find_if(samples.begin(), samples.end(), loud);
    if (first_it == samples.end()) {
        samples.clear();
        return;
    }
    auto last_it = std::find_if(samples.rbegin(), samples.rend(), loud);

    const size_t first = static_cast<size_t>(first_it - samples.begin());
    const size_t last = samples.size() - 1 - static_cast<size_t>(last_it - samples.rbegin());

    // first == last counts as silence too
    if (first >= last) {
        samples.clear();
        return;
    }

    const size_t begin = first > padding ? first - padding : 0;
    const size_t end = std::min(last + padding, samples.size());

    samples.erase(samples.begin() + static_cast<std::ptrdiff_t>(end), samples.end());
    samples.erase(samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(begin));
}

float peak_amplitude(const SampleBuffer& samples) {
    float peak = 0.0f;
    for (float sample : samples) {
        peak = std::max(peak, std::fabs(sample));
    }
    return peak;
}

} // namespace ptt_dictation
