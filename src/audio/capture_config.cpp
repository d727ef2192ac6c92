#include "ptt_dictation/audio/capture_config.hpp"

namespace ptt_dictation {

std::size_t bytes_per_sample(SampleFormat format) {
    switch (format) {
        case SampleFormat::F32:
        case SampleFormat::S32:
            return 4;
        case SampleFormat::S16:
        case SampleFormat::U16:
            return 2;
        case SampleFormat::S8:
        case SampleFormat::U8:
            return 1;
    }
    return 0;
}

const char* sample_format_name(SampleFormat format) {
    switch (format) {
        case SampleFormat::F32: return "F32";
        case SampleFormat::S32: return "S32";
        case SampleFormat::S16: return "S16";
        case SampleFormat::U16: return "U16";
        case SampleFormat::S8: return "S8";
        case SampleFormat::U8: return "U8";
    }
    return "unknown";
}

} // namespace ptt_dictation
