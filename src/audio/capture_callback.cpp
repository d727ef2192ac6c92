#include "ptt_dictation/audio/capture_callback.hpp"

#include <cstring>
#include <new>
#include <stdexcept>

namespace ptt_dictation {

namespace {

template <typename T>
T load(const uint8_t* p) {
    T value;
    std::memcpy(&value, p, sizeof(T));
    return value;
}

float decode_sample(const uint8_t* p, SampleFormat format) {
    switch (format) {
        case SampleFormat::F32:
            return load<float>(p);
        case SampleFormat::S32:
            return static_cast<float>(static_cast<double>(load<int32_t>(p)) / 2147483648.0);
        case SampleFormat::S16:
            return static_cast<float>(load<int16_t>(p)) / 32768.0f;
        case SampleFormat::U16:
            return (static_cast<float>(load<uint16_t>(p)) - 32768.0f) / 32768.0f;
        case SampleFormat::S8:
            return static_cast<float>(load<int8_t>(p)) / 128.0f;
        case SampleFormat::U8:
            return (static_cast<float>(*p) - 128.0f) / 128.0f;
    }
    return 0.0f;
}

} // namespace

CaptureCallback::CaptureCallback(const CaptureConfig& config, Sender<SampleBuffer> samples)
    : config_(config),
      frame_bytes_(bytes_per_sample(config.format) * static_cast<std::size_t>(config.channels)),
      samples_(std::move(samples)) {
    if (config_.channels <= 0 || frame_bytes_ == 0) {
        throw std::invalid_argument("CaptureCallback: invalid channel count");
    }
}

void CaptureCallback::operator()(const uint8_t* stream, int len) {
    if (!stream || len <= 0) return;

    const std::size_t frames = static_cast<std::size_t>(len) / frame_bytes_;
    if (frames == 0) return;

    const std::size_t sample_bytes = bytes_per_sample(config_.format);
    const float inv_channels = 1.0f / static_cast<float>(config_.channels);

    SampleBuffer mono(frames);
    const uint8_t* p = stream;
    for (std::size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (int c = 0; c < config_.channels; ++c) {
            sum += decode_sample(p, config_.format);
            p += sample_bytes;
        }
        mono[f] = sum * inv_channels;
    }

    // false means the worker is gone; the chunk is dropped
    samples_.send(std::move(mono));
}

void CaptureCallback::sdl_entry(void* userdata, uint8_t* stream, int len) {
    auto* callback = static_cast<CaptureCallback*>(userdata);
    try {
        (*callback)(stream, len);
    } catch (const std::bad_alloc&) {
        // Out of memory on the device thread: this buffer is lost
    }
}

} // namespace ptt_dictation
