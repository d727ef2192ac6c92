#include "ptt_dictation/audio/sdl_audio_backend.hpp"
#include "ptt_dictation/audio/recorder_error.hpp"

#include <optional>
#include <string>

namespace ptt_dictation {

namespace {

std::optional<SampleFormat> from_sdl_format(SDL_AudioFormat format) {
    switch (format) {
        case AUDIO_F32SYS: return SampleFormat::F32;
        case AUDIO_S32SYS: return SampleFormat::S32;
        case AUDIO_S16SYS: return SampleFormat::S16;
        case AUDIO_U16SYS: return SampleFormat::U16;
        case AUDIO_S8: return SampleFormat::S8;
        case AUDIO_U8: return SampleFormat::U8;
        default: return std::nullopt;
    }
}

// Format the device would pick itself, used when the requested one is refused
bool query_preferred_spec(int device_index, SDL_AudioSpec* spec) {
    if (device_index != kDefaultCaptureDevice) {
        return SDL_GetAudioDeviceSpec(device_index, SDL_TRUE, spec) == 0;
    }

#if SDL_VERSION_ATLEAST(2, 24, 0)
    char* name = nullptr;
    if (SDL_GetDefaultAudioInfo(&name, spec, SDL_TRUE) != 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Couldn't query default capture device: %s\n",
                    SDL_GetError());
        return false;
    }
    SDL_Log("Default capture device: '%s'\n", name ? name : "unnamed");
    SDL_free(name);
    return true;
#else
    // Enumeration order says nothing about which device is the default one
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "This SDL version can't report the default capture device's format\n");
    return false;
#endif
}

} // namespace

int resolve_capture_device(int requested, int n_devices) {
    if (requested >= 0 && requested < n_devices) {
        return requested;
    }
    return kDefaultCaptureDevice;
}

SdlInputStream::SdlInputStream() {
    SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_INFO);

    if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        throw RecorderError(RecorderErrc::StreamSetupFailed,
                            std::string("Couldn't initialize SDL audio: ") + SDL_GetError());
    }
}

SdlInputStream::~SdlInputStream() {
    if (device_) {
        // Waits for a running callback to return
        SDL_CloseAudioDevice(device_);
        device_ = 0;
    }
    SDL_QuitSubSystem(SDL_INIT_AUDIO);
}

void SdlInputStream::sdl_callback(void* userdata, uint8_t* stream, int len) {
    auto* self = static_cast<SdlInputStream*>(userdata);
    if (self->callback_) {
        CaptureCallback::sdl_entry(self->callback_.get(), stream, len);
    }
}

void SdlInputStream::open(const StreamRequest& request, Sender<SampleBuffer> samples) {
    const int n_devices = SDL_GetNumAudioDevices(SDL_TRUE);
    // -1 means SDL can't enumerate; the default device may still open
    if (n_devices == 0) {
        throw RecorderError(RecorderErrc::DeviceUnavailable, "No input device found");
    }

    SDL_Log("Found %d capture devices:\n", n_devices);
    for (int i = 0; i < n_devices; i++) {
        SDL_Log("- Capture device #%d: '%s'\n", i, SDL_GetAudioDeviceName(i, SDL_TRUE));
    }

    const char* device_name = nullptr;  // Default device
    const int device_index = resolve_capture_device(request.device_id, n_devices);
    if (device_index != kDefaultCaptureDevice) {
        device_name = SDL_GetAudioDeviceName(device_index, SDL_TRUE);
        SDL_Log("Attempting to open specific capture device: %s\n", device_name);
    } else {
        if (request.device_id >= 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Capture device #%d does not exist\n",
                        request.device_id);
        }
        SDL_Log("Attempting to open default capture device\n");
    }

    SDL_AudioSpec requested, obtained;
    SDL_zero(requested);
    SDL_zero(obtained);

    requested.freq = request.sample_rate;
    requested.format = AUDIO_F32SYS;
    requested.channels = 1;
    requested.samples = 1024;
    requested.callback = &SdlInputStream::sdl_callback;
    requested.userdata = this;

    const int allowed = SDL_AUDIO_ALLOW_FREQUENCY_CHANGE |
                        SDL_AUDIO_ALLOW_FORMAT_CHANGE |
                        SDL_AUDIO_ALLOW_CHANNELS_CHANGE;

    device_ = SDL_OpenAudioDevice(device_name, SDL_TRUE, &requested, &obtained, allowed);

    if (!device_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Couldn't open capture device at %d Hz: %s\n",
                     request.sample_rate, SDL_GetError());

        // Fall back to the configuration the device prefers
        SDL_AudioSpec preferred;
        SDL_zero(preferred);
        if (query_preferred_spec(device_index, &preferred)) {
            SDL_Log("Trying device preferred spec: %d Hz, %d channels\n", preferred.freq,
                    static_cast<int>(preferred.channels));
            requested.freq = preferred.freq;
            requested.format = preferred.format;
            requested.channels = preferred.channels;
            device_ = SDL_OpenAudioDevice(device_name, SDL_TRUE, &requested, &obtained, allowed);
        }
    }

    if (!device_) {
        throw RecorderError(RecorderErrc::StreamSetupFailed,
                            std::string("Couldn't open capture device: ") + SDL_GetError());
    }

    const auto format = from_sdl_format(obtained.format);
    if (!format || obtained.channels == 0 || obtained.freq <= 0) {
        throw RecorderError(RecorderErrc::StreamSetupFailed,
                            "Unsupported sample format " + std::to_string(obtained.format));
    }

    config_.sample_rate = obtained.freq;
    config_.channels = obtained.channels;
    config_.format = *format;

    SDL_Log("Opened capture device with sample rate: %d, channels: %d, format: %s\n",
            config_.sample_rate, config_.channels, sample_format_name(config_.format));

    // Device is still paused, the callback can't observe this store
    callback_ = std::make_unique<CaptureCallback>(config_, std::move(samples));
}

void SdlInputStream::play() {
    SDL_PauseAudioDevice(device_, 0);
    if (SDL_GetAudioDeviceStatus(device_) != SDL_AUDIO_PLAYING) {
        throw RecorderError(RecorderErrc::StreamSetupFailed,
                            std::string("Capture device did not start: ") + SDL_GetError());
    }
}

std::unique_ptr<InputStream> SdlAudioBackend::open_input(const StreamRequest& request,
                                                         Sender<SampleBuffer> samples) {
    auto stream = std::make_unique<SdlInputStream>();
    stream->open(request, std::move(samples));
    return stream;
}

} // namespace ptt_dictation
