#ifndef PTT_DICTATION_AUDIO_RECORDER_ERROR_HPP
#define PTT_DICTATION_AUDIO_RECORDER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ptt_dictation {

enum class RecorderErrc {
    DeviceUnavailable,      // no capture device present
    StreamSetupFailed,      // device found, opening or starting the stream failed
    CommandDeliveryFailed,  // worker inbox closed
    WorkerUnresponsive,     // reply dropped without an answer
    ClipProcessingFailed    // worker alive, but the clip could not be finished
};

const char* recorder_errc_name(RecorderErrc code);

class RecorderError : public std::runtime_error {
public:
    RecorderError(RecorderErrc code, const std::string& what)
        : std::runtime_error(std::string(recorder_errc_name(code)) + ": " + what), code_(code) {}

    RecorderErrc code() const noexcept { return code_; }

    // The handle that raised this must not be used again
    bool handle_dead() const noexcept {
        return code_ == RecorderErrc::CommandDeliveryFailed ||
               code_ == RecorderErrc::WorkerUnresponsive;
    }

private:
    RecorderErrc code_;
};

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_RECORDER_ERROR_HPP
