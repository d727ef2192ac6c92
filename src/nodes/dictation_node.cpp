#include "ptt_dictation/nodes/dictation_node.hpp"
#include "ptt_dictation/audio/sdl_audio_backend.hpp"

#include <algorithm>
#include <stdexcept>

namespace ptt_dictation {

DictationNode::DictationNode(const rclcpp::NodeOptions& options)
    : DictationNode(options, std::make_shared<SdlAudioBackend>()) {}

DictationNode::DictationNode(const rclcpp::NodeOptions& options, std::shared_ptr<AudioBackend> backend)
    : Node("dictation_node", options), backend_(std::move(backend)) {

    // Declare and load parameters
    declare_parameters();
    load_parameters();

    // The device is opened lazily on the first start request
    recorder_ = std::make_unique<Recorder>(backend_, recorder_settings_);

    // Create publishers
    clip_pub_ = create_publisher<msg::AudioClip>("audio/clip", 10);
    state_pub_ = create_publisher<std_msgs::msg::Bool>("recording/active", rclcpp::QoS(1).transient_local());

    // Create services
    using std::placeholders::_1;
    using std::placeholders::_2;
    start_srv_ = create_service<std_srvs::srv::Trigger>(
        "~/start_recording", std::bind(&DictationNode::handle_start, this, _1, _2));
    stop_srv_ = create_service<std_srvs::srv::Trigger>(
        "~/stop_recording", std::bind(&DictationNode::handle_stop, this, _1, _2));
    toggle_srv_ = create_service<std_srvs::srv::Trigger>(
        "~/toggle_recording", std::bind(&DictationNode::handle_toggle, this, _1, _2));

    // Create timer for recorder events
    event_timer_ = create_wall_timer(
        std::chrono::milliseconds(event_poll_period_ms_),
        std::bind(&DictationNode::event_timer_callback, this));

    publish_state();

    RCLCPP_INFO(get_logger(), "Dictation node initialized");
    RCLCPP_INFO(get_logger(), "Target sample rate: %d Hz", target_sample_rate_);
    RCLCPP_INFO(get_logger(), "Silence threshold: %f", silence_threshold_);
    RCLCPP_INFO(get_logger(), "Trim padding: %d ms", trim_padding_ms_);
    if (auto_stop_silence_ms_ > 0) {
        RCLCPP_INFO(get_logger(), "Auto-stop after %d ms of silence", auto_stop_silence_ms_);
    }
}

void DictationNode::declare_parameters() {
    declare_parameter("device_id", -1);  // -1 means default device
    declare_parameter("target_sample_rate", kTargetSampleRate);
    declare_parameter("silence_threshold", static_cast<double>(kDefaultSilenceThreshold));
    declare_parameter("trim_padding_ms", 200);
    declare_parameter("poll_interval_ms", 50);
    declare_parameter("auto_stop_silence_ms", 0);  // 0 disables auto-stop
    declare_parameter("event_poll_period_ms", 50);
}

void DictationNode::load_parameters() {
    device_id_ = get_parameter("device_id").as_int();
    target_sample_rate_ = get_parameter("target_sample_rate").as_int();
    silence_threshold_ = get_parameter("silence_threshold").as_double();
    trim_padding_ms_ = get_parameter("trim_padding_ms").as_int();
    poll_interval_ms_ = get_parameter("poll_interval_ms").as_int();
    auto_stop_silence_ms_ = get_parameter("auto_stop_silence_ms").as_int();
    event_poll_period_ms_ = get_parameter("event_poll_period_ms").as_int();

    if (target_sample_rate_ <= 0) {
        throw std::invalid_argument("target_sample_rate must be positive");
    }
    if (target_sample_rate_ != kTargetSampleRate) {
        RCLCPP_WARN(get_logger(), "Target rate %d Hz may not suit the transcriber (expected %d Hz)",
                    target_sample_rate_, kTargetSampleRate);
    }
    if (event_poll_period_ms_ <= 0) {
        event_poll_period_ms_ = 50;
    }

    recorder_settings_.device_id = device_id_;
    recorder_settings_.worker.target_sample_rate = target_sample_rate_;
    recorder_settings_.worker.silence_threshold = static_cast<float>(silence_threshold_);
    recorder_settings_.worker.trim_padding =
        static_cast<std::size_t>(std::max(0, trim_padding_ms_)) * static_cast<std::size_t>(target_sample_rate_) / 1000;
    recorder_settings_.worker.poll_interval = std::chrono::milliseconds(std::max(1, poll_interval_ms_));
    recorder_settings_.worker.auto_stop_silence = std::chrono::milliseconds(std::max(0, auto_stop_silence_ms_));
}

void DictationNode::handle_start(const std::shared_ptr<std_srvs::srv::Trigger::Request>,
                                 std::shared_ptr<std_srvs::srv::Trigger::Response> response) {
    response->success = begin_recording(response->message);
}

void DictationNode::handle_stop(const std::shared_ptr<std_srvs::srv::Trigger::Request>,
                                std::shared_ptr<std_srvs::srv::Trigger::Response> response) {
    response->success = finish_recording(response->message);
}

void DictationNode::handle_toggle(const std::shared_ptr<std_srvs::srv::Trigger::Request>,
                                  std::shared_ptr<std_srvs::srv::Trigger::Response> response) {
    response->success = recording_ ? finish_recording(response->message)
                                    : begin_recording(response->message);
}

void DictationNode::event_timer_callback() {
    RecorderEvent event;
    while (recorder_->poll_event(event)) {
        if (event == RecorderEvent::RecordingStarted) {
            if (recording_) {
                publish_state();
            }
        } else if (event == RecorderEvent::AutoStopped && recording_) {
            RCLCPP_INFO(get_logger(), "Silence timeout, stopping recording");
            std::string message;
            if (!finish_recording(message)) {
                RCLCPP_WARN(get_logger(), "Auto-stop failed: %s", message.c_str());
            }
        }
    }
}

bool DictationNode::begin_recording(std::string& message) {
    try {
        recorder_->start();
    } catch (const RecorderError& e) {
        RCLCPP_ERROR(get_logger(), "Start error: %s", e.what());
        if (e.handle_dead()) {
            recorder_ = std::make_unique<Recorder>(backend_, recorder_settings_);
        }
        recording_ = false;
        publish_state();
        message = e.what();
        return false;
    }

    if (recording_) {
        RCLCPP_INFO(get_logger(), "Recording restarted");
    }
    // recording/active turns true once the worker reports the start
    recording_ = true;
    message = "Recording...";
    return true;
}

bool DictationNode::finish_recording(std::string& message) {
    SampleBuffer clip;
    try {
        clip = recorder_->stop();
    } catch (const RecorderError& e) {
        // The clip is lost; a dead recorder is replaced for the next request
        RCLCPP_ERROR(get_logger(), "Stop error: %s", e.what());
        if (e.handle_dead()) {
            recorder_ = std::make_unique<Recorder>(backend_, recorder_settings_);
        }
        recording_ = false;
        publish_state();
        message = e.what();
        return false;
    }

    recording_ = false;
    publish_state();

    if (clip.empty()) {
        RCLCPP_INFO(get_logger(), "No audio recorded (silence)");
        message = "No audio recorded (silence).";
        return true;
    }

    auto msg = std::make_unique<msg::AudioClip>();

    // Fill header
    msg->header.stamp = now();
    msg->header.frame_id = "audio_frame";

    msg->sample_rate = static_cast<uint32_t>(target_sample_rate_);
    msg->samples = std::move(clip);

    RCLCPP_INFO(get_logger(), "Publishing clip: %zu samples (%.2f s)", msg->samples.size(),
                static_cast<double>(msg->samples.size()) / target_sample_rate_);
    message = "Published " + std::to_string(msg->samples.size()) + " samples";

    clip_pub_->publish(std::move(msg));
    return true;
}

void DictationNode::publish_state() {
    auto msg = std::make_unique<std_msgs::msg::Bool>();
    msg->data = recording_;
    state_pub_->publish(std::move(msg));
}

} // namespace ptt_dictation
