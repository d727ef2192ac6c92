#ifndef PTT_DICTATION_DICTATION_NODE_HPP
#define PTT_DICTATION_DICTATION_NODE_HPP

#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/bool.hpp>
#include <std_srvs/srv/trigger.hpp>
#include <ptt_dictation/msg/audio_clip.hpp>
#include "ptt_dictation/audio/recorder.hpp"

#include <memory>
#include <string>

namespace ptt_dictation {

class DictationNode : public rclcpp::Node {
public:
    explicit DictationNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());
    DictationNode(const rclcpp::NodeOptions& options, std::shared_ptr<AudioBackend> backend);
    ~DictationNode() = default;

private:
    // Parameters
    void declare_parameters();
    void load_parameters();

    // Service callbacks
    void handle_start(const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
                      std::shared_ptr<std_srvs::srv::Trigger::Response> response);
    void handle_stop(const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
                     std::shared_ptr<std_srvs::srv::Trigger::Response> response);
    void handle_toggle(const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
                       std::shared_ptr<std_srvs::srv::Trigger::Response> response);

    // Timer callback for recorder events
    void event_timer_callback();

    bool begin_recording(std::string& message);
    bool finish_recording(std::string& message);
    void publish_state();

    std::shared_ptr<AudioBackend> backend_;
    std::unique_ptr<Recorder> recorder_;
    RecorderSettings recorder_settings_;
    bool recording_ = false;

    // ROS2 interfaces
    rclcpp::Publisher<msg::AudioClip>::SharedPtr clip_pub_;
    rclcpp::Publisher<std_msgs::msg::Bool>::SharedPtr state_pub_;
    rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr start_srv_;
    rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr stop_srv_;
    rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr toggle_srv_;
    rclcpp::TimerBase::SharedPtr event_timer_;

    // Parameters
    int device_id_;
    int target_sample_rate_;
    double silence_threshold_;
    int trim_padding_ms_;
    int poll_interval_ms_;
    int auto_stop_silence_ms_;
    int event_poll_period_ms_;
};

} // namespace ptt_dictation

#endif // PTT_DICTATION_DICTATION_NODE_HPP
