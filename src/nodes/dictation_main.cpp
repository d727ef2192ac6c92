#include "ptt_dictation/nodes/dictation_node.hpp"

// Entry point
int main(int argc, char* argv[]) {
    rclcpp::init(argc, argv);

    try {
        rclcpp::spin(std::make_shared<ptt_dictation::DictationNode>());
    } catch (const std::exception& e) {
        RCLCPP_ERROR(rclcpp::get_logger("dictation_node"), "Exception: %s", e.what());
        rclcpp::shutdown();
        return 1;
    }

    rclcpp::shutdown();
    return 0;
}
