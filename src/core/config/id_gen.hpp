#pragma once
#include <random>
#include <sstream>
#include <string>

namespace forge::core::config {

    // Generates a simple 8-character hex ID with the given prefix, e.g. "task-3fa09c1e"
    inline std::string generate_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_task_id() { return generate_id("task"); }

} // namespace forge::core::config
