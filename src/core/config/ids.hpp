#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace stride::core::config {

    // Random lowercase hex string of the given length
    inline std::string random_hex(int length) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // "run-" followed by 8 hex characters
    inline std::string generate_run_id() {
        return "run-" + random_hex(8);
    }

    // Version 4 UUID in canonical 8-4-4-4-12 form
    inline std::string generate_uuid() {
        const std::string variant_nibbles = "89ab";
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> pick(0, 3);

        return random_hex(8) + "-" + random_hex(4) + "-4" + random_hex(3) + "-" +
               variant_nibbles[static_cast<std::size_t>(pick(gen))] + random_hex(3) +
               "-" + random_hex(12);
    }

    inline std::int64_t now_unix_ms() {
        const auto now = std::chrono::system_clock::now();
        return static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
                .count());
    }

} // namespace stride::core::config
