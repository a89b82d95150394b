#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <random>
#include <sstream>

namespace turnstile::core::config {

    // Generates `prefix` followed by `length` random hex characters.
    inline std::string generate_token(const std::string& prefix, int length = 16) {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_instance_id() {
        return generate_token("srv-", 8);
    }

    inline std::int64_t now_unix_ms() {
        const auto now = std::chrono::system_clock::now();
        return static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count());
    }

} // namespace turnstile::core::config
