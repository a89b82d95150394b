#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace turnstile::core::config {

    enum class AuthMode {
        Disabled,
        SingleUser
    };

    // A working copy registered at startup: `--workdir PATH[=PROJECT]`.
    struct WorkdirSpec {
        std::filesystem::path path;
        std::string project_id;
    };

    // Validated server settings produced by the CLI parser.
    struct ServerConfig {
        std::string host = "127.0.0.1";
        std::uint16_t port = 8420;
        std::optional<std::uint16_t> ws_port; // defaults to port + 1
        std::vector<WorkdirSpec> workdirs;
        std::optional<std::filesystem::path> data_dir;
        AuthMode auth_mode = AuthMode::Disabled;
        std::optional<std::string> auth_token;
        std::optional<std::string> agent_command;
        std::size_t pty_history_bytes = 512 * 1024;
        std::size_t subscriber_capacity = 256;
        std::size_t conversation_event_window = 200;
        std::size_t max_attachment_bytes = 25 * 1024 * 1024;
        logging::LogLevel log_level = logging::LogLevel::INFO;

        std::uint16_t effective_ws_port() const {
            return ws_port.has_value() ? ws_port.value()
                                       : static_cast<std::uint16_t>(port + 1);
        }
    };

} // namespace turnstile::core::config
