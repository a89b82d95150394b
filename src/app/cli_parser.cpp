#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

namespace turnstile::app::cli {

    using namespace turnstile::core::errors;
    using turnstile::core::config::AuthMode;
    using turnstile::core::config::ServerConfig;
    using turnstile::core::config::WorkdirSpec;

    namespace {

        constexpr const char* kUsage =
            "Usage: turnstile_server serve --workdir PATH[=PROJECT] [--host H] [--port N] [--ws-port N] "
            "[--data-dir DIR] [--auth disabled|single-user] [--auth-token T] [--agent-command CMD]";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> host;
            std::optional<std::string> port;
            std::optional<std::string> ws_port;
            std::vector<std::string> workdirs;
            std::optional<std::string> data_dir;
            std::optional<std::string> auth;
            std::optional<std::string> auth_token;
            std::optional<std::string> agent_command;
            std::optional<std::string> pty_history_bytes;
            std::optional<std::string> subscriber_capacity;
            std::optional<std::string> conversation_window;
            std::optional<std::string> max_attachment_bytes;
            std::optional<std::string> log_level;
        };

        // Exception-free integer parsing with inclusive bounds.
        Result<std::uint64_t> parse_bounded(const std::string& flag, const std::string& value,
                                            std::uint64_t min, std::uint64_t max) {
            std::uint64_t parsed = 0;
            const char* begin = value.data();
            const char* end = value.data() + value.size();
            auto [ptr, ec] = std::from_chars(begin, end, parsed);
            if (value.empty() || ec != std::errc() || ptr != end) {
                return ServiceError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            if (parsed < min || parsed > max) {
                return ServiceError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                    "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return parsed;
        }

        Result<std::filesystem::path> existing_directory(const std::string& flag, const std::string& value) {
            std::filesystem::path p(value);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return ServiceError{ErrorCategory::Input, flag + " does not exist or is not a directory: " + value, "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return ServiceError{ErrorCategory::Input, "Failed to canonicalize " + flag + ": " + value, "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ServiceError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "serve") {
            return ServiceError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'serve' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            std::optional<std::string>* slot = nullptr;
            if (flag == "--host") slot = &raw.host;
            else if (flag == "--port") slot = &raw.port;
            else if (flag == "--ws-port") slot = &raw.ws_port;
            else if (flag == "--data-dir") slot = &raw.data_dir;
            else if (flag == "--auth") slot = &raw.auth;
            else if (flag == "--auth-token") slot = &raw.auth_token;
            else if (flag == "--agent-command") slot = &raw.agent_command;
            else if (flag == "--pty-history-bytes") slot = &raw.pty_history_bytes;
            else if (flag == "--subscriber-capacity") slot = &raw.subscriber_capacity;
            else if (flag == "--conversation-window") slot = &raw.conversation_window;
            else if (flag == "--max-attachment-bytes") slot = &raw.max_attachment_bytes;
            else if (flag == "--log-level") slot = &raw.log_level;
            else if (flag != "--workdir") {
                return ServiceError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument", kUsage};
            }

            if (i + 1 >= args.size()) {
                return ServiceError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            if (slot == nullptr) {
                raw.workdirs.push_back(args[++i]);
            } else {
                *slot = args[++i];
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig config;

        if (raw.host) {
            if (raw.host->empty()) {
                return ServiceError{ErrorCategory::Input, "--host must not be empty", "missing_value"};
            }
            config.host = raw.host.value();
        }
        if (raw.port) {
            auto port = parse_bounded("--port", raw.port.value(), 1, 65535);
            if (is_error(port)) return get_error(port);
            config.port = static_cast<std::uint16_t>(get_value(port));
        }
        if (raw.ws_port) {
            auto ws_port = parse_bounded("--ws-port", raw.ws_port.value(), 1, 65535);
            if (is_error(ws_port)) return get_error(ws_port);
            config.ws_port = static_cast<std::uint16_t>(get_value(ws_port));
        } else if (config.port == 65535) {
            return ServiceError{ErrorCategory::Input, "--port 65535 leaves no room for the default WebSocket port", "bounds_error", "Pass --ws-port explicitly."};
        }
        if (config.effective_ws_port() == config.port) {
            return ServiceError{ErrorCategory::Input, "--ws-port must differ from --port", "conflicting_flags"};
        }

        if (raw.workdirs.empty()) {
            return ServiceError{ErrorCategory::Input, "At least one --workdir is required", "missing_required_flag", kUsage};
        }
        std::set<std::filesystem::path> seen;
        for (const auto& value : raw.workdirs) {
            const auto eq = value.find('=');
            const std::string path_text = value.substr(0, eq);
            auto path = existing_directory("--workdir", path_text);
            if (is_error(path)) return get_error(path);

            WorkdirSpec spec;
            spec.path = get_value(path);
            spec.project_id = eq == std::string::npos ? spec.path.filename().string() : value.substr(eq + 1);
            if (spec.project_id.empty()) {
                return ServiceError{ErrorCategory::Input, "Empty project id in --workdir " + value, "missing_value"};
            }
            if (!seen.insert(spec.path).second) {
                return ServiceError{ErrorCategory::Input, "Workdir registered twice: " + spec.path.string(), "conflicting_flags"};
            }
            config.workdirs.push_back(std::move(spec));
        }

        // The data directory is created at startup; only reject non-directories here.
        if (raw.data_dir) {
            std::filesystem::path p(raw.data_dir.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || raw.data_dir->empty() || (exists && !std::filesystem::is_directory(p, path_ec))) {
                return ServiceError{ErrorCategory::Input, "--data-dir is not a directory: " + raw.data_dir.value(), "invalid_path"};
            }
            config.data_dir = std::filesystem::absolute(p, path_ec);
            if (path_ec) {
                return ServiceError{ErrorCategory::Input, "Failed to resolve --data-dir", "invalid_path"};
            }
        }

        if (raw.auth) {
            if (raw.auth.value() == "single-user") {
                config.auth_mode = AuthMode::SingleUser;
            } else if (raw.auth.value() != "disabled") {
                return ServiceError{ErrorCategory::Input, "Unknown --auth mode: " + raw.auth.value(), "invalid_value", "Use 'disabled' or 'single-user'."};
            }
        }
        if (raw.auth_token) {
            if (config.auth_mode != AuthMode::SingleUser) {
                return ServiceError{ErrorCategory::Input, "--auth-token requires --auth single-user", "conflicting_flags"};
            }
            if (raw.auth_token->size() < 16) {
                return ServiceError{ErrorCategory::Input, "--auth-token is too short", "bounds_error", "Use at least 16 characters."};
            }
            config.auth_token = raw.auth_token.value();
        }

        if (raw.agent_command) {
            if (raw.agent_command->empty()) {
                return ServiceError{ErrorCategory::Input, "--agent-command must not be empty", "missing_value"};
            }
            config.agent_command = raw.agent_command.value();
        }

        if (raw.pty_history_bytes) {
            auto value = parse_bounded("--pty-history-bytes", raw.pty_history_bytes.value(), 4 * 1024, 64 * 1024 * 1024);
            if (is_error(value)) return get_error(value);
            config.pty_history_bytes = static_cast<std::size_t>(get_value(value));
        }
        if (raw.subscriber_capacity) {
            auto value = parse_bounded("--subscriber-capacity", raw.subscriber_capacity.value(), 1, 65536);
            if (is_error(value)) return get_error(value);
            config.subscriber_capacity = static_cast<std::size_t>(get_value(value));
        }
        if (raw.conversation_window) {
            auto value = parse_bounded("--conversation-window", raw.conversation_window.value(), 1, 1000);
            if (is_error(value)) return get_error(value);
            config.conversation_event_window = static_cast<std::size_t>(get_value(value));
        }
        if (raw.max_attachment_bytes) {
            auto value = parse_bounded("--max-attachment-bytes", raw.max_attachment_bytes.value(), 1, 1024ULL * 1024 * 1024);
            if (is_error(value)) return get_error(value);
            config.max_attachment_bytes = static_cast<std::size_t>(get_value(value));
        }

        if (raw.log_level) {
            auto level = turnstile::core::logging::parse_log_level(raw.log_level.value());
            if (!level) {
                return ServiceError{ErrorCategory::Input, "Unknown --log-level: " + raw.log_level.value(), "invalid_value", "Use debug, info, warn or error."};
            }
            config.log_level = level.value();
        }

        return config;
    }

} // namespace turnstile::app::cli
