#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/service_errors.hpp"

namespace turnstile::app::cli {
    turnstile::core::errors::Result<turnstile::core::config::ServerConfig> parse_and_validate(int argc, char* argv[]);
}
