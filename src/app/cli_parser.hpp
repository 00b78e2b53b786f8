#pragma once
#include <string>
#include "core/config/settings.hpp"
#include "core/errors/relay_errors.hpp"

namespace relay::app::cli {

    enum class CliAction {
        Serve,
        ShowHelp
    };

    // Applies --config/--server/--host/--port over the environment settings.
    relay::core::errors::Result<CliAction> apply_overrides(int argc, char* argv[],
                                                           relay::core::config::Settings& settings);

    std::string usage();
}
