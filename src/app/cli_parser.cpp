#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace relay::app::cli {

    using namespace relay::core::errors;
    using relay::core::config::Settings;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> config_file;
        std::optional<std::string> server_name;
        std::optional<std::string> host;
        std::optional<std::string> port;
        bool help = false;
    };

    std::string usage() {
        return "Usage: relay_gateway [--config <path>] [--server <name>] [--host <addr>] [--port <n>]\n"
               "Environment: MCP_CONFIG_FILE, MCP_SERVER_NAME, HOST, PORT, MCP_SERVERS_DIR,\n"
               "  RESPONSE_TIMEOUT_SECS, PROCESS_INIT_WAIT_SECS, SUPPORTED_LANGUAGES,\n"
               "  SUPPORTED_SERVER_TYPES, HTTP_API_KEY, DISABLE_AUTH, LOG_LEVEL";
    }

    Result<CliAction> apply_overrides(int argc, char* argv[], Settings& settings) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config_file = args[++i];
                else return RelayError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--server") {
                if (i + 1 < args.size()) raw.server_name = args[++i];
                else return RelayError{ErrorCategory::Input, "Missing value for --server", "missing_value"};
            } else if (args[i] == "--host") {
                if (i + 1 < args.size()) raw.host = args[++i];
                else return RelayError{ErrorCategory::Input, "Missing value for --host", "missing_value"};
            } else if (args[i] == "--port") {
                if (i + 1 < args.size()) raw.port = args[++i];
                else return RelayError{ErrorCategory::Input, "Missing value for --port", "missing_value"};
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else {
                return RelayError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }
        }

        if (raw.help) {
            return CliAction::ShowHelp;
        }

        // 3. Validator Phase: Enforce bounds before touching the settings
        std::optional<std::uint16_t> port;
        if (raw.port) {
            std::uint32_t value = 0;
            const char* begin = raw.port->data();
            const char* end = raw.port->data() + raw.port->size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return RelayError{ErrorCategory::Input, "Invalid number for --port", "invalid_integer", "Provide a port number."};
            }
            if (value == 0 || value > 65535) {
                return RelayError{ErrorCategory::Input, "--port out of bounds", "bounds_error", "Must be between 1 and 65535."};
            }
            port = static_cast<std::uint16_t>(value);
        }

        if (raw.server_name && raw.server_name->empty()) {
            return RelayError{ErrorCategory::Input, "--server cannot be empty", "invalid_value"};
        }

        if (raw.config_file) settings.gateway.config_file = raw.config_file.value();
        if (raw.server_name) settings.gateway.server_name = raw.server_name.value();
        if (raw.host) settings.gateway.host = raw.host.value();
        if (port) settings.gateway.port = port.value();

        return CliAction::Serve;
    }

} // namespace relay::app::cli
