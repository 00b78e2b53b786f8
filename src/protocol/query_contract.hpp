#pragma once
#include <cstdint>
#include <string>

namespace relay::protocol {

    // A single line written to the agent's stdin (without the trailing newline).
    struct QueryRequest {
        std::string command;
    };

    // The trimmed line read back from the agent's stdout.
    struct QueryResponse {
        std::string result;
        std::uint64_t request_number = 0;
        double duration_ms = 0.0;
    };

} // namespace relay::protocol
