#pragma once

#include <string>
#include "core/errors/relay_errors.hpp"
#include "protocol/query_contract.hpp"

namespace relay::session {

// What the HTTP layer needs from the agent: run one command, wait for its line.
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    virtual core::errors::Result<protocol::QueryResponse> execute(
        const protocol::QueryRequest& request) = 0;

    virtual std::string describe_stats() const = 0;
};

}  // namespace relay::session
