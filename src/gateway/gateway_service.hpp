#pragma once

#include <string>
#include "session/query_executor.hpp"

namespace relay::gateway {

struct HttpReply {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

// Maps one POST /api/v1 body onto the executor and the result back onto an
// HTTP status and body. Knows nothing about sockets.
class GatewayService {
public:
    explicit GatewayService(session::QueryExecutor& executor);

    HttpReply handle_query(const std::string& body) const;

private:
    session::QueryExecutor& executor_;
};

}  // namespace relay::gateway
