/**
 * @file json_rpc.h
 * @brief JSON-RPC 2.0 envelope helpers for the request gateway
 */

#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace tradecast::gateway {

/**
 * @enum RpcErrorCode
 * @brief Standard JSON-RPC 2.0 error codes
 */
enum class RpcErrorCode : int {
    PARSE_ERROR = -32700,
    INVALID_REQUEST = -32600,
    METHOD_NOT_FOUND = -32601,
    INVALID_PARAMS = -32602,
    INTERNAL_ERROR = -32603
};

std::string to_string(RpcErrorCode code);

/// Thrown by method handlers; converted into an error response by the dispatcher
class RpcError : public std::runtime_error {
public:
    RpcError(RpcErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    RpcErrorCode code() const { return code_; }

private:
    RpcErrorCode code_;
};

nlohmann::json make_success(const nlohmann::json& id, nlohmann::json result);
nlohmann::json make_error(const nlohmann::json& id, RpcErrorCode code, const std::string& message);

/**
 * @brief Structural validation of a request object
 *
 * Requires "jsonrpc":"2.0", a string "method", an optional string/number/null "id" and
 * optional object "params".
 */
bool is_valid_request(const nlohmann::json& request);

} // namespace tradecast::gateway
