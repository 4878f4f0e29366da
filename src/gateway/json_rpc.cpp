/**
 * @file json_rpc.cpp
 */

#include "gateway/json_rpc.h"

namespace tradecast::gateway {

std::string to_string(RpcErrorCode code) {
    switch (code) {
        case RpcErrorCode::PARSE_ERROR: return "Parse error";
        case RpcErrorCode::INVALID_REQUEST: return "Invalid Request";
        case RpcErrorCode::METHOD_NOT_FOUND: return "Method not found";
        case RpcErrorCode::INVALID_PARAMS: return "Invalid params";
        case RpcErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

nlohmann::json make_success(const nlohmann::json& id, nlohmann::json result) {
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"result", std::move(result)},
        {"id", id}
    };
}

nlohmann::json make_error(const nlohmann::json& id, RpcErrorCode code, const std::string& message) {
    nlohmann::json error{
        {"code", static_cast<int>(code)},
        {"message", to_string(code)}
    };
    if (!message.empty() && message != to_string(code)) {
        error["data"] = message;
    }
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"error", std::move(error)},
        {"id", id}
    };
}

bool is_valid_request(const nlohmann::json& request) {
    if (!request.is_object()) {
        return false;
    }
    auto version = request.find("jsonrpc");
    if (version == request.end() || !version->is_string() || version->get<std::string>() != "2.0") {
        return false;
    }
    auto method = request.find("method");
    if (method == request.end() || !method->is_string() || method->get<std::string>().empty()) {
        return false;
    }
    auto id = request.find("id");
    if (id != request.end() && !id->is_string() && !id->is_number() && !id->is_null()) {
        return false;
    }
    auto params = request.find("params");
    if (params != request.end() && !params->is_object() && !params->is_null()) {
        return false;
    }
    return true;
}

} // namespace tradecast::gateway
