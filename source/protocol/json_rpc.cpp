#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_request(const json &request_id, const std::string &method, const json &params) {
    json request;
    request["jsonrpc"] = JSONRPC_VERSION;
    request["id"] = request_id;
    request["method"] = method;
    request["params"] = params.is_null() ? json::object() : params;
    return request;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = JSONRPC_VERSION;
    notification["method"] = method;
    notification["params"] = params.is_null() ? json::object() : params;
    return notification;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id") && message.contains("method");
}

bool is_response(const json &message) {
    if (!message.is_object() || !message.contains("id") || message["id"].is_null()) {
        return false;
    }
    return message.contains("result") || message.contains("error");
}

std::string id_key(const json &request_id) {
    return request_id.dump();
}

std::string describe_error(const json &error_object) {
    if (!error_object.is_object()) {
        return error_object.dump();
    }
    std::string text = "MCP Error";
    if (error_object.contains("code") && error_object["code"].is_number_integer()) {
        text += " " + std::to_string(error_object["code"].get<int>());
    }
    if (error_object.contains("message") && error_object["message"].is_string()) {
        text += ": " + error_object["message"].get<std::string>();
    }
    return text;
}

} // namespace json_rpc
