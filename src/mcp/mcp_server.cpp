#include "vdl/mcp_server.hpp"

#include <spdlog/spdlog.h>

#include <istream>
#include <ostream>
#include <utility>

#ifndef VDL_VERSION
#define VDL_VERSION "unknown"
#endif

namespace vdl {

using json = nlohmann::json;

namespace {

const char* kSupportedProtocolVersions[] = {"2024-11-05", "2025-03-26", "2025-06-18"};

json error_response(const json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"error", {{"code", code}, {"message", message}}}};
}

json text_result(const json& payload, bool is_error) {
    return {{"content", json::array({{{"type", "text"},
                                      {"text", payload.dump(2, ' ', false,
                                                            json::error_handler_t::replace)}}})},
            {"isError", is_error}};
}

} // namespace

ToolServer::ToolServer(ToolContext context)
    : context_(std::move(context)), tools_(register_all_tools()) {}

std::optional<json> ToolServer::handle_message(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        spdlog::warn("unparseable message: {}", e.what());
        return error_response(nullptr, rpc_error::ParseError, "Parse error");
    }

    if (!message.is_object()) {
        return error_response(nullptr, rpc_error::InvalidRequest, "Invalid Request");
    }

    bool is_notification = !message.contains("id");
    json id = message.value("id", json(nullptr));

    auto method = message.find("method");
    auto version = message.find("jsonrpc");
    if (method == message.end() || !method->is_string() ||
        version == message.end() || *version != "2.0") {
        if (is_notification) {
            // A response to a request we never send, or junk; nothing to answer
            return std::nullopt;
        }
        return error_response(id, rpc_error::InvalidRequest, "Invalid Request");
    }

    json params = message.value("params", json::object());
    if (!params.is_object()) {
        if (is_notification) return std::nullopt;
        return error_response(id, rpc_error::InvalidParams, "params must be an object");
    }

    const std::string name = method->get<std::string>();

    if (is_notification) {
        if (name == "notifications/initialized") {
            spdlog::debug("client initialized");
        } else {
            spdlog::debug("ignoring notification {}", name);
        }
        return std::nullopt;
    }

    try {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", dispatch(name, params)}};
    } catch (const RpcError& e) {
        return error_response(id, e.code(), e.what());
    } catch (const json::exception& e) {
        spdlog::error("{} failed: {}", name, e.what());
        return error_response(id, rpc_error::InternalError, e.what());
    }
}

json ToolServer::dispatch(const std::string& method, const json& params) {
    if (method == "initialize") {
        return handle_initialize(params);
    }
    if (method == "ping") {
        return json::object();
    }
    if (method == "tools/list") {
        return handle_tools_list();
    }
    if (method == "tools/call") {
        return handle_tools_call(params);
    }
    throw RpcError(rpc_error::MethodNotFound, "Method not found: " + method);
}

json ToolServer::handle_initialize(const json& params) {
    std::string version = kDefaultProtocolVersion;
    auto requested = params.find("protocolVersion");
    if (requested != params.end() && requested->is_string()) {
        for (const char* supported : kSupportedProtocolVersions) {
            if (*requested == supported) {
                version = supported;
                break;
            }
        }
    }

    auto client = params.find("clientInfo");
    if (client != params.end() && client->is_object()) {
        spdlog::info("client {} {} connected (protocol {})",
                     client->value("name", std::string("unknown")),
                     client->value("version", std::string("")), version);
    }

    return {{"protocolVersion", version},
            {"capabilities", {{"tools", {{"listChanged", false}}}}},
            {"serverInfo", {{"name", kServerName}, {"version", VDL_VERSION}}}};
}

json ToolServer::handle_tools_list() const {
    json list = json::array();
    for (const auto& tool : tools_) {
        list.push_back({{"name", tool.name},
                        {"description", tool.description},
                        {"inputSchema", tool.input_schema}});
    }
    return {{"tools", list}};
}

json ToolServer::handle_tools_call(const json& params) {
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        throw RpcError(rpc_error::InvalidParams, "tools/call requires a tool name");
    }

    json args = params.value("arguments", json::object());
    if (args.is_null()) {
        args = json::object();
    }
    if (!args.is_object()) {
        throw RpcError(rpc_error::InvalidParams, "arguments must be an object");
    }

    for (const auto& tool : tools_) {
        if (tool.name != *name) continue;

        spdlog::debug("calling tool {}", tool.name);
        try {
            auto result = tool.handler(args, context_);
            return text_result(result.payload, result.is_error);
        } catch (const ToolArgumentError& e) {
            throw RpcError(rpc_error::InvalidParams, e.what());
        } catch (const json::exception& e) {
            // Unexpected shapes in engine metadata end the call, not the server
            spdlog::error("tool {} failed: {}", tool.name, e.what());
            return text_result({{"success", false}, {"error", e.what()}}, true);
        }
    }

    throw RpcError(rpc_error::InvalidParams, "Unknown tool: " + name->get<std::string>());
}

int ToolServer::run(std::istream& in, std::ostream& out) {
    spdlog::info("{} {} serving {} tools on stdio", kServerName, VDL_VERSION, tools_.size());

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto response = handle_message(line);
        if (response) {
            out << response->dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
            out.flush();
            if (!out) {
                spdlog::error("output stream closed; stopping");
                return 1;
            }
        }
    }

    spdlog::info("input closed; shutting down");
    return 0;
}

} // namespace vdl
