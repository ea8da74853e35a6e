#pragma once

#include "vdl/tools.hpp"

#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vdl {

// ============================================================================
// Tool Server (JSON-RPC 2.0 over newline-delimited stdio)
// ============================================================================

constexpr const char* kServerName = "video-downloader";
constexpr const char* kDefaultProtocolVersion = "2024-11-05";

namespace rpc_error {
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
} // namespace rpc_error

class ToolServer {
public:
    explicit ToolServer(ToolContext context);

    // Handle one message; nullopt for notifications, which get no reply
    std::optional<nlohmann::json> handle_message(const std::string& line);

    // Serve until end of input. Returns the process exit code.
    int run(std::istream& in, std::ostream& out);

    const std::vector<ToolDef>& tools() const { return tools_; }

private:
    ToolContext context_;
    std::vector<ToolDef> tools_;

    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
    nlohmann::json handle_initialize(const nlohmann::json& params);
    nlohmann::json handle_tools_list() const;
    nlohmann::json handle_tools_call(const nlohmann::json& params);
};

// Error raised inside dispatch and turned into a JSON-RPC error response
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

} // namespace vdl
