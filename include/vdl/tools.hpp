#pragma once

#include "vdl/config.hpp"
#include "vdl/extractor.hpp"
#include "vdl/webpage_analyzer.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vdl {

// ============================================================================
// Tool Registry
// ============================================================================

// Everything a tool handler may use. The configuration is read-only; the
// engine and fetcher are the only ways a tool reaches the outside world.
struct ToolContext {
    const ServerConfig& config;
    ExtractionEngine engine;
    PageFetcher fetch;
};

struct ToolResult {
    nlohmann::json payload;
    bool is_error = false;
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& args, const ToolContext& ctx)>;

struct ToolDef {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    ToolHandler handler;
};

// Thrown by handlers when the arguments do not match the input schema
class ToolArgumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// All tools, in the order tools/list reports them
std::vector<ToolDef> register_all_tools();

// Serialize collected warnings for a tool payload
nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings);

} // namespace vdl
