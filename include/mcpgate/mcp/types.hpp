#pragma once
/// @file mcp/types.hpp
/// @brief MCP domain types exchanged during discovery, and typed parsers for result objects

#include "mcpgate/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcpgate::mcp
{

struct ClientInfo
{
    std::string name;
    std::string version;
};

struct ServerInfo
{
    std::string name;
    std::string version;
    std::optional<std::string> protocolVersion;
};

struct InitializeResult
{
    std::string protocolVersion;
    Json capabilities = Json::object();
    ServerInfo serverInfo;
    std::optional<std::string> instructions;
};

struct Tool
{
    std::string name;
    std::optional<std::string> description;
    Json inputSchema = Json::object();
};

struct ToolContent
{
    std::string type{"text"};
    std::string text;
};

struct ToolCallResult
{
    std::vector<ToolContent> content;
    bool isError{false}; ///< Omitted from the encoding when false
};

struct PromptArgument
{
    std::string name;
    std::optional<std::string> description;
    bool required{false};
};

struct Prompt
{
    std::string name;
    std::optional<std::string> description;
    std::optional<std::vector<PromptArgument>> arguments;
};

struct PromptMessage
{
    std::string role;
    ToolContent content;
};

struct PromptResult
{
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;
};

struct Resource
{
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

struct ResourceContent
{
    std::string uri;
    std::optional<std::string> mimeType;
    std::optional<std::string> text;
    std::optional<std::string> blob; ///< base64
};

struct ResourceReadResult
{
    std::vector<ResourceContent> contents;
};

/// Aggregate produced by one discovery pass. Snapshot; never refreshed.
struct DiscoveryResult
{
    std::optional<ServerInfo> serverInfo;
    std::vector<Tool> tools;
    std::vector<Prompt> prompts;
    std::vector<Resource> resources;
};

bool operator==(const ClientInfo& a, const ClientInfo& b);
bool operator==(const ServerInfo& a, const ServerInfo& b);
bool operator==(const InitializeResult& a, const InitializeResult& b);
bool operator==(const Tool& a, const Tool& b);
bool operator==(const ToolContent& a, const ToolContent& b);
bool operator==(const ToolCallResult& a, const ToolCallResult& b);
bool operator==(const PromptArgument& a, const PromptArgument& b);
bool operator==(const Prompt& a, const Prompt& b);
bool operator==(const PromptMessage& a, const PromptMessage& b);
bool operator==(const PromptResult& a, const PromptResult& b);
bool operator==(const Resource& a, const Resource& b);
bool operator==(const ResourceContent& a, const ResourceContent& b);
bool operator==(const ResourceReadResult& a, const ResourceReadResult& b);
bool operator==(const DiscoveryResult& a, const DiscoveryResult& b);

// nlohmann ADL adapters
void to_json(Json& j, const ClientInfo& v);
void from_json(const Json& j, ClientInfo& v);
void to_json(Json& j, const ServerInfo& v);
void from_json(const Json& j, ServerInfo& v);
void to_json(Json& j, const InitializeResult& v);
void from_json(const Json& j, InitializeResult& v);
void to_json(Json& j, const Tool& v);
void from_json(const Json& j, Tool& v);
void to_json(Json& j, const ToolContent& v);
void from_json(const Json& j, ToolContent& v);
void to_json(Json& j, const ToolCallResult& v);
void from_json(const Json& j, ToolCallResult& v);
void to_json(Json& j, const PromptArgument& v);
void from_json(const Json& j, PromptArgument& v);
void to_json(Json& j, const Prompt& v);
void from_json(const Json& j, Prompt& v);
void to_json(Json& j, const PromptMessage& v);
void from_json(const Json& j, PromptMessage& v);
void to_json(Json& j, const PromptResult& v);
void from_json(const Json& j, PromptResult& v);
void to_json(Json& j, const Resource& v);
void from_json(const Json& j, Resource& v);
void to_json(Json& j, const ResourceContent& v);
void from_json(const Json& j, ResourceContent& v);
void to_json(Json& j, const ResourceReadResult& v);
void from_json(const Json& j, ResourceReadResult& v);
void to_json(Json& j, const DiscoveryResult& v);

// Typed parsers over a JSON-RPC `result` object. All throw DecodeError on malformed
// input. An absent list key yields an empty vector; a non-array value is an error.
InitializeResult parse_initialize_result(const Json& result);
std::vector<Tool> parse_tools_list(const Json& result);
std::vector<Prompt> parse_prompts_list(const Json& result);
std::vector<Resource> parse_resources_list(const Json& result);
ToolCallResult parse_tool_call_result(const Json& result);
PromptResult parse_prompt_result(const Json& result);
ResourceReadResult parse_resource_read_result(const Json& result);

} // namespace mcpgate::mcp
