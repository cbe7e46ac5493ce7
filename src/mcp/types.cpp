#include "mcpgate/mcp/types.hpp"

#include "mcpgate/exceptions.hpp"

namespace mcpgate::mcp
{

namespace
{
std::optional<std::string> optional_string(const Json& j, const char* key)
{
    if (!j.contains(key) || j[key].is_null())
        return std::nullopt;
    return j[key].get<std::string>();
}

template <typename T>
std::vector<T> list_field(const Json& result, const char* key)
{
    if (!result.contains(key) || result[key].is_null())
        return {};
    if (!result[key].is_array())
        throw DecodeError(std::string("'") + key + "' must be an array");
    return result[key].get<std::vector<T>>();
}

/// Runs a parser body, reporting nlohmann type and key errors as DecodeError
template <typename F>
auto decode(const char* what, const Json& result, F&& body) -> decltype(body())
{
    if (!result.is_object())
        throw DecodeError(std::string(what) + ": result must be an object, got " +
                          result.type_name());
    try
    {
        return body();
    }
    catch (const Json::exception& e)
    {
        throw DecodeError(std::string(what) + ": " + e.what());
    }
}
} // namespace

// ---------------------------------------------------------------------------
// Equality
// ---------------------------------------------------------------------------

bool operator==(const ClientInfo& a, const ClientInfo& b)
{
    return a.name == b.name && a.version == b.version;
}

bool operator==(const ServerInfo& a, const ServerInfo& b)
{
    return a.name == b.name && a.version == b.version && a.protocolVersion == b.protocolVersion;
}

bool operator==(const InitializeResult& a, const InitializeResult& b)
{
    return a.protocolVersion == b.protocolVersion && a.capabilities == b.capabilities &&
           a.serverInfo == b.serverInfo && a.instructions == b.instructions;
}

bool operator==(const Tool& a, const Tool& b)
{
    return a.name == b.name && a.description == b.description && a.inputSchema == b.inputSchema;
}

bool operator==(const ToolContent& a, const ToolContent& b)
{
    return a.type == b.type && a.text == b.text;
}

bool operator==(const ToolCallResult& a, const ToolCallResult& b)
{
    return a.content == b.content && a.isError == b.isError;
}

bool operator==(const PromptArgument& a, const PromptArgument& b)
{
    return a.name == b.name && a.description == b.description && a.required == b.required;
}

bool operator==(const Prompt& a, const Prompt& b)
{
    return a.name == b.name && a.description == b.description && a.arguments == b.arguments;
}

bool operator==(const PromptMessage& a, const PromptMessage& b)
{
    return a.role == b.role && a.content == b.content;
}

bool operator==(const PromptResult& a, const PromptResult& b)
{
    return a.description == b.description && a.messages == b.messages;
}

bool operator==(const Resource& a, const Resource& b)
{
    return a.uri == b.uri && a.name == b.name && a.description == b.description &&
           a.mimeType == b.mimeType;
}

bool operator==(const ResourceContent& a, const ResourceContent& b)
{
    return a.uri == b.uri && a.mimeType == b.mimeType && a.text == b.text && a.blob == b.blob;
}

bool operator==(const ResourceReadResult& a, const ResourceReadResult& b)
{
    return a.contents == b.contents;
}

bool operator==(const DiscoveryResult& a, const DiscoveryResult& b)
{
    return a.serverInfo == b.serverInfo && a.tools == b.tools && a.prompts == b.prompts &&
           a.resources == b.resources;
}

// ---------------------------------------------------------------------------
// Identity
// ---------------------------------------------------------------------------

void to_json(Json& j, const ClientInfo& v)
{
    j = Json{{"name", v.name}, {"version", v.version}};
}

void from_json(const Json& j, ClientInfo& v)
{
    v.name = j.at("name").get<std::string>();
    v.version = j.value("version", std::string());
}

void to_json(Json& j, const ServerInfo& v)
{
    j = Json{{"name", v.name}, {"version", v.version}};
    if (v.protocolVersion)
        j["protocolVersion"] = *v.protocolVersion;
}

void from_json(const Json& j, ServerInfo& v)
{
    v.name = j.at("name").get<std::string>();
    v.version = j.value("version", std::string());
    v.protocolVersion = optional_string(j, "protocolVersion");
}

void to_json(Json& j, const InitializeResult& v)
{
    j = Json{{"protocolVersion", v.protocolVersion},
             {"capabilities", v.capabilities},
             {"serverInfo", v.serverInfo}};
    if (v.instructions)
        j["instructions"] = *v.instructions;
}

void from_json(const Json& j, InitializeResult& v)
{
    v.protocolVersion = j.at("protocolVersion").get<std::string>();
    v.capabilities = j.value("capabilities", Json::object());
    v.serverInfo = j.at("serverInfo").get<ServerInfo>();
    v.instructions = optional_string(j, "instructions");
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------

void to_json(Json& j, const Tool& v)
{
    j = Json{{"name", v.name}, {"inputSchema", v.inputSchema}};
    if (v.description)
        j["description"] = *v.description;
}

void from_json(const Json& j, Tool& v)
{
    v.name = j.at("name").get<std::string>();
    v.description = optional_string(j, "description");
    v.inputSchema = j.value("inputSchema", Json::object());
}

void to_json(Json& j, const ToolContent& v)
{
    j = Json{{"type", v.type}, {"text", v.text}};
}

void from_json(const Json& j, ToolContent& v)
{
    v.type = j.value("type", std::string("text"));
    // Non-text content (image, audio) carries no text field
    v.text = j.value("text", std::string());
}

void to_json(Json& j, const ToolCallResult& v)
{
    j = Json{{"content", v.content}};
    if (v.isError)
        j["isError"] = true;
}

void from_json(const Json& j, ToolCallResult& v)
{
    v.content = list_field<ToolContent>(j, "content");
    v.isError = j.value("isError", false);
}

// ---------------------------------------------------------------------------
// Prompts
// ---------------------------------------------------------------------------

void to_json(Json& j, const PromptArgument& v)
{
    j = Json{{"name", v.name}, {"required", v.required}};
    if (v.description)
        j["description"] = *v.description;
}

void from_json(const Json& j, PromptArgument& v)
{
    v.name = j.at("name").get<std::string>();
    v.description = optional_string(j, "description");
    v.required = j.value("required", false);
}

void to_json(Json& j, const Prompt& v)
{
    j = Json{{"name", v.name}};
    if (v.description)
        j["description"] = *v.description;
    if (v.arguments)
        j["arguments"] = *v.arguments;
}

void from_json(const Json& j, Prompt& v)
{
    v.name = j.at("name").get<std::string>();
    v.description = optional_string(j, "description");
    v.arguments.reset();
    if (j.contains("arguments") && !j["arguments"].is_null())
        v.arguments = list_field<PromptArgument>(j, "arguments");
}

void to_json(Json& j, const PromptMessage& v)
{
    j = Json{{"role", v.role}, {"content", v.content}};
}

void from_json(const Json& j, PromptMessage& v)
{
    v.role = j.at("role").get<std::string>();
    v.content = j.at("content").get<ToolContent>();
}

void to_json(Json& j, const PromptResult& v)
{
    j = Json{{"messages", v.messages}};
    if (v.description)
        j["description"] = *v.description;
}

void from_json(const Json& j, PromptResult& v)
{
    v.description = optional_string(j, "description");
    v.messages = list_field<PromptMessage>(j, "messages");
}

// ---------------------------------------------------------------------------
// Resources
// ---------------------------------------------------------------------------

void to_json(Json& j, const Resource& v)
{
    j = Json{{"uri", v.uri}, {"name", v.name}};
    if (v.description)
        j["description"] = *v.description;
    if (v.mimeType)
        j["mimeType"] = *v.mimeType;
}

void from_json(const Json& j, Resource& v)
{
    v.uri = j.at("uri").get<std::string>();
    v.name = j.value("name", std::string());
    v.description = optional_string(j, "description");
    v.mimeType = optional_string(j, "mimeType");
}

void to_json(Json& j, const ResourceContent& v)
{
    j = Json{{"uri", v.uri}};
    if (v.mimeType)
        j["mimeType"] = *v.mimeType;
    if (v.text)
        j["text"] = *v.text;
    if (v.blob)
        j["blob"] = *v.blob;
}

void from_json(const Json& j, ResourceContent& v)
{
    v.uri = j.at("uri").get<std::string>();
    v.mimeType = optional_string(j, "mimeType");
    v.text = optional_string(j, "text");
    v.blob = optional_string(j, "blob");
}

void to_json(Json& j, const ResourceReadResult& v)
{
    j = Json{{"contents", v.contents}};
}

void from_json(const Json& j, ResourceReadResult& v)
{
    v.contents = list_field<ResourceContent>(j, "contents");
}

void to_json(Json& j, const DiscoveryResult& v)
{
    j = Json{{"serverInfo", v.serverInfo ? Json(*v.serverInfo) : Json(nullptr)},
             {"tools", v.tools},
             {"prompts", v.prompts},
             {"resources", v.resources}};
}

// ---------------------------------------------------------------------------
// Parsers
// ---------------------------------------------------------------------------

InitializeResult parse_initialize_result(const Json& result)
{
    return decode("initialize result", result,
                  [&] { return result.get<InitializeResult>(); });
}

std::vector<Tool> parse_tools_list(const Json& result)
{
    return decode("tools/list result", result, [&] { return list_field<Tool>(result, "tools"); });
}

std::vector<Prompt> parse_prompts_list(const Json& result)
{
    return decode("prompts/list result", result,
                  [&] { return list_field<Prompt>(result, "prompts"); });
}

std::vector<Resource> parse_resources_list(const Json& result)
{
    return decode("resources/list result", result,
                  [&] { return list_field<Resource>(result, "resources"); });
}

ToolCallResult parse_tool_call_result(const Json& result)
{
    return decode("tools/call result", result, [&] { return result.get<ToolCallResult>(); });
}

PromptResult parse_prompt_result(const Json& result)
{
    return decode("prompts/get result", result, [&] { return result.get<PromptResult>(); });
}

ResourceReadResult parse_resource_read_result(const Json& result)
{
    return decode("resources/read result", result,
                  [&] { return result.get<ResourceReadResult>(); });
}

} // namespace mcpgate::mcp
