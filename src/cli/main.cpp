#include "mcpgate/client/config.hpp"
#include "mcpgate/discovery/discover.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/settings.hpp"
#include "mcpgate/version.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "mcpgate " << mcpgate::VERSION_MAJOR << "." << mcpgate::VERSION_MINOR << "."
              << mcpgate::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcpgate --help\n";
    std::cout << "  mcpgate discover      [connection options] [--pretty]\n";
    std::cout << "  mcpgate call-tool     <name> [--arguments <json>] [connection options] [--pretty]\n";
    std::cout << "  mcpgate get-prompt    <name> [--arg <key=value>]... [connection options] [--pretty]\n";
    std::cout << "  mcpgate read-resource <uri> [connection options] [--pretty]\n";
    std::cout << "\n";
    std::cout << "Connection options:\n";
    std::cout << "  --config <file>            Connection row as JSON (transport, url, command, ...)\n";
    std::cout << "  --stdio <command>          Spawn an MCP stdio server\n";
    std::cout << "    --stdio-arg <arg>        Repeatable args for --stdio\n";
    std::cout << "    --cwd <dir>              Working directory for --stdio\n";
    std::cout << "    --env <key=value>        Repeatable environment entries for --stdio\n";
    std::cout << "  --http <url>               Streamable HTTP endpoint (e.g. http://127.0.0.1:8000/mcp)\n";
    std::cout << "  --sse <url>                HTTP+SSE stream URL (e.g. http://127.0.0.1:8000/sse)\n";
    std::cout << "    --header <key=value>     Repeatable request headers\n";
    std::cout << "    --bearer <token>         Authorization: Bearer <token>\n";
    std::cout << "    --api-key <token>        X-API-Key: <token>\n";
    std::cout << "  --id <name>                Connection id used in logs\n";
    std::cout << "  --timeout-ms <n>           Per-request timeout (default 30000)\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  MCPGATE_LOG_LEVEL          DEBUG, INFO, WARNING or ERROR (logs go to stderr)\n";
    std::cout << "  MCPGATE_TIMEOUT_MS         Default per-request timeout\n";
    return exit_code;
}

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static std::vector<std::string> consume_repeated(std::vector<std::string>& args,
                                                 const std::string& flag)
{
    std::vector<std::string> values;
    while (auto v = consume_flag_value(args, flag))
        values.push_back(*v);
    return values;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static std::pair<std::string, std::string> split_key_value(const std::string& s,
                                                           const std::string& flag)
{
    auto eq = s.find('=');
    if (eq == std::string::npos || eq == 0)
        throw mcpgate::ConfigError(flag + " expects key=value, got: " + s);
    return {s.substr(0, eq), s.substr(eq + 1)};
}

static mcpgate::Json read_json_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw mcpgate::ConfigError("cannot open " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    try
    {
        return mcpgate::Json::parse(buffer.str());
    }
    catch (const mcpgate::Json::parse_error& e)
    {
        throw mcpgate::ConfigError(path + ": " + e.what());
    }
}

/// Build a connection row from the command line, in the shape the gateway stores
static std::optional<mcpgate::Json> parse_connection(std::vector<std::string>& args)
{
    mcpgate::Json row = mcpgate::Json::object();
    bool saw_any = false;

    if (auto path = consume_flag_value(args, "--config"))
    {
        row = read_json_file(*path);
        saw_any = true;
    }
    if (auto stdio = consume_flag_value(args, "--stdio"))
    {
        row["transport"] = "stdio";
        row["command"] = *stdio;
        saw_any = true;
    }
    if (auto http = consume_flag_value(args, "--http"))
    {
        row["transport"] = "streamable_http";
        row["url"] = *http;
        saw_any = true;
    }
    if (auto sse = consume_flag_value(args, "--sse"))
    {
        row["transport"] = "sse";
        row["url"] = *sse;
        saw_any = true;
    }
    if (!saw_any)
        return std::nullopt;

    auto stdio_args = consume_repeated(args, "--stdio-arg");
    if (!stdio_args.empty())
        row["args"] = stdio_args;
    if (auto cwd = consume_flag_value(args, "--cwd"))
        row["working_dir"] = *cwd;
    for (const auto& kv : consume_repeated(args, "--env"))
    {
        auto [key, value] = split_key_value(kv, "--env");
        row["env"][key] = value;
    }
    for (const auto& kv : consume_repeated(args, "--header"))
    {
        auto [key, value] = split_key_value(kv, "--header");
        row["headers"][key] = value;
    }
    if (auto token = consume_flag_value(args, "--bearer"))
    {
        row["auth_type"] = "bearer";
        row["auth_token"] = *token;
    }
    if (auto token = consume_flag_value(args, "--api-key"))
    {
        row["auth_type"] = "api_key";
        row["auth_token"] = *token;
    }
    if (auto id = consume_flag_value(args, "--id"))
        row["id"] = *id;
    if (auto t = consume_flag_value(args, "--timeout-ms"))
    {
        try
        {
            row["timeout_ms"] = std::stoi(*t);
        }
        catch (const std::logic_error&)
        {
            throw mcpgate::ConfigError("--timeout-ms expects an integer, got: " + *t);
        }
    }
    if (!row.contains("id") && !row.contains("name"))
        row["id"] = "cli";
    return row;
}

static int run_command(const std::string& command, std::vector<std::string> args)
{
    bool pretty = consume_flag(args, "--pretty");

    std::string target;
    if (command != "discover")
    {
        if (args.empty() || is_flag(args.front()))
        {
            std::cerr << "Missing argument for " << command << "\n";
            return 2;
        }
        target = args.front();
        args.erase(args.begin());
    }

    std::optional<std::string> tool_arguments = consume_flag_value(args, "--arguments");
    std::vector<std::string> prompt_args = consume_repeated(args, "--arg");

    auto row = parse_connection(args);
    if (!row)
    {
        std::cerr << "Missing connection options. See: mcpgate --help\n";
        return 2;
    }
    if (!args.empty())
    {
        std::cerr << "Unknown option: " << args.front() << "\n";
        return 2;
    }

    auto settings = mcpgate::Settings::from_env();
    auto config = mcpgate::client::ClientConfig::from_json(*row, settings);
    auto ctx = mcpgate::Context::background();
    auto dump_json = [pretty](const mcpgate::Json& j)
    { std::cout << (pretty ? j.dump(2) : j.dump()) << "\n"; };

    if (command == "discover")
    {
        dump_json(mcpgate::discovery::discover(config, ctx));
        return 0;
    }

    auto client = mcpgate::discovery::make_client(config);
    client->initialize(ctx);
    mcpgate::Json out;
    if (command == "call-tool")
    {
        mcpgate::Json arguments = mcpgate::Json::object();
        if (tool_arguments)
            arguments = mcpgate::Json::parse(*tool_arguments);
        out = client->call_tool(ctx, target, arguments);
    }
    else if (command == "get-prompt")
    {
        mcpgate::StringMap arguments;
        for (const auto& kv : prompt_args)
            arguments.insert(split_key_value(kv, "--arg"));
        out = client->get_prompt(ctx, target, arguments);
    }
    else
    {
        out = client->read_resource(ctx, target);
    }
    client->close();
    dump_json(out);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);

    if (cmd != "discover" && cmd != "call-tool" && cmd != "get-prompt" && cmd != "read-resource")
        return usage();

    std::vector<std::string> args;
    args.reserve(static_cast<size_t>(argc));
    for (int i = 2; i < argc; ++i)
        args.emplace_back(argv[i]);

    try
    {
        return run_command(cmd, std::move(args));
    }
    catch (const mcpgate::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
