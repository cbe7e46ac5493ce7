#include <iostream>
#include "mcpgate/client/http_client.hpp"
#include "mcpgate/exceptions.hpp"

// Usage: mcpgate_example_client_quick_start [url]
int main(int argc, char** argv) {
  using namespace mcpgate;
  client::HttpClientConfig cfg;
  cfg.id = "quick-start";
  cfg.url = argc > 1 ? argv[1] : "http://127.0.0.1:8000/mcp";
  try {
    client::StreamableHttpClient http{cfg};
    auto ctx = Context::with_timeout(std::chrono::seconds(10));
    auto init = http.initialize(ctx);
    std::cout << "connected to " << init.serverInfo.name << " " << init.serverInfo.version
              << std::endl;
    for (const auto& tool : http.list_tools(ctx))
      std::cout << "  tool: " << tool.name << std::endl;
    http.close();
  } catch (const mcpgate::HttpStatusError& e) {
    std::cerr << "HTTP status " << e.status() << ": " << e.body() << std::endl;
    return 2;
  } catch (const mcpgate::Error& e) {
    std::cerr << "MCP error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
