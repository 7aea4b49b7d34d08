#include "mcp/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "mcp/jsonrpc.hpp"

namespace context_mcp::mcp {

namespace {

bool is_blank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

Server::Server(ToolRegistry tools, engine::EngineFacade& engine) : router_(std::move(tools), engine) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) {
  std::string line;
  while (std::getline(in, line)) {
    if (is_blank(line)) {
      continue;
    }

    try {
      const auto response = handle_line(line, err);
      if (response.has_value()) {
        out << serialize(*response) << '\n';
        out.flush();
      }
    } catch (const std::exception& ex) {
      err << "[server] failed to process request: " << ex.what() << '\n';
    }
  }

  return 0;
}

std::optional<nlohmann::json> Server::handle_line(const std::string& line, std::ostream& err) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    err << "[server] invalid JSON: " << ex.what() << '\n';
    return std::nullopt;
  }

  if (is_client_response(message)) {
    err << "[server] ignoring client response message\n";
    return std::nullopt;
  }

  JsonRpcRequest request;
  try {
    request = parse_request(message);
  } catch (const std::invalid_argument& ex) {
    err << "[server] dropping malformed message: " << ex.what() << '\n';
    return std::nullopt;
  }

  auto response = router_.dispatch(request, err);
  if (request.is_notification()) {
    return std::nullopt;
  }
  return response;
}

}  // namespace context_mcp::mcp
