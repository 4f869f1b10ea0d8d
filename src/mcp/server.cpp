#include "mcp/server.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace grok_mcp::mcp {

namespace {

bool is_blank_line(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string describe_id(const nlohmann::json& id) {
  return id.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

Server::Server(ToolRegistry tools, const core::Logger& log) : tools_(std::move(tools)), log_(log) {}

int Server::run(std::istream& in, std::ostream& out, core::RunState& state) const {
  std::string line;
  while (state.should_continue()) {
    if (!std::getline(in, line)) {
      log_.info("EOF received, shutting down");
      state.request_stop();
      break;
    }

    ++state.stats().lines_read;
    try {
      process_line(line, out, state);
    } catch (const std::exception& ex) {
      log_.error(std::string("Unexpected error in main loop: ") + ex.what());
    }
  }

  if (state.stop_signalled()) {
    log_.info("Shutdown signal received, stopping");
  }
  state.finish();

  const auto& stats = state.stats();
  std::ostringstream summary;
  summary << "Server shutdown complete | lines=" << stats.lines_read << " requests=" << stats.requests
          << " notifications=" << stats.notifications << " decode_errors=" << stats.decode_errors
          << " responses=" << stats.responses_written << " error_responses=" << stats.error_responses;
  log_.info(summary.str());
  return 0;
}

void Server::process_line(const std::string& line, std::ostream& out, core::RunState& state) const {
  if (is_blank_line(line)) {
    return;
  }

  nlohmann::json message;
  try {
    message = nlohmann::json::parse(line);
  } catch (const nlohmann::json::exception& ex) {
    ++state.stats().decode_errors;
    log_.warning(std::string("Invalid JSON received: ") + ex.what());
    return;
  }

  const auto request = parse_request(message);
  if (!request.has_value()) {
    ++state.stats().decode_errors;
    log_.warning("Ignoring message that is not a JSON-RPC object with a usable id");
    return;
  }

  if (is_notification_method(request->method)) {
    ++state.stats().notifications;
    handle_notification(*request);
    return;
  }

  if (!request->id.has_value()) {
    ++state.stats().notifications;
    log_.info("Ignoring notification without a handler: " + request->method_name);
    return;
  }

  ++state.stats().requests;
  const nlohmann::json& id = *request->id;
  std::string encoded;
  try {
    const auto response = dispatch(*request);
    if (response.contains("error")) {
      ++state.stats().error_responses;
    }
    encoded = encode_line(response);
  } catch (const std::exception& ex) {
    log_.error("Unexpected error handling " + request->method_name + " (id " + describe_id(id) + "): " + ex.what());
    if (id.is_null()) {
      return;
    }
    ++state.stats().error_responses;
    encoded = encode_line(
        make_error_response(id, JsonRpcError{.code = kInternalError, .message = std::string("Internal error: ") + ex.what()}));
  }

  write_line(out, encoded, state);
}

nlohmann::json Server::dispatch(const JsonRpcRequest& request) const {
  const nlohmann::json& id = *request.id;

  switch (request.method) {
    case Method::initialize:
      log_.info("Handling initialize request");
      return make_result_response(id, handle_initialize());
    case Method::tools_list:
      log_.info("Handling tools/list request");
      return make_result_response(id, handle_tools_list());
    case Method::tools_call:
      return handle_tools_call(id, request.params);
    case Method::resources_list:
      return make_result_response(id, nlohmann::json{{"resources", nlohmann::json::array()}});
    case Method::prompts_list:
      return make_result_response(id, nlohmann::json{{"prompts", nlohmann::json::array()}});
    case Method::notification_initialized:
    case Method::notification_cancelled:
    case Method::unknown:
      break;
  }

  log_.warning("Unknown method: " + request.method_name);
  return make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = "Method not found: " + request.method_name});
}

void Server::handle_notification(const JsonRpcRequest& request) const {
  if (request.method == Method::notification_initialized) {
    log_.info("Client initialized notification received");
    return;
  }

  const auto request_id_it = request.params.find("requestId");
  const std::string cancelled =
      request_id_it == request.params.end() ? std::string("unknown") : describe_id(*request_id_it);
  log_.info("Request cancelled: " + cancelled);
}

nlohmann::json Server::handle_initialize() const {
  return nlohmann::json{{"protocolVersion", kProtocolVersion},
                        {"capabilities",
                         {{"tools", nlohmann::json::object()},
                          {"resources", nlohmann::json::object()},
                          {"prompts", nlohmann::json::object()}}},
                        {"serverInfo", {{"name", core::kServerName}, {"version", core::kServerVersion}}}};
}

nlohmann::json Server::handle_tools_list() const { return nlohmann::json{{"tools", tools_.list()}}; }

nlohmann::json Server::handle_tools_call(const nlohmann::json& id, const nlohmann::json& params) const {
  const auto name_it = params.find("name");
  const std::string name = name_it != params.end() && name_it->is_string() ? name_it->get<std::string>() : std::string();

  const auto args_it = params.find("arguments");
  const nlohmann::json arguments =
      args_it != params.end() && args_it->is_object() ? *args_it : nlohmann::json::object();

  log_.info("Handling tool call: " + name);

  auto outcome = tools_.call(name, arguments);
  if (const auto* error = std::get_if<ToolError>(&outcome)) {
    log_.error("Tool call error for " + name + ": " + error->message);
    return make_error_response(id, JsonRpcError{.code = kInternalError, .message = error->message});
  }

  nlohmann::json content = nlohmann::json::array();
  content.push_back({{"type", "text"}, {"text", kToolResponseLabel + std::get<std::string>(outcome)}});
  return make_result_response(id, nlohmann::json{{"content", content}});
}

void Server::write_line(std::ostream& out, const std::string& line, core::RunState& state) const {
  out.write(line.data(), static_cast<std::streamsize>(line.size()));
  out.flush();
  if (!out) {
    log_.error("Failed to send response");
    out.clear();
    return;
  }
  ++state.stats().responses_written;
}

}  // namespace grok_mcp::mcp
