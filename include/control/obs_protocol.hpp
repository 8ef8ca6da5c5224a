#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace obs_remote::control::obs {

constexpr const char* kSubprotocol = "obswebsocket.json";
constexpr int kRpcVersion = 1;

enum Op : int {
  kOpHello = 0,
  kOpIdentify = 1,
  kOpIdentified = 2,
  kOpReidentify = 3,
  kOpEvent = 5,
  kOpRequest = 6,
  kOpRequestResponse = 7,
};

struct Hello {
  std::string obs_websocket_version{};
  int rpc_version{kRpcVersion};
  std::optional<std::string> challenge{};
  std::optional<std::string> salt{};
};

struct RequestResult {
  std::string request_type{};
  std::string request_id{};
  bool ok{false};
  int code{0};
  std::string comment{};
  nlohmann::json data{};
};

std::string sha256_base64(const std::string& input);

// base64(sha256(base64(sha256(password + salt)) + challenge))
std::string make_auth_string(const std::string& password, const std::string& salt, const std::string& challenge);

// Parsers throw std::invalid_argument on malformed messages.
int message_op(const nlohmann::json& message);
Hello parse_hello(const nlohmann::json& message);
RequestResult parse_request_response(const nlohmann::json& message);

nlohmann::json make_identify(const Hello& hello, const std::string& password);
nlohmann::json make_request(const std::string& request_type, const std::string& request_id,
                            const nlohmann::json& request_data);

}  // namespace obs_remote::control::obs
