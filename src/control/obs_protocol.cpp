#include "control/obs_protocol.hpp"

#include <stdexcept>
#include <vector>

#include <openssl/evp.h>

namespace obs_remote::control::obs {
namespace {

const nlohmann::json& require_object(const nlohmann::json& parent, const char* key) {
  const auto it = parent.find(key);
  if (it == parent.end() || !it->is_object()) {
    throw std::invalid_argument(std::string(key) + " must be an object");
  }
  return *it;
}

std::string require_string(const nlohmann::json& parent, const char* key) {
  const auto it = parent.find(key);
  if (it == parent.end() || !it->is_string()) {
    throw std::invalid_argument(std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

const nlohmann::json& message_data(const nlohmann::json& message, const int expected_op) {
  if (message_op(message) != expected_op) {
    throw std::invalid_argument("unexpected op " + std::to_string(message_op(message)) + ", wanted " +
                                std::to_string(expected_op));
  }
  return require_object(message, "d");
}

}  // namespace

std::string sha256_base64(const std::string& input) {
  unsigned char digest[EVP_MAX_MD_SIZE]{};
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a terminating NUL.
  std::vector<unsigned char> encoded(((digest_len + 2) / 3) * 4 + 1);
  const int encoded_len = EVP_EncodeBlock(encoded.data(), digest, static_cast<int>(digest_len));
  return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<std::size_t>(encoded_len));
}

std::string make_auth_string(const std::string& password, const std::string& salt, const std::string& challenge) {
  return sha256_base64(sha256_base64(password + salt) + challenge);
}

int message_op(const nlohmann::json& message) {
  if (!message.is_object()) {
    throw std::invalid_argument("message must be a JSON object");
  }
  const auto op_it = message.find("op");
  if (op_it == message.end() || !op_it->is_number_integer()) {
    throw std::invalid_argument("op must be an integer");
  }
  return op_it->get<int>();
}

Hello parse_hello(const nlohmann::json& message) {
  const auto& data = message_data(message, kOpHello);

  Hello hello{};
  hello.obs_websocket_version = data.value("obsWebSocketVersion", std::string{});

  const auto rpc_it = data.find("rpcVersion");
  if (rpc_it == data.end() || !rpc_it->is_number_integer()) {
    throw std::invalid_argument("rpcVersion must be an integer");
  }
  hello.rpc_version = rpc_it->get<int>();

  const auto auth_it = data.find("authentication");
  if (auth_it != data.end()) {
    if (!auth_it->is_object()) {
      throw std::invalid_argument("authentication must be an object");
    }
    hello.challenge = require_string(*auth_it, "challenge");
    hello.salt = require_string(*auth_it, "salt");
  }

  return hello;
}

RequestResult parse_request_response(const nlohmann::json& message) {
  const auto& data = message_data(message, kOpRequestResponse);

  RequestResult result{};
  result.request_type = require_string(data, "requestType");
  result.request_id = require_string(data, "requestId");

  const auto& status = require_object(data, "requestStatus");
  const auto ok_it = status.find("result");
  if (ok_it == status.end() || !ok_it->is_boolean()) {
    throw std::invalid_argument("requestStatus.result must be a boolean");
  }
  result.ok = ok_it->get<bool>();
  result.code = status.value("code", 0);
  result.comment = status.value("comment", std::string{});

  const auto response_it = data.find("responseData");
  result.data = response_it != data.end() && response_it->is_object() ? *response_it : nlohmann::json::object();
  return result;
}

nlohmann::json make_identify(const Hello& hello, const std::string& password) {
  nlohmann::json data{{"rpcVersion", kRpcVersion}, {"eventSubscriptions", 0}};
  if (hello.challenge.has_value() && hello.salt.has_value()) {
    data["authentication"] = make_auth_string(password, *hello.salt, *hello.challenge);
  }
  return nlohmann::json{{"op", kOpIdentify}, {"d", data}};
}

nlohmann::json make_request(const std::string& request_type, const std::string& request_id,
                            const nlohmann::json& request_data) {
  nlohmann::json data{{"requestType", request_type}, {"requestId", request_id}};
  if (request_data.is_object() && !request_data.empty()) {
    data["requestData"] = request_data;
  }
  return nlohmann::json{{"op", kOpRequest}, {"d", data}};
}

}  // namespace obs_remote::control::obs
