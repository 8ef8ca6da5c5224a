#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace obs_remote::control {

constexpr const char* kToggleRecord = "ToggleRecord";
constexpr const char* kGetRecordStatus = "GetRecordStatus";

struct CallResponse {
  bool ok{false};
  nlohmann::json data{};
  std::string error{};
};

using ConnectHandler = std::function<void(bool connected)>;
using CallHandler = std::function<void(const CallResponse& response)>;

// Single logical connection to the recording application's control endpoint.
// Operations complete through their handler on the owner's event loop; none block it.
class RemoteControlClient {
 public:
  // Drops any existing connection and performs a fresh handshake.
  virtual void async_connect(ConnectHandler handler) = 0;
  virtual bool connected() const = 0;
  virtual void async_call(const std::string& request_type, const nlohmann::json& request_data,
                          CallHandler handler) = 0;
  virtual std::string last_error() const = 0;
  virtual ~RemoteControlClient() = default;
};

}  // namespace obs_remote::control
