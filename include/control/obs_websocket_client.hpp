#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>

#include "control/remote_control_client.hpp"

namespace obs_remote::control {

struct ObsConnectionOptions {
  std::string host{"localhost"};
  std::uint16_t port{4455};
  std::string password{};
  std::chrono::milliseconds io_timeout{3000};
};

// OBS WebSocket v5 client running on the caller's io_context. The handshake and
// every request are bounded by io_timeout; a request timeout drops the connection.
class ObsWebSocketClient final : public RemoteControlClient {
 public:
  ObsWebSocketClient(boost::asio::io_context& io, ObsConnectionOptions options = {});
  ~ObsWebSocketClient() override;

  ObsWebSocketClient(const ObsWebSocketClient&) = delete;
  ObsWebSocketClient& operator=(const ObsWebSocketClient&) = delete;

  void async_connect(ConnectHandler handler) override;
  bool connected() const override;
  void async_call(const std::string& request_type, const nlohmann::json& request_data, CallHandler handler) override;
  std::string last_error() const override;

 private:
  struct Session;
  using SessionPtr = std::shared_ptr<Session>;

  struct PendingCall {
    std::string request_type{};
    CallHandler handler{};
    std::shared_ptr<boost::asio::steady_timer> timer{};
  };

  void read_hello(const SessionPtr& session);
  void send_identify(const SessionPtr& session, const nlohmann::json& hello_message);
  void read_identified(const SessionPtr& session);
  void finish_connect(const SessionPtr& session, bool ok, const std::string& error);

  void read_loop(const SessionPtr& session);
  void dispatch_response(const nlohmann::json& message);
  void send(const SessionPtr& session, std::string payload);
  void write_next(const SessionPtr& session);

  std::string describe_read_error(const SessionPtr& session, const boost::system::error_code& ec) const;
  void drop_session(const std::string& reason);
  void abandon_session();

  boost::asio::io_context& io_;
  ObsConnectionOptions options_;
  SessionPtr session_{};
  std::map<std::string, PendingCall> pending_{};
  std::uint64_t next_request_id_{1};
  std::string last_error_{};
};

}  // namespace obs_remote::control
