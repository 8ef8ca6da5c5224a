#pragma once

#include <chrono>
#include <cstddef>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "control/remote_control_client.hpp"
#include "core/controller_state.hpp"

namespace obs_remote::control {

class ReconnectSupervisor {
 public:
  ReconnectSupervisor(boost::asio::io_context& io, RemoteControlClient& client, core::ControllerState& state,
                      std::chrono::milliseconds reconnect_delay);

  ReconnectSupervisor(const ReconnectSupervisor&) = delete;
  ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

  // Attempts immediately, then once per reconnect_delay for the life of the io_context.
  void start();

  // One supervision step: starts a connect unless connected or one is already in flight.
  void attempt();

  [[nodiscard]] bool connecting() const noexcept;

  [[nodiscard]] std::size_t attempts() const noexcept;

 private:
  void schedule_next();

  RemoteControlClient& client_;
  core::ControllerState& state_;
  std::chrono::milliseconds reconnect_delay_;
  boost::asio::steady_timer timer_;
  std::size_t attempts_{0};
  bool connecting_{false};
  bool last_attempt_failed_{false};
};

}  // namespace obs_remote::control
