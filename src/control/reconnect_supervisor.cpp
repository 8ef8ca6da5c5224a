#include "control/reconnect_supervisor.hpp"

#include <iostream>

namespace obs_remote::control {

ReconnectSupervisor::ReconnectSupervisor(boost::asio::io_context& io, RemoteControlClient& client,
                                         core::ControllerState& state, const std::chrono::milliseconds reconnect_delay)
    : client_(client), state_(state), reconnect_delay_(reconnect_delay), timer_(io) {}

void ReconnectSupervisor::start() {
  attempt();
  schedule_next();
}

void ReconnectSupervisor::attempt() {
  if (state_.connected || connecting_) {
    return;
  }

  connecting_ = true;
  ++attempts_;
  client_.async_connect([this](const bool ok) {
    connecting_ = false;
    if (!ok) {
      if (!last_attempt_failed_) {
        std::cerr << "[supervisor] OBS WebSocket unavailable: " << client_.last_error() << "; retrying every "
                  << reconnect_delay_.count() << "ms\n";
        last_attempt_failed_ = true;
      }
      return;
    }

    state_.connected = true;
    last_attempt_failed_ = false;
    std::cout << "Connected to OBS WebSocket." << std::endl;
  });
}

bool ReconnectSupervisor::connecting() const noexcept { return connecting_; }

std::size_t ReconnectSupervisor::attempts() const noexcept { return attempts_; }

void ReconnectSupervisor::schedule_next() {
  timer_.expires_after(reconnect_delay_);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    attempt();
    schedule_next();
  });
}

}  // namespace obs_remote::control
