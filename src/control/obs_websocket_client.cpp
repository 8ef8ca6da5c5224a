#include "control/obs_websocket_client.hpp"

#include <deque>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include "control/obs_protocol.hpp"

namespace obs_remote::control {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

}  // namespace

struct ObsWebSocketClient::Session {
  explicit Session(boost::asio::io_context& io) : resolver(io), stream(io), deadline(io) {}

  // Any pending operation completes with an error once the transport is closed.
  void close_transport() {
    resolver.cancel();
    beast::error_code close_ec;
    beast::get_lowest_layer(stream).socket().close(close_ec);
  }

  tcp::resolver resolver;
  websocket::stream<beast::tcp_stream> stream;
  boost::asio::steady_timer deadline;
  beast::flat_buffer buffer{};
  std::deque<std::string> outbox{};
  ConnectHandler on_connect{};
  const char* phase{"resolving"};
  bool writing{false};
  bool identified{false};
  bool timed_out{false};
  bool abandoned{false};
};

ObsWebSocketClient::ObsWebSocketClient(boost::asio::io_context& io, ObsConnectionOptions options)
    : io_(io), options_(std::move(options)) {}

ObsWebSocketClient::~ObsWebSocketClient() {
  // Handlers are dropped, not run: their owners may already be gone.
  for (auto& [id, call] : pending_) {
    call.timer->cancel();
  }
  pending_.clear();
  abandon_session();
}

void ObsWebSocketClient::async_connect(ConnectHandler handler) {
  if (session_ != nullptr) {
    drop_session("reconnecting");
  }
  last_error_.clear();

  auto session = std::make_shared<Session>(io_);
  session->on_connect = std::move(handler);
  session_ = session;

  // One budget for the whole handshake, from resolve to Identified.
  session->deadline.expires_after(options_.io_timeout);
  session->deadline.async_wait([session](const boost::system::error_code& ec) {
    if (ec || session->identified || session->abandoned) {
      return;
    }
    session->timed_out = true;
    session->close_transport();
  });

  const std::string port = std::to_string(options_.port);
  session->resolver.async_resolve(
      options_.host, port, [this, session, port](const beast::error_code& ec, tcp::resolver::results_type results) {
        if (session->abandoned) {
          return;
        }
        if (ec) {
          finish_connect(session, false, "resolve " + options_.host + ": " + ec.message());
          return;
        }

        session->phase = "connecting";
        beast::get_lowest_layer(session->stream)
            .async_connect(results, [this, session, port](const beast::error_code& ec, const tcp::endpoint&) {
              if (session->abandoned) {
                return;
              }
              if (ec) {
                finish_connect(session, false, "connect " + options_.host + ":" + port + ": " + ec.message());
                return;
              }

              session->stream.set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
                request.set(beast::http::field::sec_websocket_protocol, obs::kSubprotocol);
                request.set(beast::http::field::user_agent, "obs-remote");
              }));

              session->phase = "websocket handshake";
              session->stream.async_handshake(options_.host + ":" + port, "/",
                                              [this, session](const beast::error_code& ec) {
                                                if (session->abandoned) {
                                                  return;
                                                }
                                                if (ec) {
                                                  finish_connect(session, false, "websocket handshake: " + ec.message());
                                                  return;
                                                }
                                                session->stream.text(true);
                                                read_hello(session);
                                              });
            });
      });
}

bool ObsWebSocketClient::connected() const { return session_ != nullptr && session_->identified; }

void ObsWebSocketClient::async_call(const std::string& request_type, const nlohmann::json& request_data,
                                    CallHandler handler) {
  if (!connected()) {
    boost::asio::post(io_, [handler = std::move(handler)]() {
      CallResponse response{};
      response.error = "not connected";
      handler(response);
    });
    return;
  }

  const std::string request_id = std::to_string(next_request_id_++);
  auto session = session_;
  auto timer = std::make_shared<boost::asio::steady_timer>(io_, options_.io_timeout);
  timer->async_wait([this, session, request_id, request_type](const boost::system::error_code& ec) {
    if (ec || session->abandoned || pending_.count(request_id) == 0) {
      return;
    }
    drop_session("timed out waiting for " + request_type + " response");
  });

  pending_[request_id] = PendingCall{request_type, std::move(handler), timer};
  send(session, obs::make_request(request_type, request_id, request_data).dump());
}

std::string ObsWebSocketClient::last_error() const { return last_error_; }

void ObsWebSocketClient::read_hello(const SessionPtr& session) {
  session->phase = "waiting for Hello";
  session->stream.async_read(session->buffer, [this, session](const beast::error_code& ec, std::size_t) {
    if (session->abandoned) {
      return;
    }
    if (ec) {
      finish_connect(session, false, describe_read_error(session, ec));
      return;
    }

    const std::string text = beast::buffers_to_string(session->buffer.data());
    session->buffer.consume(session->buffer.size());
    try {
      send_identify(session, nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& ex) {
      finish_connect(session, false, std::string("malformed handshake message: ") + ex.what());
    } catch (const std::invalid_argument& ex) {
      finish_connect(session, false, std::string("unexpected handshake message: ") + ex.what());
    }
  });
}

void ObsWebSocketClient::send_identify(const SessionPtr& session, const nlohmann::json& hello_message) {
  const auto hello = obs::parse_hello(hello_message);
  if (hello.rpc_version < obs::kRpcVersion) {
    finish_connect(session, false, "server rpcVersion " + std::to_string(hello.rpc_version) + " is not supported");
    return;
  }
  if (hello.challenge.has_value() && options_.password.empty()) {
    std::cerr << "[obs] server requires authentication but no password was given\n";
  }

  auto payload = std::make_shared<std::string>(obs::make_identify(hello, options_.password).dump());
  session->phase = "sending Identify";
  session->stream.async_write(boost::asio::buffer(*payload),
                              [this, session, payload](const beast::error_code& ec, std::size_t) {
                                if (session->abandoned) {
                                  return;
                                }
                                if (ec) {
                                  finish_connect(session, false, "send: " + ec.message());
                                  return;
                                }
                                read_identified(session);
                              });
}

void ObsWebSocketClient::read_identified(const SessionPtr& session) {
  session->phase = "waiting for Identified";
  session->stream.async_read(session->buffer, [this, session](const beast::error_code& ec, std::size_t) {
    if (session->abandoned) {
      return;
    }
    if (ec) {
      // OBS closes the socket with code 4009 when authentication fails.
      finish_connect(session, false, describe_read_error(session, ec));
      return;
    }

    const std::string text = beast::buffers_to_string(session->buffer.data());
    session->buffer.consume(session->buffer.size());
    try {
      const int op = obs::message_op(nlohmann::json::parse(text));
      if (op != obs::kOpIdentified) {
        finish_connect(session, false, "expected Identified, got op " + std::to_string(op));
        return;
      }
    } catch (const nlohmann::json::exception& ex) {
      finish_connect(session, false, std::string("malformed handshake message: ") + ex.what());
      return;
    } catch (const std::invalid_argument& ex) {
      finish_connect(session, false, std::string("unexpected handshake message: ") + ex.what());
      return;
    }

    finish_connect(session, true, {});
  });
}

void ObsWebSocketClient::finish_connect(const SessionPtr& session, const bool ok, const std::string& error) {
  if (session->abandoned) {
    return;
  }
  session->deadline.cancel();

  auto handler = std::move(session->on_connect);
  session->on_connect = nullptr;

  if (ok) {
    session->identified = true;
    read_loop(session);
  } else {
    last_error_ = session->timed_out ? std::string("timed out during ") + session->phase : error;
    abandon_session();
  }

  if (handler) {
    handler(ok);
  }
}

void ObsWebSocketClient::read_loop(const SessionPtr& session) {
  session->stream.async_read(session->buffer, [this, session](const beast::error_code& ec, std::size_t) {
    if (session->abandoned) {
      return;
    }
    if (ec) {
      drop_session(describe_read_error(session, ec));
      return;
    }

    const std::string text = beast::buffers_to_string(session->buffer.data());
    session->buffer.consume(session->buffer.size());
    try {
      dispatch_response(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& ex) {
      drop_session(std::string("malformed message: ") + ex.what());
      return;
    } catch (const std::invalid_argument& ex) {
      drop_session(std::string("unexpected message: ") + ex.what());
      return;
    }

    // A response handler may have reconnected or dropped this session.
    if (!session->abandoned) {
      read_loop(session);
    }
  });
}

void ObsWebSocketClient::dispatch_response(const nlohmann::json& message) {
  // Events and responses to abandoned requests are skipped.
  if (obs::message_op(message) != obs::kOpRequestResponse) {
    return;
  }
  const auto result = obs::parse_request_response(message);
  const auto it = pending_.find(result.request_id);
  if (it == pending_.end()) {
    return;
  }

  PendingCall call = std::move(it->second);
  pending_.erase(it);
  call.timer->cancel();

  CallResponse response{};
  response.ok = result.ok;
  response.data = result.data;
  if (!result.ok) {
    response.error = "request " + call.request_type + " failed with code " + std::to_string(result.code) +
                     (result.comment.empty() ? std::string{} : ": " + result.comment);
  }
  call.handler(response);
}

void ObsWebSocketClient::send(const SessionPtr& session, std::string payload) {
  session->outbox.push_back(std::move(payload));
  if (!session->writing) {
    write_next(session);
  }
}

void ObsWebSocketClient::write_next(const SessionPtr& session) {
  if (session->outbox.empty()) {
    session->writing = false;
    return;
  }

  session->writing = true;
  session->stream.async_write(boost::asio::buffer(session->outbox.front()),
                              [this, session](const beast::error_code& ec, std::size_t) {
                                if (session->abandoned) {
                                  return;
                                }
                                if (ec) {
                                  drop_session("send: " + ec.message());
                                  return;
                                }
                                session->outbox.pop_front();
                                write_next(session);
                              });
}

std::string ObsWebSocketClient::describe_read_error(const SessionPtr& session,
                                                    const boost::system::error_code& ec) const {
  if (ec != websocket::error::closed) {
    return "receive: " + ec.message();
  }
  const auto& reason = session->stream.reason();
  return "closed by server (code " + std::to_string(static_cast<unsigned>(reason.code)) + ")" +
         (reason.reason.empty() ? std::string{} : ": " + std::string(reason.reason.data(), reason.reason.size()));
}

void ObsWebSocketClient::drop_session(const std::string& reason) {
  last_error_ = reason;

  auto session = session_;
  abandon_session();

  ConnectHandler on_connect;
  if (session != nullptr) {
    on_connect = std::move(session->on_connect);
    session->on_connect = nullptr;
  }
  auto pending = std::move(pending_);
  pending_.clear();

  if (on_connect) {
    on_connect(false);
  }
  for (auto& [id, call] : pending) {
    call.timer->cancel();
    CallResponse response{};
    response.error = reason;
    call.handler(response);
  }
}

void ObsWebSocketClient::abandon_session() {
  if (session_ == nullptr) {
    return;
  }
  session_->abandoned = true;
  session_->deadline.cancel();
  session_->close_transport();
  session_.reset();
}

}  // namespace obs_remote::control
