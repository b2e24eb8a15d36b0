#include <ctxsync/authenticator.hpp>
#include <ctxsync/broadcast.hpp>
#include <ctxsync/context_store.hpp>
#include <ctxsync/message_router.hpp>
#include <ctxsync/protocol.hpp>
#include <ctxsync/server.hpp>
#include <ctxsync/session_registry.hpp>

#include "server/websocket_transport.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace ctxsync {

namespace {

using ConnectionHdl = websocketpp::connection_hdl;
using MessagePtr = WebSocketEndpoint::message_ptr;

CtxResult<std::string> randomSecret() {
  std::array<unsigned char, 32> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return tl::make_unexpected(CtxError::Unspecified);
  }
  static constexpr char kHex[] = "0123456789abcdef";
  std::string secret;
  secret.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    secret.push_back(kHex[byte >> 4]);
    secret.push_back(kHex[byte & 0x0f]);
  }
  return secret;
}

template<typename Fn>
void guarded(const char* what, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& exc) {
    warn() << what << " handler failed: " << exc.what();
  }
}

}  // namespace

class ContextServer::Impl {
public:
  Impl(ContextServerOptions&& options, std::unique_ptr<KeySource> key_source)
      : options_(std::move(options))
      , store_(options_.max_tokens, TokenAccountant(options_.bytes_per_token))
      , registry_(options_.idle_timeout)
      , authenticator_(std::move(key_source), authenticatorOptions(options_))
      , broadcaster_(store_, registry_, BroadcastOptions{options_.send_timeout})
      , router_(store_, registry_, authenticator_, broadcaster_, RouterOptions{options_.elevated_roles}) {}

  Impl(const Impl&) = delete;
  Impl& operator=(const Impl&) = delete;
  Impl(Impl&&) = delete;
  Impl& operator=(Impl&&) = delete;

  ~Impl() {
    stop();
  }

  CtxError start();
  CtxError stop();
  [[nodiscard]] ServerStatus status() const;

  [[nodiscard]] uint16_t port() const {
    return port_;
  }

private:
  struct Connection {
    std::shared_ptr<WebSocketTransport> transport;
    // Empty until the connection has authenticated.
    std::string client_id;
    WebSocketEndpoint::timer_ptr auth_timer;
  };

  static AuthenticatorOptions authenticatorOptions(const ContextServerOptions& options) {
    AuthenticatorOptions auth;
    auth.issuer = options.issuer;
    auth.audience = options.audience;
    auth.refresh_cooldown = options.key_refresh_cooldown;
    return auth;
  }

  void onOpen(const ConnectionHdl& hdl);
  void onClose(const ConnectionHdl& hdl);
  void onMessage(const ConnectionHdl& hdl, const MessagePtr& msg);
  void onAuthTimeout(const ConnectionHdl& hdl);
  void handleUnauthenticated(
    const ConnectionHdl& hdl, const std::shared_ptr<WebSocketTransport>& transport,
    const std::string& payload
  );
  void authenticate(const ConnectionHdl& hdl, const std::string& token);
  void scheduleSweep();
  void sweepIdle();
  static void reply(const std::shared_ptr<WebSocketTransport>& transport, const nlohmann::json& message);

  ContextServerOptions options_;
  ContextStore store_;
  SessionRegistry registry_;
  Authenticator authenticator_;
  BroadcastEngine broadcaster_;
  MessageRouter router_;

  WebSocketEndpoint endpoint_;
  std::vector<std::thread> workers_;
  uint16_t port_ = 0;

  mutable std::mutex mutex_;
  std::map<ConnectionHdl, Connection, std::owner_less<ConnectionHdl>> connections_;
  WebSocketEndpoint::timer_ptr sweep_timer_;
  bool started_ = false;
  bool stopped_ = false;
};

CtxError ContextServer::Impl::start() {
  endpoint_.clear_access_channels(websocketpp::log::alevel::all);
  endpoint_.clear_error_channels(websocketpp::log::elevel::all);

  std::error_code ec;
  endpoint_.init_asio(ec);
  if (ec) {
    error() << "failed to initialize network loop: " << ec.message();
    return CtxError::Unspecified;
  }
  endpoint_.set_reuse_addr(true);
  endpoint_.set_open_handler([this](ConnectionHdl hdl) {
    guarded("open", [&] {
      onOpen(hdl);
    });
  });
  endpoint_.set_close_handler([this](ConnectionHdl hdl) {
    guarded("close", [&] {
      onClose(hdl);
    });
  });
  endpoint_.set_fail_handler([this](ConnectionHdl hdl) {
    guarded("fail", [&] {
      onClose(hdl);
    });
  });
  endpoint_.set_message_handler([this](ConnectionHdl hdl, MessagePtr msg) {
    guarded("message", [&] {
      onMessage(hdl, msg);
    });
  });

  endpoint_.listen(options_.host, std::to_string(options_.port), ec);
  if (ec) {
    error() << "failed to bind " << options_.host << ":" << options_.port << ": " << ec.message();
    return CtxError::Bind;
  }
  endpoint_.start_accept(ec);
  if (ec) {
    error() << "failed to accept connections: " << ec.message();
    return CtxError::Bind;
  }

  websocketpp::lib::asio::error_code asio_ec;
  auto local = endpoint_.get_local_endpoint(asio_ec);
  if (asio_ec) {
    error() << "failed to read local endpoint: " << asio_ec.message();
    return CtxError::Bind;
  }
  port_ = local.port();

  {
    std::scoped_lock lock{mutex_};
    started_ = true;
  }
  scheduleSweep();

  size_t threads = std::max<size_t>(1, options_.worker_threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] {
      try {
        endpoint_.run();
      } catch (const std::exception& exc) {
        error() << "network loop stopped: " << exc.what();
      }
    });
  }
  info() << "context server listening on " << options_.host << ":" << port_ << " (max_tokens "
         << options_.max_tokens << ")";
  return CtxError::Ok;
}

CtxError ContextServer::Impl::stop() {
  std::vector<std::shared_ptr<WebSocketTransport>> open;
  {
    std::scoped_lock lock{mutex_};
    if (!started_ || stopped_) {
      return CtxError::Ok;
    }
    stopped_ = true;
    if (sweep_timer_) {
      sweep_timer_->cancel();
    }
    for (auto& [hdl, connection] : connections_) {
      if (connection.auth_timer) {
        connection.auth_timer->cancel();
      }
      open.push_back(connection.transport);
    }
  }

  std::error_code ec;
  endpoint_.stop_listening(ec);
  if (ec) {
    warn() << "failed to stop listening: " << ec.message();
  }
  for (const auto& transport : open) {
    transport->close(CloseCode::GoingAway, "Server shutting down");
  }

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  for (const auto& session : registry_.sessions()) {
    registry_.remove(session.client_id);
  }
  info() << "context server stopped";
  return CtxError::Ok;
}

ServerStatus ContextServer::Impl::status() const {
  auto snapshot = store_.get();
  ServerStatus status;
  status.entry_count = snapshot.entryCount();
  status.total_tokens = snapshot.total_tokens;
  status.max_tokens = snapshot.max_tokens;
  status.version = snapshot.version;
  status.evicted_total = snapshot.evicted_total;
  for (const auto& session : registry_.sessions()) {
    status.sessions.push_back(SessionStatus{
      session.client_id,
      session.principal.user_id,
      session.principal.role,
      session.authenticated_at,
      session.last_activity,
    });
  }
  status.connected_sessions = status.sessions.size();
  return status;
}

void ContextServer::Impl::onOpen(const ConnectionHdl& hdl) {
  std::error_code ec;
  auto connection = endpoint_.get_con_from_hdl(hdl, ec);
  if (ec) {
    return;
  }
  auto remote = connection->get_remote_endpoint();
  auto transport = std::make_shared<WebSocketTransport>(
    endpoint_, hdl, remote, options_.max_pending_send_bytes
  );

  auto token = extractBearerToken(connection->get_request_header("Authorization"));
  if (!token) {
    token = extractQueryToken(connection->get_resource());
  }

  {
    std::scoped_lock lock{mutex_};
    if (stopped_) {
      transport->close(CloseCode::GoingAway, "Server shutting down");
      return;
    }
    Connection state{transport, {}, nullptr};
    if (!token) {
      auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options_.auth_timeout);
      state.auth_timer = endpoint_.set_timer(timeout.count(), [this, hdl](const std::error_code& ec) {
        if (ec) {
          return;
        }
        guarded("authentication timer", [&] {
          onAuthTimeout(hdl);
        });
      });
    }
    connections_.emplace(hdl, std::move(state));
  }
  debug() << "connection opened from " << remote;

  if (token) {
    authenticate(hdl, *token);
  }
}

void ContextServer::Impl::onClose(const ConnectionHdl& hdl) {
  Connection state;
  {
    std::scoped_lock lock{mutex_};
    auto it = connections_.find(hdl);
    if (it == connections_.end()) {
      return;
    }
    state = std::move(it->second);
    connections_.erase(it);
  }
  if (state.auth_timer) {
    state.auth_timer->cancel();
  }
  if (!state.client_id.empty() && registry_.remove(state.client_id)) {
    info() << "client " << state.client_id << " disconnected";
  }
}

void ContextServer::Impl::onMessage(const ConnectionHdl& hdl, const MessagePtr& msg) {
  std::shared_ptr<WebSocketTransport> transport;
  std::string client_id;
  {
    std::scoped_lock lock{mutex_};
    auto it = connections_.find(hdl);
    if (it == connections_.end()) {
      return;
    }
    transport = it->second.transport;
    client_id = it->second.client_id;
  }

  if (msg->get_opcode() != websocketpp::frame::opcode::text) {
    reply(
      transport,
      protocol::errorMessage(CtxError::ValidationError, "Only text messages are supported")
    );
    return;
  }
  if (client_id.empty()) {
    handleUnauthenticated(hdl, transport, msg->get_payload());
    return;
  }
  reply(transport, router_.handle(client_id, msg->get_payload()));
}

void ContextServer::Impl::onAuthTimeout(const ConnectionHdl& hdl) {
  std::shared_ptr<WebSocketTransport> transport;
  {
    std::scoped_lock lock{mutex_};
    auto it = connections_.find(hdl);
    if (it == connections_.end() || !it->second.client_id.empty()) {
      return;
    }
    transport = it->second.transport;
  }
  info() << "connection from " << transport->remoteEndpoint() << " did not authenticate in time";
  transport->close(CloseCode::AuthenticationTimeout, "Authentication timeout");
}

void ContextServer::Impl::handleUnauthenticated(
  const ConnectionHdl& hdl, const std::shared_ptr<WebSocketTransport>& transport,
  const std::string& payload
) {
  auto message = nlohmann::json::parse(payload, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    reply(transport, protocol::errorMessage(CtxError::ValidationError, "Invalid JSON"));
    return;
  }
  std::string type;
  if (auto it = message.find("type"); it != message.end() && it->is_string()) {
    type = it->get<std::string>();
  }
  if (type != protocol::kAuthenticate) {
    reply(
      transport,
      protocol::errorMessage(CtxError::AuthenticationError, "Client not authenticated", type)
    );
    return;
  }
  auto token = message.find("token");
  if (token == message.end() || !token->is_string() || token->get_ref<const std::string&>().empty()) {
    info() << "connection from " << transport->remoteEndpoint() << " sent no token";
    transport->close(CloseCode::InvalidCredential, "Missing token");
    return;
  }
  authenticate(hdl, token->get<std::string>());
}

void ContextServer::Impl::authenticate(const ConnectionHdl& hdl, const std::string& token) {
  std::shared_ptr<WebSocketTransport> transport;
  {
    std::scoped_lock lock{mutex_};
    auto it = connections_.find(hdl);
    if (it == connections_.end() || !it->second.client_id.empty()) {
      return;
    }
    transport = it->second.transport;
  }

  auto credential = authenticator_.verify(token);
  if (!credential.has_value()) {
    if (credential.error() == CtxError::CredentialExpired) {
      info() << "rejecting connection from " << transport->remoteEndpoint() << ": token expired";
      transport->close(CloseCode::CredentialExpired, "Token expired");
    } else {
      info() << "rejecting connection from " << transport->remoteEndpoint() << ": invalid token";
      transport->close(CloseCode::InvalidCredential, "Invalid token");
    }
    return;
  }

  auto now = Clock::now();
  Session session;
  session.client_id = registry_.nextClientId(transport->remoteEndpoint());
  session.principal = std::move(credential->principal);
  session.authenticated_at = now;
  session.last_activity = now;
  session.credential_expires_at = credential->expires_at;
  session.transport = transport;
  const auto client_id = session.client_id;
  auto greeting = protocol::authSuccessMessage(session, store_.maxTokens());
  const auto user_id = session.principal.user_id;

  // Sent before registration, so no broadcast can overtake it.
  reply(transport, greeting);
  if (auto err = registry_.add(std::move(session)); err != CtxError::Ok) {
    error() << "failed to register client " << client_id << ": " << strerror(err);
    transport->close(CloseCode::GoingAway, "Registration failed");
    return;
  }

  WebSocketEndpoint::timer_ptr timer;
  {
    std::scoped_lock lock{mutex_};
    auto it = connections_.find(hdl);
    if (it == connections_.end()) {
      // Closed while verifying.
      registry_.remove(client_id);
      return;
    }
    it->second.client_id = client_id;
    timer = std::move(it->second.auth_timer);
  }
  if (timer) {
    timer->cancel();
  }
  info() << "client " << client_id << " authenticated as " << user_id << " from "
         << transport->remoteEndpoint();

  reply(transport, protocol::snapshotMessage(store_.get(), protocol::kContext));
}

void ContextServer::Impl::scheduleSweep() {
  auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(options_.sweep_interval);
  std::scoped_lock lock{mutex_};
  if (stopped_) {
    return;
  }
  sweep_timer_ = endpoint_.set_timer(interval.count(), [this](const std::error_code& ec) {
    if (ec) {
      return;
    }
    guarded("idle sweep", [&] {
      sweepIdle();
    });
    scheduleSweep();
  });
}

void ContextServer::Impl::sweepIdle() {
  auto expired = registry_.sweepIdle();
  for (const auto& session : expired) {
    info() << "closing idle session " << session.client_id << " of user "
           << session.principal.user_id;
    session.transport->close(CloseCode::IdleTimeout, "Idle timeout");
  }
  if (!expired.empty()) {
    debug() << "idle sweep removed " << expired.size() << " sessions, " << registry_.size()
            << " remain";
  }
}

void ContextServer::Impl::reply(
  const std::shared_ptr<WebSocketTransport>& transport, const nlohmann::json& message
) {
  if (auto err = transport->send(message.dump()); err != CtxError::Ok) {
    debug() << "reply to " << transport->remoteEndpoint() << " not sent: " << strerror(err);
  }
}

CtxResult<ContextServer> ContextServer::create(
  ContextServerOptions&& options  // NOLINT(cppcoreguidelines-rvalue-reference-param-not-moved)
) {
  if (options.max_tokens == 0) {
    error() << "max_tokens must be positive";
    return tl::make_unexpected(CtxError::ConfigError);
  }
  std::unique_ptr<KeySource> key_source = std::move(options.key_source);
  if (!key_source) {
    auto secret = randomSecret();
    if (!secret.has_value()) {
      return tl::make_unexpected(secret.error());
    }
    warn() << "no credential verification key configured; generated a random secret, so no "
              "client can authenticate";
    key_source = std::make_unique<SecretKeySource>(std::move(*secret));
  }

  auto impl = std::make_unique<Impl>(std::move(options), std::move(key_source));
  if (auto err = impl->start(); err != CtxError::Ok) {
    return tl::make_unexpected(err);
  }
  return ContextServer(std::move(impl));
}

ContextServer::ContextServer(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

ContextServer::ContextServer(ContextServer&&) noexcept = default;
ContextServer& ContextServer::operator=(ContextServer&&) noexcept = default;
ContextServer::~ContextServer() = default;

uint16_t ContextServer::port() const {
  if (!impl_) {
    return 0;
  }
  return impl_->port();
}

CtxError ContextServer::stop() {
  if (!impl_) {
    return CtxError::Ok;
  }
  return impl_->stop();
}

ServerStatus ContextServer::status() const {
  if (!impl_) {
    return ServerStatus{};
  }
  return impl_->status();
}

}  // namespace ctxsync
