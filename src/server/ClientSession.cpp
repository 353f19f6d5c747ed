#include "collab/server/ClientSession.hpp"
#include "collab/server/WebSocketServer.hpp"
#include "collab/auth/SessionAuthenticator.hpp"
#include "collab/core/CollaborationHub.hpp"
#include "collab/rt/ThreadPool.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <string_view>
#include <exception>

namespace collab {

namespace websocket = boost::beast::websocket;
namespace beast     = boost::beast;
namespace http      = boost::beast::http;
namespace net       = boost::asio;

ClientSession::ClientSession(tcp::socket socket,
                             WebSocketServer* server,
                             core::CollaborationHub* hub,
                             const auth::SessionAuthenticator* authenticator,
                             rt::ThreadPool* pool,
                             bool allowQueryToken)
  : server_(server)
  , hub_(hub)
  , authenticator_(authenticator)
  , pool_(pool)
  , allowQueryToken_(allowQueryToken)
  , ws_(std::move(socket))
{}

void ClientSession::run() {
  // Run on the stream's strand.
  net::dispatch(ws_.get_executor(), [self = shared_from_this()]{ self->doReadRequest(); });
}

void ClientSession::doReadRequest() {
  beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
  http::async_read(
      ws_.next_layer(), buffer_, req_,
      [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->onReadRequest(ec, bytes);
      });
}

void ClientSession::onReadRequest(beast::error_code ec, std::size_t) {
  if (ec) {
    if (ec != http::error::end_of_stream) {
      util::logger().log(util::LogLevel::Debug, "session.read_request_failed",
                         {{"error", ec.message()}});
    }
    if (server_) server_->unregisterSession(this);
    return;
  }

  if (!websocket::is_upgrade(req_)) {
    reject(http::status::upgrade_required, "WebSocket upgrade required");
    return;
  }

  const auto authorization = req_[http::field::authorization];
  const auto target = req_.target();
  const std::string credential = auth::SessionAuthenticator::extractCredential(
      std::string_view(authorization.data(), authorization.size()),
      std::string_view(target.data(), target.size()),
      allowQueryToken_);

  auto work = [self = shared_from_this(), credential]() {
    Result<Identity> result = Error{"Authenticator not configured", "unavailable"};
    if (self->authenticator_) {
      result = self->authenticator_->authenticate(credential);
    }
    net::post(self->ws_.get_executor(), [self, result]() mutable {
      self->onAuthenticated(std::move(result));
    });
  };

  // Directory lookups may block; keep them off the io thread.
  if (pool_) {
    pool_->post(std::move(work));
  } else {
    work();
  }
}

void ClientSession::onAuthenticated(Result<Identity> result) {
  if (!result) {
    COLLAB_METRIC_HIT("session.unauthorized");
    reject(http::status::unauthorized, result.error().message);
    return;
  }
  identity_ = std::move(result.value());

  beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.set_option(websocket::stream_base::decorator(
      [](websocket::response_type& res) {
        res.set(http::field::server,
                std::string(BOOST_BEAST_VERSION_STRING) + " collabd");
      }));

  ws_.async_accept(
      req_,
      [self = shared_from_this()](beast::error_code ec) { self->onAccept(ec); });
}

void ClientSession::reject(http::status status, const std::string& reason) {
  res_ = std::make_shared<http::response<http::string_body>>(status, req_.version());
  res_->set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " collabd");
  res_->set(http::field::content_type, "text/plain");
  res_->keep_alive(false);
  res_->body() = reason;
  res_->prepare_payload();

  util::logger().log(util::LogLevel::Info, "session.rejected",
                     {{"status", std::to_string(static_cast<unsigned>(status))},
                      {"reason", reason}});

  http::async_write(
      ws_.next_layer(), *res_,
      [self = shared_from_this()](beast::error_code, std::size_t) {
        beast::error_code ec;
        beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, ec);
        if (self->server_) self->server_->unregisterSession(self.get());
      });
}

void ClientSession::onAccept(beast::error_code ec) {
  if (ec) {
    util::logger().log(util::LogLevel::Warn, "session.accept_failed", {{"error", ec.message()}});
    if (server_) server_->unregisterSession(this);
    return;
  }

  connId_ = hub_->nextConnectionId();
  open_ = true;
  if (!hub_->onOpen(connId_, identity_, shared_from_this())) {
    open_ = false;
    if (server_) server_->unregisterSession(this);
    return;
  }

  util::logger().log(util::LogLevel::Info, "session.open",
                     {{"connId", std::to_string(connId_)}, {"userId", identity_.userId}});
  doRead();
  if (!outbox_.empty() && !writing_) doWrite();
}

void ClientSession::doRead() {
  ws_.async_read(
      buffer_,
      [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->onRead(ec, bytes);
      });
}

void ClientSession::onRead(beast::error_code ec, std::size_t) {
  if (ec) {
    if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
      util::logger().log(util::LogLevel::Debug, "session.read_failed",
                         {{"connId", std::to_string(connId_)}, {"error", ec.message()}});
    }
    open_ = false;
    finish();
    return;
  }

  // Extract text frame
  std::string text = beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  hub_->onMessage(connId_, std::move(text));

  // Continue reading
  doRead();
}

void ClientSession::sendText(std::string frame) {
  net::post(ws_.get_executor(),
            [self = shared_from_this(), f = std::move(frame)]() mutable {
    if (!self->open_) return;
    if (self->outbox_.size() >= kMaxOutbox) {
      COLLAB_METRIC_HIT("session.slow_consumer");
      util::logger().log(util::LogLevel::Warn, "session.slow_consumer",
                         {{"connId", std::to_string(self->connId_)}});
      self->close();
      return;
    }
    self->outbox_.emplace_back(std::move(f));
    if (!self->writing_) self->doWrite();
  });
}

void ClientSession::doWrite() {
  if (outbox_.empty() || !open_) {
    writing_ = false;
    return;
  }
  writing_ = true;
  ws_.text(true);
  ws_.async_write(
      net::buffer(outbox_.front()),
      [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->onWrite(ec, bytes);
      });
}

void ClientSession::onWrite(beast::error_code ec, std::size_t) {
  if (ec) {
    util::logger().log(util::LogLevel::Debug, "session.write_failed",
                       {{"connId", std::to_string(connId_)}, {"error", ec.message()}});
    writing_ = false;
    open_ = false;
    finish();
    return;
  }
  outbox_.pop_front();
  doWrite();
}

void ClientSession::close() {
  net::post(ws_.get_executor(), [self = shared_from_this()]{
    bool expected = true;
    if (!self->open_.compare_exchange_strong(expected, false)) return;

    websocket::close_reason cr;
    cr.code   = websocket::close_code::normal;
    cr.reason = "closing";
    self->ws_.async_close(cr, [self](beast::error_code ec) {
      if (ec) {
        util::logger().log(util::LogLevel::Debug, "session.close_failed",
                           {{"connId", std::to_string(self->connId_)}, {"error", ec.message()}});
      }
      self->finish();
    });
  });
}

void ClientSession::stop() noexcept {
  try {
    if (open_) {
      close();
      return;
    }
    // Still in the HTTP phase: drop the socket.
    net::post(ws_.get_executor(), [self = shared_from_this()]{
      beast::error_code ec;
      beast::get_lowest_layer(self->ws_).socket().close(ec);
    });
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Warn, "session.stop_failed", {{"error", ex.what()}});
  }
}

void ClientSession::finish() {
  if (finished_.exchange(true)) return;
  if (connId_ != 0) hub_->onClose(connId_);
  if (server_) server_->unregisterSession(this);
}

} // namespace collab
