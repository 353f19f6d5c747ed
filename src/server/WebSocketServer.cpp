#include "collab/server/WebSocketServer.hpp"
#include "collab/server/ClientSession.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>

#include <vector>

namespace collab {

namespace beast = boost::beast;
namespace net   = boost::asio;

WebSocketServer::WebSocketServer(net::io_context& ioc,
                                 core::CollaborationHub* hub,
                                 const auth::SessionAuthenticator* authenticator,
                                 rt::ThreadPool* pool,
                                 Options opts)
  : ioc_(ioc)
  , acceptor_(net::make_strand(ioc))
  , hub_(hub)
  , authenticator_(authenticator)
  , pool_(pool)
  , opts_(std::move(opts))
{}

bool WebSocketServer::run() {
  beast::error_code ec;

  const auto address = net::ip::make_address(opts_.address, ec);
  if (ec) {
    util::logger().log(util::LogLevel::Error, "server.bad_address",
                       {{"address", opts_.address}, {"error", ec.message()}});
    return false;
  }
  const tcp::endpoint endpoint{address, opts_.port};

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    util::logger().log(util::LogLevel::Error, "server.listen_failed",
                       {{"address", opts_.address},
                        {"port", std::to_string(opts_.port)},
                        {"error", ec.message()}});
    return false;
  }

  boundPort_ = acceptor_.local_endpoint(ec).port();
  accepting_.store(true, std::memory_order_relaxed);
  util::logger().log(util::LogLevel::Info, "server.listening",
                     {{"address", opts_.address}, {"port", std::to_string(boundPort_)}});
  doAccept();
  return true;
}

void WebSocketServer::doAccept() {
  if (!accepting_.load(std::memory_order_relaxed)) return;
  acceptor_.async_accept(
      net::make_strand(ioc_),
      [this](beast::error_code ec, tcp::socket socket) {
        onAccept(ec, std::move(socket));
      });
}

void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (!accepting_.load(std::memory_order_relaxed)) return;
  if (ec) {
    util::logger().log(util::LogLevel::Warn, "server.accept_failed", {{"error", ec.message()}});
  } else {
    COLLAB_METRIC_HIT("server.accepted");
    auto session = std::make_shared<ClientSession>(std::move(socket), this, hub_,
                                                   authenticator_, pool_, opts_.allowQueryToken);
    registerSession(session);
    session->run();
  }
  doAccept();
}

void WebSocketServer::registerSession(const std::shared_ptr<ClientSession>& s) {
  if (!s) return;
  std::lock_guard<std::mutex> lk(sessions_mu_);
  sessions_[s.get()] = s;
}

void WebSocketServer::unregisterSession(ClientSession* s) noexcept {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  (void)sessions_.erase(s);
}

std::size_t WebSocketServer::sessionCount() const {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  return sessions_.size();
}

void WebSocketServer::stopAccept() noexcept {
  if (!accepting_.exchange(false, std::memory_order_relaxed)) return;
  beast::error_code ec;
  // Cancel any pending async_accept and close the acceptor; both are idempotent.
  acceptor_.cancel(ec);
  acceptor_.close(ec);
  util::logger().log(util::LogLevel::Info, "server.accept_stopped");
}

void WebSocketServer::closeAll() noexcept {
  // Snapshot to call stop() without holding the mutex.
  std::vector<std::shared_ptr<ClientSession>> to_close;
  {
    std::lock_guard<std::mutex> lk(sessions_mu_);
    to_close.reserve(sessions_.size());
    for (auto& kv : sessions_) {
      if (auto sp = kv.second.lock()) {
        to_close.emplace_back(std::move(sp));
      }
    }
  }
  // Each session unregisters itself once closed.
  for (auto& s : to_close) {
    s->stop();
  }
}

} // namespace collab
