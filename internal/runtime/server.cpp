#include "server.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/runtime/connection.hpp"
#include "internal/runtime/router.hpp"
#include "internal/wire/wire_error.hpp"

namespace booking::runtime {

namespace {

constexpr int kAcceptPollMs = 100;
constexpr int kBacklog      = 128;

void SplitHostPort(const std::string& address, std::string* host, std::string* port) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon + 1 == address.size()) {
    throw std::runtime_error("bind address '" + address + "' must be host:port");
  }
  *host = address.substr(0, colon);
  *port = address.substr(colon + 1);
  if (host->size() >= 2 && host->front() == '[' && host->back() == ']') {
    *host = host->substr(1, host->size() - 2);
  }
}

std::string PeerName(const sockaddr_storage& addr) {
  char host[NI_MAXHOST];
  char port[NI_MAXSERV];
  if (::getnameinfo(reinterpret_cast<const sockaddr*>(&addr), sizeof(addr), host, sizeof(host), port, sizeof(port),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
    return "unknown";
  }
  return std::string(host) + ":" + port;
}

} // namespace

Server::Server(ServerOptions options, std::shared_ptr<Router> router)
    : options_(std::move(options)), router_(std::move(router)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  std::string host;
  std::string port;
  SplitHostPort(options_.bind_address, &host, &port);

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags    = AI_PASSIVE;

  addrinfo* result = nullptr;
  if (int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &result); rc != 0) {
    throw std::runtime_error("cannot resolve " + options_.bind_address + ": " + ::gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(result, &::freeaddrinfo);

  int fd = -1;
  for (auto* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;

    int yes = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, kBacklog) == 0) {
      break;
    }
    ::close(fd);
    fd = -1;
  }
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "cannot listen on " + options_.bind_address);
  }

  sockaddr_storage bound{};
  socklen_t        bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    if (bound.ss_family == AF_INET) {
      port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
    } else if (bound.ss_family == AF_INET6) {
      port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
    }
  }

  listen_fd_ = fd;
  stopping_.store(false);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = true;
  }
  accept_thread_ = std::thread(&Server::AcceptLoop, this);

  BOOKING_LOG_INFO("listener started", {observability::StringField("service", options_.service),
                                        observability::StringField("bind_address", options_.bind_address),
                                        observability::IntField("port", port_)});
}

void Server::AcceptLoop() {
  while (!stopping_.load()) {
    ReapFinished();

    pollfd    pfd{listen_fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, kAcceptPollMs);
    if (ready <= 0) {
      continue;
    }

    sockaddr_storage addr{};
    socklen_t        addr_len = sizeof(addr);
    const int        fd       = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len);
    if (fd < 0) {
      if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
        BOOKING_LOG_WARN("accept failed", {observability::StringField("service", options_.service),
                                           observability::StringField("error", std::strerror(errno))});
      }
      continue;
    }

    auto peer = PeerName(addr);
    if (active_.load() >= options_.max_connections) {
      BOOKING_LOG_WARN("connection limit reached, closing client",
                       {observability::StringField("service", options_.service), observability::StringField("peer", peer),
                        observability::IntField("max_connections", static_cast<int64_t>(options_.max_connections))});
      ::close(fd);
      continue;
    }

    ++active_;
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto&                       worker = workers_.emplace_back();
    worker.thread                      = std::thread(&Server::Serve, this, fd, std::move(peer), &worker);
  }
}

void Server::Serve(int fd, std::string peer, Worker* worker) {
  {
    Connection conn(fd, peer, options_.io_timeout, options_.max_frame_bytes, stopping_);
    BOOKING_LOG_INFO("connection opened",
                     {observability::StringField("service", options_.service), observability::StringField("peer", peer)});

    try {
      while (auto frame = conn.ReadFrame()) {
        conn.Write(router_->HandleFrame(options_.service, *frame));
      }
    } catch (const wire::FrameError& e) {
      BOOKING_LOG_WARN("malformed frame, closing connection",
                       {observability::StringField("peer", peer),
                        observability::StringField("kind", wire::ToString(e.Kind())),
                        observability::StringField("error", e.what())});
      try {
        conn.Write(wire::Encode(options_.service, wire::ErrorPayload(e)));
      } catch (const std::system_error& write_error) {
        BOOKING_LOG_WARN("could not report malformed frame",
                         {observability::StringField("peer", peer), observability::StringField("error", write_error.what())});
      }
    } catch (const std::system_error& e) {
      BOOKING_LOG_WARN("connection failed",
                       {observability::StringField("peer", peer), observability::StringField("error", e.what())});
    } catch (const std::exception& e) {
      BOOKING_LOG_ERROR("connection worker aborted",
                        {observability::StringField("peer", peer), observability::StringField("error", e.what())});
    }

    BOOKING_LOG_INFO("connection closed",
                     {observability::StringField("service", options_.service), observability::StringField("peer", peer)});
  }

  --active_;
  worker->done.store(true);
}

void Server::ReapFinished() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done.load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void Server::Wait() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait(lock, [this] { return !running_; });
}

void Server::Stop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!running_) {
      return;
    }
  }

  stopping_.store(true);
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }

  // Workers notice stopping_ between requests and return on their own.
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
      if (worker.thread.joinable()) {
        worker.thread.join();
      }
    }
    workers_.clear();
  }

  BOOKING_LOG_INFO("listener stopped", {observability::StringField("service", options_.service)});

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = false;
  }
  state_cv_.notify_all();
}

} // namespace booking::runtime
