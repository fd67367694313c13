#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace booking::runtime {

class Router;

struct ServerOptions {
  std::string               service;      // wire tag answered by this listener
  std::string               bind_address; // "host:port"; port 0 picks a free one
  std::chrono::milliseconds io_timeout{30000};
  std::size_t               max_connections = 64;
  std::size_t               max_frame_bytes = 99999 + 5;
};

/*
  One listening socket for one service tag.

  Start binds and launches the accept loop; every accepted client gets a
  worker thread until max_connections are busy. Stop stops accepting,
  lets each connection finish the request it is serving, then joins all
  workers. Wait blocks until Stop has completed.
*/
class Server {
 public:
  Server(ServerOptions options, std::shared_ptr<Router> router);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound, valid after Start.
  uint16_t Port() const {
    return port_;
  }

  const std::string& Service() const {
    return options_.service;
  }

 private:
  struct Worker {
    std::thread       thread;
    std::atomic<bool> done{false};
  };

  void AcceptLoop();
  void Serve(int fd, std::string peer, Worker* worker);
  void ReapFinished();

  ServerOptions           options_;
  std::shared_ptr<Router> router_;

  int                 listen_fd_ = -1;
  uint16_t            port_      = 0;
  std::atomic<bool>   stopping_{false};
  std::thread         accept_thread_;
  std::atomic<size_t> active_{0};

  std::mutex        workers_mutex_;
  std::list<Worker> workers_;

  std::mutex              state_mutex_;
  std::condition_variable state_cv_;
  bool                    running_ = false;
};

} // namespace booking::runtime
