#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include <nlohmann/json.hpp>

// Line-delimited JSON over a Unix stream socket. One thread accepts, one
// thread per connection reads requests and writes responses; broadcast()
// pushes an event line to every live connection.
//
// A connection whose peer stops reading is dropped once a write has been
// blocked for SEND_TIMEOUT_MS. broadcast() never waits longer than
// BROADCAST_LOCK_WAIT_MS for a connection that is busy writing.
class ControlServer {
public:
  using RequestHandler = std::function<nlohmann::json(const nlohmann::json&)>;

  static constexpr int ACCEPT_POLL_MS = 250;
  static constexpr size_t MAX_LINE_BYTES = 64 * 1024;
  static constexpr int SEND_TIMEOUT_MS = 2000;
  static constexpr int BROADCAST_LOCK_WAIT_MS = 100;

  ControlServer(std::string socket_path, mode_t permissions, RequestHandler handler);
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  // Binds and starts accepting. False if the socket cannot be set up.
  bool start();

  // Closes every client, then the listener, then removes the socket file.
  void stop();

  void broadcast(const nlohmann::json& event);
  size_t clientCount() const;

  // One wire line. Invalid UTF-8 in strings is replaced, never thrown.
  static std::string Serialize(const nlohmann::json& message);

private:
  struct Client {
    int fd = -1;
    std::timed_mutex write_mutex;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void acceptLoop();
  void serveClient(std::shared_ptr<Client> client);
  bool sendLine(Client& client, const std::string& line);
  static bool WriteLocked(Client& client, const std::string& line);
  void reapFinished();
  static void CloseClient(Client& client);

  std::string _socketPath;
  mode_t _permissions;
  RequestHandler _handler;

  int _listenFd = -1;
  std::atomic<bool> _running{false};
  std::thread _acceptThread;

  mutable std::mutex _clientsMutex;
  std::vector<std::shared_ptr<Client>> _clients;
};
