#include "ControlServer.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

using nlohmann::json;

static json error_response(const char* message) {
  return json{ { "status", "error" }, { "message", message } };
}

ControlServer::ControlServer(std::string socket_path, mode_t permissions, RequestHandler handler)
  : _socketPath(std::move(socket_path)),
    _permissions(permissions),
    _handler(std::move(handler)) {}

ControlServer::~ControlServer() {
  stop();
}

// ----------------------------- Lifecycle -----------------------------

bool ControlServer::start() {
  if (_running) return true;

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (_socketPath.size() >= sizeof(addr.sun_path)) {
    spdlog::critical("Socket path too long: {}", _socketPath);
    return false;
  }
  std::strncpy(addr.sun_path, _socketPath.c_str(), sizeof(addr.sun_path) - 1);

  // Remove a stale socket from a previous run
  unlink(_socketPath.c_str());

  _listenFd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (_listenFd < 0) {
    spdlog::critical("Failed to create socket: {}", std::strerror(errno));
    return false;
  }

  if (bind(_listenFd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
    spdlog::critical("Failed to bind socket {}: {}", _socketPath, std::strerror(errno));
    close(_listenFd);
    _listenFd = -1;
    return false;
  }

  if (chmod(_socketPath.c_str(), _permissions) < 0) {
    spdlog::warn("Failed to set socket permissions: {}", std::strerror(errno));
  }

  if (listen(_listenFd, 16) < 0) {
    spdlog::critical("Failed to listen on socket: {}", std::strerror(errno));
    close(_listenFd);
    _listenFd = -1;
    unlink(_socketPath.c_str());
    return false;
  }

  _running = true;
  _acceptThread = std::thread(&ControlServer::acceptLoop, this);
  spdlog::info("Control socket listening on {}", _socketPath);
  return true;
}

void ControlServer::stop() {
  if (!_running.exchange(false)) return;

  if (_acceptThread.joinable()) _acceptThread.join();

  std::vector<std::shared_ptr<Client>> clients;
  {
    std::lock_guard<std::mutex> lock(_clientsMutex);
    clients.swap(_clients);
  }
  // The fd stays valid until CloseClient(); shutting it down without the
  // write lock also releases a writer blocked in send().
  for (auto& c : clients) {
    if (c->fd >= 0) shutdown(c->fd, SHUT_RDWR);
  }
  for (auto& c : clients) {
    if (c->thread.joinable()) c->thread.join();
    CloseClient(*c);
  }

  if (_listenFd >= 0) {
    close(_listenFd);
    _listenFd = -1;
  }
  unlink(_socketPath.c_str());
  spdlog::info("Control socket closed ({} clients disconnected)", clients.size());
}

void ControlServer::CloseClient(Client& client) {
  std::lock_guard<std::timed_mutex> wl(client.write_mutex);
  if (client.fd >= 0) {
    close(client.fd);
    client.fd = -1;
  }
}

// ----------------------------- Accept -----------------------------

void ControlServer::acceptLoop() {
  while (_running) {
    reapFinished();

    struct pollfd pfd{ _listenFd, POLLIN, 0 };
    const int rc = poll(&pfd, 1, ACCEPT_POLL_MS);
    if (rc < 0) {
      if (errno == EINTR) continue;
      spdlog::error("Control socket poll error: {}", std::strerror(errno));
      break;
    }
    if (rc == 0 || !(pfd.revents & POLLIN)) continue;

    const int fd = accept4(_listenFd, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno != EINTR && errno != EAGAIN) {
        spdlog::warn("Failed to accept client: {}", std::strerror(errno));
      }
      continue;
    }

    struct timeval tv;
    tv.tv_sec = SEND_TIMEOUT_MS / 1000;
    tv.tv_usec = (SEND_TIMEOUT_MS % 1000) * 1000;
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
      spdlog::warn("Failed to set client send timeout: {}", std::strerror(errno));
    }

    auto client = std::make_shared<Client>();
    client->fd = fd;
    {
      std::lock_guard<std::mutex> lock(_clientsMutex);
      _clients.push_back(client);
      client->thread = std::thread(&ControlServer::serveClient, this, client);
    }
    spdlog::debug("Client connected (fd {})", fd);
  }
}

void ControlServer::reapFinished() {
  std::vector<std::shared_ptr<Client>> finished;
  {
    std::lock_guard<std::mutex> lock(_clientsMutex);
    for (auto it = _clients.begin(); it != _clients.end();) {
      if ((*it)->done) {
        finished.push_back(*it);
        it = _clients.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& c : finished) {
    if (c->thread.joinable()) c->thread.join();
    CloseClient(*c);
  }
}

size_t ControlServer::clientCount() const {
  std::lock_guard<std::mutex> lock(_clientsMutex);
  size_t n = 0;
  for (const auto& c : _clients) {
    if (!c->done) ++n;
  }
  return n;
}

// ----------------------------- Per-client -----------------------------

std::string ControlServer::Serialize(const json& message) {
  return message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

bool ControlServer::sendLine(Client& client, const std::string& line) {
  std::lock_guard<std::timed_mutex> wl(client.write_mutex);
  return WriteLocked(client, line);
}

// Caller holds write_mutex. A failed or timed-out write ends the connection.
bool ControlServer::WriteLocked(Client& client, const std::string& line) {
  if (client.fd < 0 || client.done) return false;

  size_t off = 0;
  while (off < line.size()) {
    const ssize_t n = send(client.fd, line.data() + off, line.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        spdlog::warn("Client not reading (fd {}), disconnecting", client.fd);
      } else {
        spdlog::debug("Client write failed: {}", std::strerror(errno));
      }
      client.done = true;
      shutdown(client.fd, SHUT_RDWR);
      return false;
    }
    off += (size_t)n;
  }
  return true;
}

void ControlServer::serveClient(std::shared_ptr<Client> client) {
  std::string buffer;
  char chunk[4096];

  // Only CloseClient() changes the fd, after this thread has been joined.
  const int fd = client->fd;

  while (_running && !client->done) {
    struct pollfd pfd{ fd, POLLIN, 0 };
    const int rc = poll(&pfd, 1, ACCEPT_POLL_MS);
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (rc == 0) continue;

    const ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      spdlog::debug("Client read failed: {}", std::strerror(errno));
      break;
    }
    if (n == 0) break;  // peer closed
    buffer.append(chunk, (size_t)n);

    size_t nl;
    bool alive = true;
    while (alive && (nl = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, nl);
      buffer.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.empty()) continue;

      json response;
      json request = json::parse(line, nullptr, false);
      if (request.is_discarded() || !request.is_object()) {
        response = error_response("Invalid JSON");
      } else {
        try {
          response = _handler(request);
        } catch (const std::exception& e) {
          spdlog::error("Request handler error: {}", e.what());
          response = error_response("Internal error");
        }
      }
      alive = sendLine(*client, Serialize(response));
    }
    if (!alive) break;

    if (buffer.size() > MAX_LINE_BYTES) {
      buffer.clear();
      if (!sendLine(*client, Serialize(error_response("Invalid JSON")))) break;
    }
  }

  client->done = true;
  spdlog::debug("Client disconnected");
}

void ControlServer::broadcast(const json& event) {
  const std::string line = Serialize(event);

  std::vector<std::shared_ptr<Client>> clients;
  {
    std::lock_guard<std::mutex> lock(_clientsMutex);
    clients = _clients;
  }
  for (auto& c : clients) {
    if (c->done) continue;

    std::unique_lock<std::timed_mutex> wl(c->write_mutex, std::defer_lock);
    if (!wl.try_lock_for(std::chrono::milliseconds(BROADCAST_LOCK_WAIT_MS))) {
      spdlog::debug("Skipping event for busy client (fd {})", c->fd);
      continue;
    }
    WriteLocked(*c, line);
  }
}
