#ifndef OPSSETUP_OVSDB_FAKE_DB_SERVER_HPP
#define OPSSETUP_OVSDB_FAKE_DB_SERVER_HPP
/**
 * @file FakeDbServer.hpp
 * @brief In-process Unix-socket database stand-in for unit tests.
 *
 * Accepts one connection at a time, frames requests with
 * completeJsonLength() and answers each through a handler.
 */

#include "src/ovsdb/inc/DbClient.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <cstring>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace opssetup {

namespace ovsdb {

/* ----------------------------- Fake Server ----------------------------- */

/// What the server does with one request.
struct Reply {
  std::string data;   ///< Bytes sent back (may be empty)
  bool close{false};  ///< Drop the connection instead of replying
};

/// Single-connection-at-a-time Unix stream server.
class FakeDbServer {
public:
  using Handler = std::function<Reply(const std::string& request)>;

  FakeDbServer(std::string path, Handler handler)
      : path_(std::move(path)), handler_(std::move(handler)) {
    listenFd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
    ::bind(listenFd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    ::listen(listenFd_, 4);
    setTimeout(listenFd_);
    thread_ = std::thread([this]() { serve(); });
  }

  ~FakeDbServer() {
    running_.store(false);
    thread_.join();
    ::close(listenFd_);
  }

  FakeDbServer(const FakeDbServer&) = delete;
  FakeDbServer& operator=(const FakeDbServer&) = delete;

  std::vector<std::string> requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  int accepted() const { return accepted_.load(); }

private:
  static void setTimeout(int fd) {
    struct timeval tv{};
    tv.tv_usec = 20 * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }

  void serve() {
    while (running_.load()) {
      const int CLIENT = ::accept(listenFd_, nullptr, nullptr);
      if (CLIENT < 0) {
        continue;
      }
      accepted_.fetch_add(1);
      setTimeout(CLIENT);
      handleClient(CLIENT);
      ::close(CLIENT);
    }
  }

  void handleClient(int fd) {
    std::string buf;
    char chunk[4096];
    while (running_.load()) {
      const ssize_t N = ::recv(fd, chunk, sizeof(chunk), 0);
      if (N == 0) {
        return;
      }
      if (N < 0) {
        continue;
      }
      buf.append(chunk, static_cast<std::size_t>(N));

      std::size_t len = 0;
      while ((len = completeJsonLength(buf)) > 0) {
        const std::string REQUEST = buf.substr(0, len);
        buf.erase(0, len);
        {
          std::lock_guard<std::mutex> lock(mutex_);
          requests_.push_back(REQUEST);
        }
        const Reply R = handler_(REQUEST);
        if (R.close) {
          return;
        }
        if (!R.data.empty()) {
          ::send(fd, R.data.data(), R.data.size(), MSG_NOSIGNAL);
        }
      }
    }
  }

  std::string path_;
  Handler handler_;
  int listenFd_{-1};
  std::atomic<bool> running_{true};
  std::atomic<int> accepted_{0};
  std::mutex mutex_;
  std::vector<std::string> requests_;
  std::thread thread_;
};

/// Id of a request as JSON text, or empty if it has none.
inline std::string requestId(const std::string& request) {
  const YAML::Node NODE = YAML::Load(request);
  return NODE["id"] ? NODE["id"].Scalar() : std::string();
}

/// Successful single-row reply for a flag column.
inline std::string flagReply(const std::string& id, const std::string& column, int value) {
  return "{\"id\":" + id + ",\"result\":[{\"rows\":[{\"" + column + "\":" +
         std::to_string(value) + "}]}],\"error\":null}";
}

} // namespace ovsdb

} // namespace opssetup

#endif // OPSSETUP_OVSDB_FAKE_DB_SERVER_HPP
