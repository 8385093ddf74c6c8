/**
 * @file DbClient.cpp
 * @brief Implementation of the OVSDB flag client.
 */

#include "src/ovsdb/inc/DbClient.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace opssetup {

namespace ovsdb {

namespace {

/// Upper bound on unrelated messages (echo, stale replies) skipped per query.
constexpr int MAX_SKIPPED_MESSAGES = 16;

/**
 * Set socket receive timeout.
 */
inline bool setSocketTimeout(int fd, std::chrono::milliseconds timeout) noexcept {
  const auto MS = timeout.count();
  struct timeval tv{};
  tv.tv_sec = static_cast<time_t>(MS / 1000);
  tv.tv_usec = static_cast<suseconds_t>((MS % 1000) * 1000);
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

inline FlagResult flagError(DbStatus status, std::string message) {
  FlagResult res{};
  res.status = status;
  res.message = std::move(message);
  return res;
}

/// Render a scalar id back to JSON: digits stay bare, anything else is quoted.
std::string jsonId(const std::string& id) {
  const bool NUMERIC =
      !id.empty() && id.find_first_not_of("0123456789") == std::string::npos;
  return NUMERIC ? id : fmt::format("\"{}\"", id);
}

} // namespace

/* ----------------------------- DbStatus ----------------------------- */

const char* toString(DbStatus status) noexcept {
  switch (status) {
  case DbStatus::OK:
    return "OK";
  case DbStatus::CONNECT_FAILED:
    return "CONNECT_FAILED";
  case DbStatus::IO_ERROR:
    return "IO_ERROR";
  case DbStatus::PROTOCOL_ERROR:
    return "PROTOCOL_ERROR";
  }
  return "UNKNOWN";
}

std::string FlagResult::toString() const {
  if (!ok()) {
    return fmt::format("{} ({})", ovsdb::toString(status), message);
  }
  return value ? "true" : "false";
}

/* ----------------------------- Wire Helpers ----------------------------- */

std::string buildSelectRequest(std::string_view database, std::string_view table,
                               std::string_view column, std::uint64_t id) {
  return fmt::format("{{\"method\":\"transact\",\"params\":[\"{}\",{{\"op\":\"select\","
                     "\"table\":\"{}\",\"where\":[],\"columns\":[\"{}\"]}}],\"id\":{}}}",
                     database, table, column, id);
}

std::size_t completeJsonLength(std::string_view buf) noexcept {
  std::size_t depth = 0;
  bool started = false;
  bool inString = false;
  bool escaped = false;

  for (std::size_t i = 0; i < buf.size(); ++i) {
    const char C = buf[i];

    if (inString) {
      if (escaped) {
        escaped = false;
      } else if (C == '\\') {
        escaped = true;
      } else if (C == '"') {
        inString = false;
      }
      continue;
    }

    switch (C) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
      break;
    case '"':
      inString = true;
      break;
    case '{':
    case '[':
      started = true;
      ++depth;
      break;
    case '}':
    case ']':
      if (depth == 0) {
        return 0;
      }
      --depth;
      if (depth == 0) {
        return i + 1;
      }
      break;
    default:
      if (!started) {
        return 0; // Top-level scalars are never sent by the server
      }
      break;
    }
  }
  return 0;
}

FlagResult parseFlagResponse(std::string_view response, std::string_view flag) noexcept {
  try {
    const YAML::Node ROOT = YAML::Load(std::string(response));
    if (!ROOT.IsMap()) {
      return flagError(DbStatus::PROTOCOL_ERROR, "response is not an object");
    }

    const YAML::Node ERR = ROOT["error"];
    if (ERR && !ERR.IsNull()) {
      return flagError(DbStatus::PROTOCOL_ERROR,
                       fmt::format("server error: {}", ERR.IsScalar() ? ERR.Scalar() : "(object)"));
    }

    const YAML::Node RESULT = ROOT["result"];
    if (!RESULT || !RESULT.IsSequence() || RESULT.size() == 0) {
      return flagError(DbStatus::PROTOCOL_ERROR, "response has no result");
    }

    const YAML::Node FIRST = RESULT[0];
    if (!FIRST.IsMap()) {
      return flagError(DbStatus::PROTOCOL_ERROR, "first result is not an object");
    }

    const YAML::Node OP_ERR = FIRST["error"];
    if (OP_ERR && !OP_ERR.IsNull()) {
      return flagError(DbStatus::PROTOCOL_ERROR,
                       fmt::format("select failed: {}",
                                   OP_ERR.IsScalar() ? OP_ERR.Scalar() : "(object)"));
    }

    const YAML::Node ROWS = FIRST["rows"];
    if (!ROWS || !ROWS.IsSequence()) {
      return flagError(DbStatus::PROTOCOL_ERROR, "result has no rows");
    }

    FlagResult res{};
    if (ROWS.size() == 0) {
      return res;
    }

    const YAML::Node ROW = ROWS[0];
    if (!ROW.IsMap()) {
      return flagError(DbStatus::PROTOCOL_ERROR, "row is not an object");
    }

    const YAML::Node VALUE = ROW[std::string(flag)];
    if (!VALUE) {
      return flagError(DbStatus::PROTOCOL_ERROR, fmt::format("row has no column '{}'", flag));
    }

    // Quoted scalars carry the "!" tag; the JSON string "1" is not a set flag.
    res.value = VALUE.IsScalar() && VALUE.Tag() != "!" &&
                (VALUE.Scalar() == "1" || VALUE.Scalar() == "true");
    return res;
  } catch (const std::exception& e) {
    return flagError(DbStatus::PROTOCOL_ERROR, e.what());
  }
}

/* ----------------------------- DbClient ----------------------------- */

DbClient::DbClient(std::string socketPath, std::string database,
                   std::chrono::milliseconds recvTimeout)
    : socketPath_(std::move(socketPath)), database_(std::move(database)),
      recvTimeout_(recvTimeout) {}

DbClient::~DbClient() { close(); }

void DbClient::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  pending_.clear();
}

DbStatus DbClient::connect(std::string& message) noexcept {
  struct sockaddr_un addr{};
  if (socketPath_.size() >= sizeof(addr.sun_path)) {
    message = fmt::format("socket path too long: {}", socketPath_);
    return DbStatus::CONNECT_FAILED;
  }
  addr.sun_family = AF_UNIX;
  std::memcpy(addr.sun_path, socketPath_.c_str(), socketPath_.size() + 1);

  const int FD = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (FD < 0) {
    message = fmt::format("socket: {}", std::strerror(errno));
    return DbStatus::CONNECT_FAILED;
  }

  if (::connect(FD, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    message = fmt::format("connect {}: {}", socketPath_, std::strerror(errno));
    ::close(FD);
    return DbStatus::CONNECT_FAILED;
  }

  if (!setSocketTimeout(FD, recvTimeout_)) {
    spdlog::debug("Cannot set receive timeout on {}", socketPath_);
  }

  fd_ = FD;
  ++connects_;
  spdlog::debug("Connected to {}", socketPath_);
  return DbStatus::OK;
}

DbStatus DbClient::sendAll(std::string_view data, std::string& message) noexcept {
  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t N = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      message = fmt::format("send: {}", std::strerror(errno));
      return DbStatus::IO_ERROR;
    }
    off += static_cast<std::size_t>(N);
  }
  return DbStatus::OK;
}

DbStatus DbClient::receiveMessage(std::string& out, Clock::time_point deadline,
                                  std::string& message) noexcept {
  char buf[DB_RECV_CHUNK];

  while (true) {
    const std::size_t LEN = completeJsonLength(pending_);
    if (LEN > 0) {
      out.assign(pending_, 0, LEN);
      pending_.erase(0, LEN);
      return DbStatus::OK;
    }

    if (pending_.size() >= DB_RESPONSE_MAX) {
      message = fmt::format("response exceeds {} bytes", DB_RESPONSE_MAX);
      return DbStatus::PROTOCOL_ERROR;
    }

    const auto REMAINING =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (REMAINING.count() <= 0) {
      message = "timed out waiting for response";
      return DbStatus::IO_ERROR;
    }

    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int READY =
        ::poll(&pfd, 1, static_cast<int>(std::min<long long>(REMAINING.count(), 60000)));
    if (READY < 0) {
      if (errno == EINTR) {
        continue;
      }
      message = fmt::format("poll: {}", std::strerror(errno));
      return DbStatus::IO_ERROR;
    }
    if (READY == 0) {
      continue;
    }

    const ssize_t N = ::recv(fd_, buf, sizeof(buf), 0);
    if (N == 0) {
      message = "connection closed by server";
      return DbStatus::IO_ERROR;
    }
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      message = (errno == EAGAIN || errno == EWOULDBLOCK)
                    ? std::string("timed out waiting for response")
                    : fmt::format("recv: {}", std::strerror(errno));
      return DbStatus::IO_ERROR;
    }
    pending_.append(buf, static_cast<std::size_t>(N));
  }
}

FlagResult DbClient::queryFlag(std::string_view flag) noexcept {
  try {
    std::string message;

    if (fd_ < 0) {
      const DbStatus ST = connect(message);
      if (ST != DbStatus::OK) {
        return flagError(ST, std::move(message));
      }
    }

    const std::uint64_t ID = nextId_++;
    const std::string REQUEST = buildSelectRequest(database_, SYSTEM_TABLE, flag, ID);

    DbStatus st = sendAll(REQUEST, message);
    if (st != DbStatus::OK) {
      close();
      return flagError(st, std::move(message));
    }

    const Clock::time_point DEADLINE = Clock::now() + recvTimeout_;
    for (int skipped = 0; skipped <= MAX_SKIPPED_MESSAGES; ++skipped) {
      std::string reply;
      st = receiveMessage(reply, DEADLINE, message);
      if (st != DbStatus::OK) {
        close();
        return flagError(st, std::move(message));
      }

      const YAML::Node MSG = YAML::Load(reply);
      if (!MSG.IsMap()) {
        return flagError(DbStatus::PROTOCOL_ERROR, "response is not an object");
      }

      const YAML::Node METHOD = MSG["method"];
      if (METHOD && METHOD.IsScalar() && METHOD.Scalar() == "echo") {
        const YAML::Node ECHO_ID = MSG["id"];
        const std::string ECHO_REPLY =
            fmt::format("{{\"id\":{},\"result\":[],\"error\":null}}",
                        ECHO_ID && ECHO_ID.IsScalar() ? jsonId(ECHO_ID.Scalar()) : "null");
        spdlog::debug("Answering echo from {}", socketPath_);
        st = sendAll(ECHO_REPLY, message);
        if (st != DbStatus::OK) {
          close();
          return flagError(st, std::move(message));
        }
        continue;
      }

      const YAML::Node REPLY_ID = MSG["id"];
      if (!REPLY_ID || !REPLY_ID.IsScalar() || REPLY_ID.Scalar() != std::to_string(ID)) {
        spdlog::debug("Skipping unrelated message from {}", socketPath_);
        continue;
      }

      return parseFlagResponse(reply, flag);
    }

    close();
    return flagError(DbStatus::PROTOCOL_ERROR, "no reply matching request id");
  } catch (const std::exception& e) {
    close();
    return flagError(DbStatus::PROTOCOL_ERROR, e.what());
  }
}

} // namespace ovsdb

} // namespace opssetup
