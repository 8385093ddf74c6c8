#ifndef OPSSETUP_OVSDB_DB_CLIENT_HPP
#define OPSSETUP_OVSDB_DB_CLIENT_HPP
/**
 * @file DbClient.hpp
 * @brief Minimal OVSDB JSON-RPC client for boolean System-table flags.
 * @note Linux-only. Unix-domain stream socket.
 *
 * Only `transact` with a single `select` on the System table is spoken. The
 * socket is opened lazily on the first query and kept for the lifetime of the
 * client; any transport failure closes it so the next query reconnects.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace opssetup {

namespace ovsdb {

/* ----------------------------- Constants ----------------------------- */

/// Default database socket.
inline constexpr const char* DEFAULT_DB_SOCKET = "/var/run/openvswitch/db.sock";

/// Default database name.
inline constexpr const char* DEFAULT_DB_NAME = "OpenSwitch";

/// Table holding the boot flags.
inline constexpr const char* SYSTEM_TABLE = "System";

/// Upper bound on one response; larger replies are a protocol error.
inline constexpr std::size_t DB_RESPONSE_MAX = 65536;

/// Bytes requested per recv().
inline constexpr std::size_t DB_RECV_CHUNK = 4096;

/// Upper bound on the wait for one query's reply, unrelated messages included.
inline constexpr std::chrono::milliseconds DEFAULT_RECV_TIMEOUT{2000};

/* ----------------------------- DbStatus ----------------------------- */

/**
 * @brief Outcome of one database query.
 */
enum class DbStatus : std::uint8_t {
  OK = 0,
  CONNECT_FAILED, ///< Socket could not be created or connected
  IO_ERROR,       ///< send/recv failed, timed out or peer closed
  PROTOCOL_ERROR, ///< Response malformed, oversized or carrying an error
};

/**
 * @brief Human-readable status string.
 * @return Static string.
 */
[[nodiscard]] const char* toString(DbStatus status) noexcept;

/* ----------------------------- FlagResult ----------------------------- */

/**
 * @brief Value of one boolean flag.
 */
struct FlagResult {
  DbStatus status{DbStatus::OK};
  bool value{false};   ///< Flag is 1 (false when no row exists yet)
  std::string message; ///< Failure detail (empty on success)

  [[nodiscard]] bool ok() const noexcept { return status == DbStatus::OK; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Wire Helpers ----------------------------- */

/**
 * @brief Build a `transact` request selecting one column of a table.
 * @param database Database name (e.g. "OpenSwitch").
 * @param table Table name (e.g. "System").
 * @param column Column to select.
 * @param id JSON-RPC request id.
 * @return Compact JSON text, no trailing newline.
 */
[[nodiscard]] std::string buildSelectRequest(std::string_view database, std::string_view table,
                                             std::string_view column, std::uint64_t id);

/**
 * @brief Length of the first complete JSON value in buf.
 *
 * Counts brace and bracket depth outside string literals, honoring escapes.
 * Leading whitespace is skipped.
 *
 * @return Bytes up to and including the closing brace, or 0 if incomplete.
 */
[[nodiscard]] std::size_t completeJsonLength(std::string_view buf) noexcept;

/**
 * @brief Extract a flag from a `transact` response.
 *
 * The flag is true iff result[0].rows[0][flag] is the bare literal 1 or
 * true; a JSON string such as "1" is false. An empty row set is
 * reported as OK with value false. A non-null "error" member, or a first
 * result carrying "error", is PROTOCOL_ERROR.
 */
[[nodiscard]] FlagResult parseFlagResponse(std::string_view response, std::string_view flag) noexcept;

/* ----------------------------- DbClient ----------------------------- */

/**
 * @brief Owns one connection to the configuration database.
 *
 * Non-copyable. Single-threaded use only.
 */
class DbClient {
public:
  explicit DbClient(std::string socketPath = DEFAULT_DB_SOCKET,
                    std::string database = DEFAULT_DB_NAME,
                    std::chrono::milliseconds recvTimeout = DEFAULT_RECV_TIMEOUT);
  ~DbClient();

  DbClient(const DbClient&) = delete;
  DbClient& operator=(const DbClient&) = delete;

  /**
   * @brief Read one boolean column of the System table.
   * @param flag Column name (e.g. "cur_hw").
   * @note Connects on first use; drops the connection on transport failure.
   *       Waits at most recvTimeout for the matching reply.
   */
  [[nodiscard]] FlagResult queryFlag(std::string_view flag) noexcept;

  /// @brief True while a socket is open.
  [[nodiscard]] bool isConnected() const noexcept { return fd_ >= 0; }

  /// @brief Close the socket, if open.
  void close() noexcept;

  /// @brief Number of successful connects since construction.
  [[nodiscard]] std::size_t connectCount() const noexcept { return connects_; }

  [[nodiscard]] const std::string& socketPath() const noexcept { return socketPath_; }

private:
  DbStatus connect(std::string& message) noexcept;
  DbStatus sendAll(std::string_view data, std::string& message) noexcept;
  using Clock = std::chrono::steady_clock;

  DbStatus receiveMessage(std::string& out, Clock::time_point deadline,
                          std::string& message) noexcept;

  std::string socketPath_;
  std::string database_;
  std::chrono::milliseconds recvTimeout_;
  int fd_{-1};
  std::uint64_t nextId_{0};
  std::size_t connects_{0};
  std::string pending_; ///< Bytes received past the last complete message
};

} // namespace ovsdb

} // namespace opssetup

#endif // OPSSETUP_OVSDB_DB_CLIENT_HPP
