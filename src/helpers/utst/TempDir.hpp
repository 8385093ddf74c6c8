#ifndef OPSSETUP_HELPERS_TEMP_DIR_HPP
#define OPSSETUP_HELPERS_TEMP_DIR_HPP
/**
 * @file TempDir.hpp
 * @brief Scratch directory for unit tests, removed on destruction.
 */

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace opssetup {

namespace helpers {

class TempDir {
public:
  TempDir() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "ops-setup-XXXXXX").string();
    if (::mkdtemp(tmpl.data()) != nullptr) {
      path_ = tmpl;
    }
  }

  ~TempDir() {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  /// Absolute path of a child entry.
  [[nodiscard]] std::string sub(const std::string& name) const { return path_ + "/" + name; }

  /// Create a child directory (and parents); returns its path.
  std::string mkdir(const std::string& name) const {
    const std::string P = sub(name);
    std::error_code ec;
    std::filesystem::create_directories(P, ec);
    return P;
  }

private:
  std::string path_;
};

} // namespace helpers

} // namespace opssetup

#endif // OPSSETUP_HELPERS_TEMP_DIR_HPP
