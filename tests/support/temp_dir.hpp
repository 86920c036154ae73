#pragma once

#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <system_error>

namespace ticketsim::test {

// Unique scratch directory removed on destruction.
class temp_dir {
public:
  explicit temp_dir(const std::string& prefix) {
    std::random_device rd;
    const auto suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                        "_" + std::to_string(static_cast<unsigned long long>(rd()));
    path_ = std::filesystem::temp_directory_path() / (prefix + "_" + suffix);
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }
  ~temp_dir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;

  auto path() const -> const std::filesystem::path& { return path_; }
  auto file(const std::string& name) const -> std::filesystem::path { return path_ / name; }

private:
  std::filesystem::path path_;
};

} // namespace ticketsim::test
