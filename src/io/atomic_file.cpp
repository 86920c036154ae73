#include "ticketsim/io/atomic_file.hpp"

#include <cstring>
#include <fstream>
#include <iterator>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace ticketsim::io {

namespace fs = std::filesystem;

auto write_file_atomic(const fs::path& dst, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
  using core::error_code;
  const fs::path tmp = fs::path(dst).concat(".tmp");
  // 1) Write tmp
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return core::make_error(error_code::io_failed, "cannot open " + tmp.string() + " for writing", "io.atomic_file");
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) {
      std::error_code rec; (void)fs::remove(tmp, rec);
      return core::make_error(error_code::io_failed, "short write to " + tmp.string(), "io.atomic_file");
    }
  }
  // 2) Ensure tmp contents durable
#if defined(__linux__) || defined(__APPLE__)
  {
    int fd = ::open(tmp.string().c_str(), O_RDONLY);
    if (fd < 0) {
      std::error_code rec; (void)fs::remove(tmp, rec);
      return core::make_error(error_code::io_failed, "fsync open failed for " + tmp.string(), "io.atomic_file");
    }
    (void)::fsync(fd);
    (void)::close(fd);
  }
#endif
  // 3) Atomic replace
  std::error_code ec;
  fs::rename(tmp, dst, ec);
  if (ec) {
    std::error_code rec; (void)fs::remove(tmp, rec);
    return core::make_error(error_code::io_failed, "rename to " + dst.string() + " failed: " + ec.message(), "io.atomic_file");
  }
  // 4) Best-effort directory flush
#if defined(__linux__) || defined(__APPLE__)
  {
    const fs::path dir = dst.has_parent_path() ? dst.parent_path() : fs::path(".");
    int dfd = ::open(dir.string().c_str(), O_RDONLY);
    if (dfd >= 0) { (void)::fsync(dfd); (void)::close(dfd); }
  }
#endif
  return {};
}

auto read_file(const fs::path& src) -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::ifstream in(src, std::ios::binary);
  if (!in.good()) {
    return core::make_error(core::error_code::io_failed, "cannot open " + src.string(), "io.atomic_file");
  }
  std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return core::make_error(core::error_code::io_failed, "read failed for " + src.string(), "io.atomic_file");
  }
  return data;
}

bool byte_reader::get_bytes(void* out, std::size_t n) noexcept {
  if (remaining() < n) return false;
  std::memcpy(out, data_.data() + pos_, n);
  pos_ += n;
  return true;
}

} // namespace ticketsim::io
