#pragma once

/** \file atomic_file.hpp
 *  \brief Whole-file binary read and atomic, durable replace.
 *
 * write_file_atomic():
 * - Write contents to a temporary sibling file (<name>.tmp) in the same directory
 * - Flush stream buffers and fsync(tmp) on POSIX
 * - Atomically replace the destination with std::filesystem::rename
 * - Best-effort fsync of the parent directory
 * - On failure, the tmp file is removed and io_failed is returned; the destination is
 *   left as it was.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <utility>
#include <span>
#include <vector>

#include "ticketsim/error.hpp"

namespace ticketsim::io {

auto write_file_atomic(const std::filesystem::path& dst, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error>;

/** \brief Read a whole file; not_found-style failures are reported as io_failed. */
auto read_file(const std::filesystem::path& src)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Little-endian append/consume helpers for hand-rolled binary formats. */
class byte_writer {
public:
  template <typename T>
  void put(const T& v) {
    const auto* p = reinterpret_cast<const std::uint8_t*>(&v);
    buf_.insert(buf_.end(), p, p + sizeof(T));
  }
  void put_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    buf_.insert(buf_.end(), p, p + n);
  }
  auto bytes() const noexcept -> std::span<const std::uint8_t> { return buf_; }
  auto take() noexcept -> std::vector<std::uint8_t> { return std::move(buf_); }

private:
  std::vector<std::uint8_t> buf_;
};

class byte_reader {
public:
  explicit byte_reader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

  /** \brief Returns false (and consumes nothing) when fewer than sizeof(T) bytes remain. */
  template <typename T>
  bool get(T& out) noexcept {
    return get_bytes(&out, sizeof(T));
  }
  bool get_bytes(void* out, std::size_t n) noexcept;
  auto remaining() const noexcept -> std::size_t { return data_.size() - pos_; }
  auto position() const noexcept -> std::size_t { return pos_; }

private:
  std::span<const std::uint8_t> data_;
  std::size_t pos_{0};
};

} // namespace ticketsim::io
