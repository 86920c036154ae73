#include "ticketsim/corpus/slot_table.hpp"

#include <array>
#include <cstring>

#include "ticketsim/io/atomic_file.hpp"
#include "ticketsim/io/checksum.hpp"

namespace ticketsim::corpus {

namespace {

constexpr std::array<char, 8> kMagic{'T', 'K', 'S', 'L', 'O', 'T', '0', '1'};
constexpr std::uint32_t kVersion = 1;
constexpr const char* kComponent = "corpus.slots";

inline void write_string(io::byte_writer& w, const std::string& s) {
  w.put(static_cast<std::uint64_t>(s.size()));
  w.put_bytes(s.data(), s.size());
}

inline bool read_string(io::byte_reader& r, std::string& out) {
  std::uint64_t n{};
  if (!r.get(n) || n > r.remaining()) return false;
  out.resize(static_cast<std::size_t>(n));
  return r.get_bytes(out.data(), out.size());
}

auto corrupt(const std::filesystem::path& path, const char* what)
    -> std::unexpected<core::error> {
  return core::make_error(core::error_code::data_integrity,
                          std::string(what) + ": " + path.string(), kComponent);
}

} // namespace

auto slot_table_path(const std::filesystem::path& index_path) -> std::filesystem::path {
  return std::filesystem::path(index_path).concat(".slots");
}

auto slot_table::from_records(std::span<const ticket_record> records) -> slot_table {
  std::vector<std::string> ids;
  ids.reserve(records.size());
  for (const auto& rec : records) ids.push_back(rec.id);
  return slot_table(std::move(ids));
}

auto slot_table::save(const std::filesystem::path& path) const
    -> std::expected<void, core::error> {
  io::byte_writer w;
  w.put_bytes(kMagic.data(), kMagic.size());
  w.put(kVersion);
  w.put(static_cast<std::uint64_t>(ids_.size()));
  for (const auto& id : ids_) write_string(w, id);
  w.put(io::crc32c(w.bytes()));
  return io::write_file_atomic(path, w.bytes());
}

auto slot_table::load(const std::filesystem::path& path) -> std::expected<slot_table, core::error> {
  auto file = io::read_file(path);
  if (!file) {
    return core::make_error(core::error_code::io_failed,
                            "Slot table not readable: " + path.string(), kComponent);
  }
  const auto& bytes = *file;
  if (bytes.size() < kMagic.size() + sizeof(std::uint32_t) * 2 + sizeof(std::uint64_t)) {
    return corrupt(path, "Slot table truncated");
  }

  const std::size_t body_size = bytes.size() - sizeof(std::uint32_t);
  std::uint32_t stored_crc{};
  std::memcpy(&stored_crc, bytes.data() + body_size, sizeof(stored_crc));
  const std::span<const std::uint8_t> body(bytes.data(), body_size);
  if (io::crc32c(body) != stored_crc) {
    return corrupt(path, "Slot table checksum mismatch");
  }

  io::byte_reader r(body);
  std::array<char, 8> magic{};
  std::uint32_t version{};
  std::uint64_t count{};
  if (!r.get_bytes(magic.data(), magic.size()) || magic != kMagic) {
    return corrupt(path, "Bad slot table magic");
  }
  if (!r.get(version) || version != kVersion) {
    return corrupt(path, "Unsupported slot table version");
  }
  // Each entry carries at least its 8-byte length prefix.
  if (!r.get(count) || count > r.remaining() / sizeof(std::uint64_t)) {
    return corrupt(path, "Slot table count out of range");
  }

  std::vector<std::string> ids(static_cast<std::size_t>(count));
  for (auto& id : ids) {
    if (!read_string(r, id)) return corrupt(path, "Slot table truncated");
  }
  if (r.remaining() != 0) return corrupt(path, "Trailing bytes in slot table");
  return slot_table(std::move(ids));
}

auto slot_table::verify_against(std::span<const ticket_record> records) const
    -> std::expected<void, core::error> {
  if (records.size() != ids_.size()) {
    return core::make_error(core::error_code::data_integrity,
                            "Corpus has " + std::to_string(records.size()) +
                                " records but the index holds " + std::to_string(ids_.size()),
                            kComponent);
  }
  for (std::size_t i = 0; i < ids_.size(); ++i) {
    if (records[i].id != ids_[i]) {
      return core::make_error(core::error_code::data_integrity,
                              "Slot " + std::to_string(i) + " expects ticket '" + ids_[i] +
                                  "' but corpus has '" + records[i].id + "'",
                              kComponent);
    }
  }
  return {};
}

} // namespace ticketsim::corpus
