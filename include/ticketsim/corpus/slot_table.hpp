#pragma once

/**
 * \file slot_table.hpp
 * \brief Persisted slot id -> ticket id mapping stored beside an HNSW index file.
 *
 * On-disk layout (<index_path>.slots, little-endian):
 *   magic "TKSLOT01" | u32 version | u64 count | count x (u64 length, bytes) | u32 crc32c
 * The checksum covers every byte before the trailer.
 */

#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "ticketsim/error.hpp"
#include "ticketsim/ticket.hpp"

namespace ticketsim::corpus {

/** \brief Sibling path of the slot table for an index file. */
auto slot_table_path(const std::filesystem::path& index_path) -> std::filesystem::path;

class slot_table {
public:
  slot_table() = default;
  explicit slot_table(std::vector<std::string> ids) : ids_(std::move(ids)) {}

  /** \brief Table whose slot i is records[i].id. */
  static auto from_records(std::span<const ticket_record> records) -> slot_table;

  auto save(const std::filesystem::path& path) const -> std::expected<void, core::error>;

  /** \brief io_failed when unreadable; data_integrity when corrupt or truncated. */
  static auto load(const std::filesystem::path& path) -> std::expected<slot_table, core::error>;

  /** \brief Check that records are exactly the indexed tickets, in slot order.
   * \return data_integrity naming the first differing slot or the size mismatch
   */
  auto verify_against(std::span<const ticket_record> records) const
      -> std::expected<void, core::error>;

  auto size() const noexcept -> std::size_t { return ids_.size(); }
  auto ids() const noexcept -> std::span<const std::string> { return ids_; }

  /** \brief Ticket id of a slot, or nullptr when out of range. */
  auto id_at(std::size_t slot) const noexcept -> const std::string* {
    return slot < ids_.size() ? &ids_[slot] : nullptr;
  }

private:
  std::vector<std::string> ids_;
};

} // namespace ticketsim::corpus
