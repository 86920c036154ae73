#pragma once

/**
 * \file ticket_corpus.hpp
 * \brief CSV-backed record store for previously recorded tickets.
 *
 * Format: RFC 4180 CSV with a header row. Required columns (any order, extra columns are
 * ignored): Ticket ID, Issue, Category, Description, Resolved, Resolution.
 * - Quoted fields may contain commas, doubled quotes ("") and line breaks
 * - An empty Issue/Category/Description cell is a missing field
 * - Resolved accepts true/false, 1/0, yes/no (case-insensitive); anything else is logged
 *   and read as false
 * - Row order defines slot order when the corpus is indexed
 *
 * Thread-safety: immutable after construction; concurrent reads are safe.
 */

#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ticketsim/error.hpp"
#include "ticketsim/ticket.hpp"

namespace ticketsim::corpus {

class ticket_corpus {
public:
  ticket_corpus() = default;
  explicit ticket_corpus(std::vector<ticket_record> records) : records_(std::move(records)) {}

  /** \brief Read a corpus file.
   * \return io_failed if the file cannot be opened; data_integrity for a missing required
   *         column, a row without a Ticket ID, or an unterminated quoted field
   */
  static auto load_csv(const std::filesystem::path& path)
      -> std::expected<ticket_corpus, core::error>;

  /** \brief Parse CSV text; origin is used in error messages only. */
  static auto parse_csv(std::string_view text, std::string_view origin = "<memory>")
      -> std::expected<ticket_corpus, core::error>;

  /** \brief Write the corpus with the canonical header (atomic replace). */
  auto save_csv(const std::filesystem::path& path) const -> std::expected<void, core::error>;

  auto to_csv() const -> std::string;

  auto records() const noexcept -> std::span<const ticket_record> { return records_; }
  auto size() const noexcept -> std::size_t { return records_.size(); }
  auto empty() const noexcept -> bool { return records_.empty(); }

  /** \brief Record with the given id, or nullptr. O(n). */
  auto find(std::string_view id) const noexcept -> const ticket_record*;

private:
  std::vector<ticket_record> records_;
};

} // namespace ticketsim::corpus
