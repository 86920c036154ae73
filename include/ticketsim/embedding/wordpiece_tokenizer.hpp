#pragma once

/** \file wordpiece_tokenizer.hpp
 *  \brief BERT uncased WordPiece tokenizer (ASCII lowercasing, punctuation split,
 *         greedy longest-match-first with "##" continuations).
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ticketsim/error.hpp"

namespace ticketsim::embedding {

class wordpiece_tokenizer {
public:
  /** \brief Load vocab.txt (one token per line, id = line number).
   * \return io_failed if unreadable; data_integrity if empty or lacking [CLS]/[SEP]/[UNK]
   */
  static auto from_vocab_file(const std::filesystem::path& path)
      -> std::expected<wordpiece_tokenizer, core::error>;

  /** \brief Build from an in-memory vocabulary; same validation as from_vocab_file. */
  static auto from_tokens(std::vector<std::string> tokens)
      -> std::expected<wordpiece_tokenizer, core::error>;

  /** \brief Token ids as [CLS] ... [SEP], truncated to max_len (max_len >= 2). */
  auto encode(std::string_view text, std::size_t max_len) const -> std::vector<std::int64_t>;

  auto pad_id() const noexcept -> std::int64_t { return pad_; }
  auto cls_id() const noexcept -> std::int64_t { return cls_; }
  auto sep_id() const noexcept -> std::int64_t { return sep_; }
  auto unk_id() const noexcept -> std::int64_t { return unk_; }
  auto vocab_size() const noexcept -> std::size_t { return id_to_tok_.size(); }

private:
  wordpiece_tokenizer() = default;

  auto id_or(std::int64_t def, const std::string& tok) const -> std::int64_t;
  auto basic_tokenize(std::string_view text) const -> std::vector<std::string>;
  auto wordpiece(const std::string& token) const -> std::vector<std::string>;

  std::vector<std::string> id_to_tok_;
  std::unordered_map<std::string, std::int64_t> tok_to_id_;
  std::int64_t pad_{0};
  std::int64_t cls_{0};
  std::int64_t sep_{0};
  std::int64_t unk_{0};
};

} // namespace ticketsim::embedding
