#pragma once

// Deterministic test doubles for the embedding and generation seams.

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ticketsim/embedding/embedding_provider.hpp"
#include "ticketsim/generation/generation_provider.hpp"

namespace ticketsim::test {

// One dimension per vocabulary word; the value is the word's count in the text
// (lowercased, split on non-alphanumerics). Texts without vocabulary words embed to zero.
class keyword_embedder : public embedding::embedding_provider {
public:
  explicit keyword_embedder(std::vector<std::string> vocab) : vocab_(std::move(vocab)) {}

  auto dimension() const noexcept -> std::size_t override { return vocab_.size(); }

  auto embed_batch(std::span<const std::string> texts) const
      -> std::expected<std::vector<std::vector<float>>, core::error> override {
    calls_.fetch_add(1);
    texts_seen_.fetch_add(texts.size());
    {
      std::lock_guard lock(mu_);
      batch_sizes_.push_back(texts.size());
    }
    if (fail_.load()) {
      return core::make_error(core::error_code::provider_failed, "embedding backend down",
                              "test.keyword_embedder");
    }
    std::vector<std::vector<float>> out;
    for (const auto& t : texts) out.push_back(embed_one(t));
    return out;
  }

  auto embed_one(const std::string& text) const -> std::vector<float> {
    std::vector<float> v(vocab_.size(), 0.0f);
    std::string word;
    auto flush = [&] {
      if (word.empty()) return;
      const auto it = std::find(vocab_.begin(), vocab_.end(), word);
      if (it != vocab_.end()) v[static_cast<std::size_t>(it - vocab_.begin())] += 1.0f;
      word.clear();
    };
    for (const char c : text) {
      if (std::isalnum(static_cast<unsigned char>(c))) {
        word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
      } else {
        flush();
      }
    }
    flush();
    return v;
  }

  void set_failing(bool fail) { fail_.store(fail); }
  auto calls() const -> std::size_t { return calls_.load(); }
  auto texts_seen() const -> std::size_t { return texts_seen_.load(); }
  auto batch_sizes() const -> std::vector<std::size_t> {
    std::lock_guard lock(mu_);
    return batch_sizes_;
  }

private:
  std::vector<std::string> vocab_;
  std::atomic<bool> fail_{false};
  mutable std::atomic<std::size_t> calls_{0};
  mutable std::atomic<std::size_t> texts_seen_{0};
  mutable std::mutex mu_;
  mutable std::vector<std::size_t> batch_sizes_;
};

inline auto ticket_vocab() -> std::vector<std::string> {
  return {"printer", "wifi", "offline", "vpn", "timeout", "connecting", "issue"};
}

// Returns whatever the test scripts, in order, and records every request it sees.
class scripted_generator : public generation::generation_provider {
public:
  auto complete(const generation::chat_request& request) const
      -> std::expected<std::string, core::error> override {
    std::lock_guard lock(mu_);
    requests_.push_back(request);
    if (failure_) return std::unexpected(*failure_);
    return reply_;
  }

  void reply_with(std::string text) { reply_ = std::move(text); }
  void fail_with(core::error e) { failure_ = std::move(e); }

  auto last_request() const -> generation::chat_request {
    std::lock_guard lock(mu_);
    return requests_.back();
  }
  auto request_count() const -> std::size_t {
    std::lock_guard lock(mu_);
    return requests_.size();
  }

private:
  std::string reply_;
  std::optional<core::error> failure_;
  mutable std::mutex mu_;
  mutable std::vector<generation::chat_request> requests_;
};

} // namespace ticketsim::test
