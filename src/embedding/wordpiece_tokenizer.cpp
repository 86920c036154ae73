#include "ticketsim/embedding/wordpiece_tokenizer.hpp"

#include <cctype>
#include <fstream>

namespace ticketsim::embedding {

namespace {

constexpr const char* kComponent = "embedding.wordpiece";
constexpr std::size_t kMaxCharsPerWord = 100;

bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

bool is_punct(char c) {
  const auto uc = static_cast<unsigned char>(c);
  return (uc >= 33 && uc <= 47) || (uc >= 58 && uc <= 64) || (uc >= 91 && uc <= 96) ||
         (uc >= 123 && uc <= 126);
}

} // namespace

auto wordpiece_tokenizer::from_vocab_file(const std::filesystem::path& path)
    -> std::expected<wordpiece_tokenizer, core::error> {
  std::ifstream in(path);
  if (!in) {
    return core::make_error(core::error_code::io_failed,
                            "Cannot open vocab file " + path.string(), kComponent);
  }
  std::vector<std::string> tokens;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    tokens.push_back(line);
  }
  return from_tokens(std::move(tokens));
}

auto wordpiece_tokenizer::from_tokens(std::vector<std::string> tokens)
    -> std::expected<wordpiece_tokenizer, core::error> {
  wordpiece_tokenizer tok;
  tok.id_to_tok_ = std::move(tokens);
  for (std::size_t i = 0; i < tok.id_to_tok_.size(); ++i) {
    tok.tok_to_id_.emplace(tok.id_to_tok_[i], static_cast<std::int64_t>(i));
  }
  tok.cls_ = tok.id_or(-1, "[CLS]");
  tok.sep_ = tok.id_or(-1, "[SEP]");
  tok.unk_ = tok.id_or(-1, "[UNK]");
  tok.pad_ = tok.id_or(0, "[PAD]");
  if (tok.cls_ < 0 || tok.sep_ < 0 || tok.unk_ < 0) {
    return core::make_error(core::error_code::data_integrity,
                            "Vocabulary lacks [CLS], [SEP] or [UNK]", kComponent);
  }
  return tok;
}

auto wordpiece_tokenizer::id_or(std::int64_t def, const std::string& tok) const -> std::int64_t {
  auto it = tok_to_id_.find(tok);
  return it == tok_to_id_.end() ? def : it->second;
}

auto wordpiece_tokenizer::basic_tokenize(std::string_view text) const
    -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string cur;
  auto flush = [&]() {
    if (!cur.empty()) {
      out.push_back(cur);
      cur.clear();
    }
  };

  for (const char raw : text) {
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
    if (is_ws(c)) {
      flush();
    } else if (is_punct(c)) {
      flush();
      out.emplace_back(1, c);
    } else {
      cur.push_back(c);
    }
  }
  flush();
  return out;
}

auto wordpiece_tokenizer::wordpiece(const std::string& token) const -> std::vector<std::string> {
  if (token.empty() || token.size() > kMaxCharsPerWord) return {"[UNK]"};

  std::vector<std::string> pieces;
  std::size_t start = 0;
  while (start < token.size()) {
    std::size_t end = token.size();
    std::string best;
    while (end > start) {
      std::string sub = token.substr(start, end - start);
      if (start > 0) sub = "##" + sub;
      if (tok_to_id_.contains(sub)) {
        best = std::move(sub);
        break;
      }
      --end;
    }
    if (best.empty()) return {"[UNK]"};
    pieces.push_back(std::move(best));
    start = end;
  }
  return pieces;
}

auto wordpiece_tokenizer::encode(std::string_view text, std::size_t max_len) const
    -> std::vector<std::int64_t> {
  if (max_len < 2) max_len = 2;
  std::vector<std::int64_t> ids;
  ids.reserve(max_len);
  ids.push_back(cls_);

  for (const auto& word : basic_tokenize(text)) {
    for (const auto& piece : wordpiece(word)) {
      if (ids.size() + 1 >= max_len) break;   // keep room for [SEP]
      ids.push_back(id_or(unk_, piece));
    }
    if (ids.size() + 1 >= max_len) break;
  }
  ids.push_back(sep_);
  return ids;
}

} // namespace ticketsim::embedding
