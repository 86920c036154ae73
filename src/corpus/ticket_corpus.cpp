#include "ticketsim/corpus/ticket_corpus.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>

#include <spdlog/spdlog.h>

#include "ticketsim/io/atomic_file.hpp"

namespace ticketsim::corpus {

namespace {

constexpr const char* kComponent = "corpus.csv";

constexpr std::array<std::string_view, 6> kColumns{
    "Ticket ID", "Issue", "Category", "Description", "Resolved", "Resolution"};

enum column : std::size_t { col_id, col_issue, col_category, col_description, col_resolved,
                            col_resolution };

using row = std::vector<std::string>;

auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view ws = " \t\r\n";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto parse_bool(std::string_view cell) -> std::optional<bool> {
  const std::string v = to_lower(trim(cell));
  if (v == "true" || v == "1" || v == "yes") return true;
  if (v == "false" || v == "0" || v == "no" || v.empty()) return false;
  return std::nullopt;
}

/** \brief Split CSV text into rows; quoted fields may span lines. */
auto split_rows(std::string_view text, std::string_view origin)
    -> std::expected<std::vector<row>, core::error> {
  std::vector<row> rows;
  row current;
  std::string field;
  bool in_quotes = false;
  bool row_has_content = false;

  auto end_field = [&] {
    current.push_back(std::move(field));
    field.clear();
  };
  auto end_row = [&] {
    end_field();
    // Blank lines produce a single empty field; skip them.
    if (row_has_content || current.size() > 1 || !current.front().empty()) {
      rows.push_back(std::move(current));
    }
    current.clear();
    row_has_content = false;
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }
    switch (c) {
      case '"':
        in_quotes = true;
        row_has_content = true;
        break;
      case ',':
        end_field();
        row_has_content = true;
        break;
      case '\r':
        if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        end_row();
        break;
      case '\n':
        end_row();
        break;
      default:
        field.push_back(c);
        break;
    }
  }
  if (in_quotes) {
    return core::make_error(core::error_code::data_integrity,
                            "Unterminated quoted field in " + std::string(origin), kComponent);
  }
  if (!field.empty() || !current.empty() || row_has_content) end_row();
  return rows;
}

auto optional_cell(const row& r, std::size_t idx) -> std::optional<std::string> {
  if (idx >= r.size() || r[idx].empty()) return std::nullopt;
  return r[idx];
}

auto quote(std::string_view cell) -> std::string {
  if (cell.find_first_of(",\"\r\n") == std::string_view::npos) return std::string(cell);
  std::string out;
  out.reserve(cell.size() + 2);
  out.push_back('"');
  for (const char c : cell) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // namespace

auto ticket_corpus::load_csv(const std::filesystem::path& path)
    -> std::expected<ticket_corpus, core::error> {
  auto bytes = io::read_file(path);
  if (!bytes) {
    return core::make_error(core::error_code::io_failed,
                            "Ticket corpus not readable: " + path.string(), kComponent);
  }
  const std::string_view text(reinterpret_cast<const char*>(bytes->data()), bytes->size());
  auto corpus = parse_csv(text, path.string());
  if (corpus) {
    spdlog::info("[{}] loaded {} tickets from {}", kComponent, corpus->size(), path.string());
  }
  return corpus;
}

auto ticket_corpus::parse_csv(std::string_view text, std::string_view origin)
    -> std::expected<ticket_corpus, core::error> {
  using core::error_code;

  if (text.starts_with("\xEF\xBB\xBF")) text.remove_prefix(3);

  auto rows = split_rows(text, origin);
  if (!rows) return std::unexpected(rows.error());
  if (rows->empty()) {
    return core::make_error(error_code::data_integrity,
                            "Missing header row in " + std::string(origin), kComponent);
  }

  const row& header = rows->front();
  std::array<std::size_t, kColumns.size()> index{};
  for (std::size_t c = 0; c < kColumns.size(); ++c) {
    const auto it = std::find_if(header.begin(), header.end(),
                                 [&](const std::string& h) { return trim(h) == kColumns[c]; });
    if (it == header.end()) {
      return core::make_error(error_code::data_integrity,
                              "Missing column '" + std::string(kColumns[c]) + "' in " +
                                  std::string(origin),
                              kComponent);
    }
    index[c] = static_cast<std::size_t>(it - header.begin());
  }

  std::vector<ticket_record> records;
  records.reserve(rows->size() - 1);
  for (std::size_t r = 1; r < rows->size(); ++r) {
    const row& cells = (*rows)[r];
    ticket_record rec;
    rec.id = std::string(trim(index[col_id] < cells.size() ? cells[index[col_id]] : ""));
    if (rec.id.empty()) {
      return core::make_error(error_code::data_integrity,
                              "Row " + std::to_string(r) + " has no Ticket ID in " +
                                  std::string(origin),
                              kComponent);
    }
    rec.issue = optional_cell(cells, index[col_issue]);
    rec.category = optional_cell(cells, index[col_category]);
    rec.description = optional_cell(cells, index[col_description]);
    rec.resolution = optional_cell(cells, index[col_resolution]).value_or("");

    const std::string_view flag =
        index[col_resolved] < cells.size() ? std::string_view(cells[index[col_resolved]]) : "";
    if (auto b = parse_bool(flag)) {
      rec.resolved = *b;
    } else {
      spdlog::warn("[{}] ticket {}: unrecognised Resolved value '{}', treating as false",
                   kComponent, rec.id, flag);
      rec.resolved = false;
    }
    records.push_back(std::move(rec));
  }
  return ticket_corpus(std::move(records));
}

auto ticket_corpus::to_csv() const -> std::string {
  std::string out;
  for (std::size_t c = 0; c < kColumns.size(); ++c) {
    if (c) out.push_back(',');
    out.append(kColumns[c]);
  }
  out.push_back('\n');
  for (const auto& rec : records_) {
    out += quote(rec.id);
    out.push_back(',');
    out += quote(rec.issue.value_or(""));
    out.push_back(',');
    out += quote(rec.category.value_or(""));
    out.push_back(',');
    out += quote(rec.description.value_or(""));
    out.push_back(',');
    out += rec.resolved ? "true" : "false";
    out.push_back(',');
    out += quote(rec.resolution);
    out.push_back('\n');
  }
  return out;
}

auto ticket_corpus::save_csv(const std::filesystem::path& path) const
    -> std::expected<void, core::error> {
  const std::string text = to_csv();
  return io::write_file_atomic(
      path, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                          text.size()));
}

auto ticket_corpus::find(std::string_view id) const noexcept -> const ticket_record* {
  for (const auto& rec : records_) {
    if (rec.id == id) return &rec;
  }
  return nullptr;
}

} // namespace ticketsim::corpus
