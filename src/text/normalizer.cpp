#include "ticketsim/text/normalizer.hpp"

#include <string_view>

namespace ticketsim::text {

namespace {

// ASCII whitespace trimmed from both ends of the joined text.
constexpr std::string_view kWhitespace = " \t\n\r\f\v";

} // namespace

auto normalize(const std::optional<std::string>& issue,
               const std::optional<std::string>& category,
               const std::optional<std::string>& description) -> std::string {
  std::string joined;
  joined.reserve((issue ? issue->size() : 0) + (category ? category->size() : 0) +
                 (description ? description->size() : 0) + 2);
  joined.append(issue.value_or(""));
  joined.push_back(' ');
  joined.append(category.value_or(""));
  joined.push_back(' ');
  joined.append(description.value_or(""));

  const auto first = joined.find_first_not_of(kWhitespace);
  if (first == std::string::npos) return {};
  const auto last = joined.find_last_not_of(kWhitespace);
  return joined.substr(first, last - first + 1);
}

auto normalize(const ticket_record& record) -> std::string {
  return normalize(record.issue, record.category, record.description);
}

} // namespace ticketsim::text
