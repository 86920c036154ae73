#include "ticketsim/generation/response_drafter.hpp"

#include <algorithm>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ticketsim::generation {

namespace {

constexpr const char* kComponent = "generation.drafter";

using ordered_json = nlohmann::ordered_json;

// Non-UTF-8 bytes in ticket text become U+FFFD.
auto to_text(const ordered_json& j) -> std::string {
  return j.dump(2, ' ', false, ordered_json::error_handler_t::replace);
}

constexpr sampling_params kEvidenceSampling{1024, 0.3f, 0.95f};
constexpr sampling_params kNoEvidenceSampling{50, 0.1f, 0.1f};

constexpr std::string_view kNoEvidenceSystem =
    "You are a technical support assistant. Provide a very brief solution suggestion "
    "(max 15 words) for the following issue ONLY if you are highly confident. If not "
    "confident, respond with 'No immediate solution available.'";

auto optional_json(const std::optional<std::string>& v) -> ordered_json {
  return v ? ordered_json(*v) : ordered_json(nullptr);
}

auto ticket_json(const ticket_query& t) -> ordered_json {
  ordered_json j;
  j["Issue"] = optional_json(t.issue);
  j["Category"] = optional_json(t.category);
  j["Description"] = optional_json(t.description);
  return j;
}

auto matches_json(std::span<const match_result> matches, bool resolved_only) -> ordered_json {
  ordered_json arr = ordered_json::array();
  for (const auto& m : matches) {
    if (resolved_only && !m.resolved) continue;
    ordered_json j;
    j["ticket_id"] = m.ticket_id;
    j["similarity_score"] = m.similarity;
    j["issue"] = m.issue.value_or("");
    j["category"] = m.category.value_or("");
    j["description"] = m.description.value_or("");
    j["resolved"] = m.resolved;
    j["resolution"] = m.resolution;
    arr.push_back(std::move(j));
  }
  return arr;
}

auto resolved_prompt(const ordered_json& tickets) -> std::string {
  return "You are an AI assistant that helps Human Agents respond to support tickets.\n\n"
         "I will provide you with a new support ticket and details from " +
         std::to_string(tickets.size()) +
         " similar resolved tickets from our database.\n\n"
         "Your task is to:\n"
         "1. Analyze the new ticket and the resolved similar tickets\n"
         "2. Create a coherent response that addresses the new ticket's issue\n"
         "3. Include the most relevant solution from the resolved tickets\n"
         "4. End the message by saying: " + std::string(kSignOff) + "\n"
         "Here are the similar resolved tickets:\n" + to_text(tickets) + "\n\n"
         "Please create a response that the agent can use to address the new ticket. "
         "Be concise but comprehensive.";
}

auto unresolved_prompt(const ordered_json& tickets) -> std::string {
  return "You are an AI assistant that helps Human Agents respond to support tickets.\n\n"
         "I will provide you with a new support ticket and details from " +
         std::to_string(tickets.size()) +
         " similar tickets from our database, but none of these similar tickets have been "
         "resolved.\n\n"
         "Your task is to:\n"
         "1. Analyze the new ticket and the similar unresolved tickets\n"
         "2. Create a coherent response that acknowledges the ongoing nature of this issue\n"
         "3. Share details about the similar tickets and what approaches did not work\n"
         "4. Suggest potential next steps based on the history of attempts\n"
         "5. Format your response to be ready for a human agent to review and send\n"
         "6. End the message by saying: " + std::string(kSignOff) + "\n\n"
         "Here are the similar unresolved tickets:\n" + to_text(tickets) + "\n\n"
         "Please create a response that the agent can use to address the new ticket, "
         "acknowledging that we don't have a proven solution yet.";
}

auto trim_right(std::string_view s) -> std::string_view {
  const auto e = s.find_last_not_of(" \t\r\n");
  return e == std::string_view::npos ? std::string_view{} : s.substr(0, e + 1);
}

auto trim(std::string_view s) -> std::string_view {
  s = trim_right(s);
  const auto b = s.find_first_not_of(" \t\r\n");
  return b == std::string_view::npos ? std::string_view{} : s.substr(b);
}

auto with_sign_off(std::string_view text) -> std::string {
  const std::string_view body = trim_right(text);
  if (body.ends_with(kSignOff)) return std::string(body);
  std::string out(body);
  if (!out.empty()) out += "\n\n";
  out += kSignOff;
  return out;
}

} // namespace

auto response_drafter::select_mode(std::span<const match_result> matches) noexcept
    -> draft_mode {
  if (matches.empty()) return draft_mode::no_evidence;
  const bool any_resolved =
      std::any_of(matches.begin(), matches.end(), [](const match_result& m) { return m.resolved; });
  return any_resolved ? draft_mode::resolved_evidence : draft_mode::unresolved_evidence;
}

auto response_drafter::build_request(const ticket_query& ticket,
                                     std::span<const match_result> matches) -> chat_request {
  chat_request req;
  const std::string ticket_text = to_text(ticket_json(ticket));

  switch (select_mode(matches)) {
    case draft_mode::no_evidence:
      req.messages.push_back({"system", std::string(kNoEvidenceSystem)});
      req.messages.push_back({"user", "Issue: " + ticket_text});
      req.sampling = kNoEvidenceSampling;
      break;
    case draft_mode::resolved_evidence:
      req.messages.push_back({"system", resolved_prompt(matches_json(matches, true))});
      req.messages.push_back({"user", "New Ticket: " + ticket_text});
      req.sampling = kEvidenceSampling;
      break;
    case draft_mode::unresolved_evidence:
      req.messages.push_back({"system", unresolved_prompt(matches_json(matches, false))});
      req.messages.push_back({"user", "New Ticket: " + ticket_text});
      req.sampling = kEvidenceSampling;
      break;
  }
  return req;
}

auto response_drafter::draft(const ticket_query& ticket,
                             std::span<const match_result> matches) const
    -> std::expected<std::string, core::error> {
  if (!provider_) {
    return core::make_error(core::error_code::not_initialized,
                            "No generation provider configured", kComponent);
  }
  const draft_mode mode = select_mode(matches);
  auto text = provider_->complete(build_request(ticket, matches));
  if (!text) {
    spdlog::error("[{}] generation failed: {}", kComponent, text.error().message);
    return core::make_error(core::error_code::provider_failed, text.error().message, kComponent);
  }

  if (mode == draft_mode::no_evidence) {
    std::string out(kNoMatchPreamble);
    out += "\n\nSuggested direction: ";
    out += trim(*text);
    return with_sign_off(out);
  }
  return with_sign_off(*text);
}

} // namespace ticketsim::generation
