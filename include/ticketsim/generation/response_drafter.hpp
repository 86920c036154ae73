#pragma once

/**
 * \file response_drafter.hpp
 * \brief Drafts an agent-facing reply for a new ticket from its ranked matches.
 *
 * Modes:
 * - no_evidence: no matches. The model may offer a suggestion of at most 15 words; the
 *   reply is framed as "No matching tickets found in the database."
 * - resolved_evidence: at least one resolved match. Only resolved matches go into the
 *   prompt so the model reuses proven resolutions.
 * - unresolved_evidence: matches exist but none is resolved. All of them go into the
 *   prompt and the reply acknowledges the open issue.
 *
 * Every reply ends with the sign-off line kSignOff.
 */

#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "ticketsim/error.hpp"
#include "ticketsim/generation/generation_provider.hpp"
#include "ticketsim/ticket.hpp"

namespace ticketsim::generation {

enum class draft_mode { no_evidence, resolved_evidence, unresolved_evidence };

inline constexpr std::string_view kSignOff = "Best, your Smart assistant";
inline constexpr std::string_view kNoMatchPreamble = "No matching tickets found in the database.";

class response_drafter {
public:
  explicit response_drafter(std::shared_ptr<const generation_provider> provider)
      : provider_(std::move(provider)) {}

  static auto select_mode(std::span<const match_result> matches) noexcept -> draft_mode;

  /** \brief Messages and sampling settings sent to the model for this ticket. */
  static auto build_request(const ticket_query& ticket, std::span<const match_result> matches)
      -> chat_request;

  /** \brief Generate, then frame the reply and append the sign-off.
   * \return provider_failed if the model call fails; not_initialized without a provider
   */
  auto draft(const ticket_query& ticket, std::span<const match_result> matches) const
      -> std::expected<std::string, core::error>;

private:
  std::shared_ptr<const generation_provider> provider_;
};

} // namespace ticketsim::generation
