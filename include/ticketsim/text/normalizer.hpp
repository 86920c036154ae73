#pragma once

/** \file normalizer.hpp
 *  \brief Canonical text form of a ticket used for embedding.
 */

#include <optional>
#include <string>

#include "ticketsim/ticket.hpp"

namespace ticketsim::text {

/** \brief Join issue, category and description with single spaces, then trim the ends.
 *
 * Missing fields count as empty strings. Whitespace inside a field is preserved. Pure; never
 * fails.
 */
auto normalize(const std::optional<std::string>& issue,
               const std::optional<std::string>& category,
               const std::optional<std::string>& description) -> std::string;

/** \brief normalize() applied to a record's three text fields. */
auto normalize(const ticket_record& record) -> std::string;

} // namespace ticketsim::text
