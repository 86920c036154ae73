#pragma once

/**
 * \file ticket.hpp
 * \brief Ticket records and the match results produced for a query.
 *
 * Ownership: ticket_record values are owned by the corpus (ticket_corpus) and held read-only
 * by the matcher for the lifetime of a loaded corpus. match_result is a transient snapshot
 * handed to the caller by value.
 */

#include <optional>
#include <string>

namespace ticketsim {

/** \brief One previously recorded support ticket. */
struct ticket_record {
  std::string id;                          /**< stable, externally assigned, unique */
  std::optional<std::string> issue;
  std::optional<std::string> category;
  std::optional<std::string> description;
  bool resolved{false};
  std::string resolution;                  /**< empty when unresolved */
};

/** \brief Fields of an incoming ticket to be matched. */
struct ticket_query {
  std::optional<std::string> issue;
  std::optional<std::string> category;
  std::optional<std::string> description;
};

/** \brief One ranked match for a query ticket. */
struct match_result {
  std::string ticket_id;
  float similarity{};                      /**< 1 - cosine distance, in [-1, 1] */
  std::optional<std::string> issue;
  std::optional<std::string> category;
  std::optional<std::string> description;
  bool resolved{false};
  std::string resolution;
};

} // namespace ticketsim
