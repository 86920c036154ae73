#pragma once

/** \file logging.hpp
 *  \brief spdlog setup for the library and its drivers.
 *
 * Components log through the default spdlog logger and prefix messages with their dotted
 * component tag, e.g. "[index.hnsw]". TICKETSIM_LOG_LEVEL selects the level:
 * trace | debug | info | warn | error | off (default info).
 */

#include <expected>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "ticketsim/error.hpp"

namespace ticketsim {

/** \brief Map a level name to spdlog's enum; nullopt for unknown names. */
auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum>;

/** \brief Apply TICKETSIM_LOG_LEVEL (if set) and the default pattern to the default logger.
 *
 * Returns config_invalid for an unknown level name; the logger is left unchanged.
 */
auto configure_logging() -> std::expected<void, core::error>;

} // namespace ticketsim
