#include "ticketsim/logging.hpp"

#include <string>

#include "ticketsim/core/platform_utils.hpp"

namespace ticketsim {

auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum> {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error" || name == "err") return spdlog::level::err;
  if (name == "off") return spdlog::level::off;
  return std::nullopt;
}

auto configure_logging() -> std::expected<void, core::error> {
  auto level = spdlog::level::info;
  if (auto env = core::safe_getenv("TICKETSIM_LOG_LEVEL"); env && !env->empty()) {
    auto parsed = parse_log_level(*env);
    if (!parsed) {
      return core::make_error(core::error_code::config_invalid,
                              "Unknown TICKETSIM_LOG_LEVEL '" + *env + "'", "logging");
    }
    level = *parsed;
  }
  spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
  spdlog::set_level(level);
  return {};
}

} // namespace ticketsim
