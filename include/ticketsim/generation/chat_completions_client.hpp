#pragma once

/** \file chat_completions_client.hpp
 *  \brief generation_provider for OpenAI-compatible /v1/chat/completions endpoints
 *         (Hugging Face Inference API, vLLM, llama.cpp server, ...).
 */

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "ticketsim/config.hpp"
#include "ticketsim/generation/generation_provider.hpp"

namespace ticketsim::generation {

class chat_completions_client final : public generation_provider {
public:
  /** \brief Reads the bearer token from config.api_key_env; config_invalid if unset. */
  static auto create(chat_config config)
      -> std::expected<std::unique_ptr<chat_completions_client>, core::error>;

  chat_completions_client(chat_config config, std::string api_key)
      : config_(std::move(config)), api_key_(std::move(api_key)) {}

  auto complete(const chat_request& request) const
      -> std::expected<std::string, core::error> override;

  /** \brief {model, messages, max_tokens, temperature, top_p} as JSON text. */
  static auto make_request_body(std::string_view model, const chat_request& request)
      -> std::string;

  /** \brief choices[0].message.content; provider_failed when absent or not JSON. */
  static auto parse_response_body(std::string_view body)
      -> std::expected<std::string, core::error>;

private:
  chat_config config_;
  std::string api_key_;
};

} // namespace ticketsim::generation
