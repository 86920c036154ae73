#pragma once

/** \file generation_provider.hpp
 *  \brief Seam for chat-style text generation models.
 */

#include <expected>
#include <string>
#include <vector>

#include "ticketsim/error.hpp"

namespace ticketsim::generation {

struct chat_message {
  std::string role;      /**< "system" | "user" | "assistant" */
  std::string content;
};

struct sampling_params {
  int max_tokens{1024};
  float temperature{0.3f};
  float top_p{0.95f};
};

struct chat_request {
  std::vector<chat_message> messages;
  sampling_params sampling;
};

class generation_provider {
public:
  virtual ~generation_provider() = default;

  /** \brief Generated text for the request; provider_failed on any failure. */
  virtual auto complete(const chat_request& request) const
      -> std::expected<std::string, core::error> = 0;
};

} // namespace ticketsim::generation
