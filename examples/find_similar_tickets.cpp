/**
 * Find tickets similar to a new one and draft a reply
 *
 * This example demonstrates:
 * - Loading settings from TICKETSIM_* environment variables
 * - Opening a matcher over a CSV corpus (building or loading the index)
 * - Querying with a partially filled ticket
 * - Drafting an agent reply when a chat endpoint key is available
 *
 * Usage: find_similar_tickets [corpus.csv] [index.hnsw]
 *
 * Embeddings come from the Ollama-style endpoint in TICKETSIM_EMBED_ENDPOINT, or from a
 * local MiniLM model when built with onnxruntime and TICKETSIM_ONNX_MODEL and
 * TICKETSIM_ONNX_VOCAB are set.
 */

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include <ticketsim/config.hpp>
#include <ticketsim/core/platform_utils.hpp>
#include <ticketsim/embedding/http_embedding_provider.hpp>
#include <ticketsim/generation/chat_completions_client.hpp>
#include <ticketsim/generation/response_drafter.hpp>
#include <ticketsim/logging.hpp>
#include <ticketsim/ticket_matcher.hpp>
#if defined(TICKETSIM_HAS_ONNXRUNTIME)
#include <ticketsim/embedding/onnx_minilm_provider.hpp>
#endif

namespace {

auto make_provider(const ticketsim::settings& s)
    -> std::expected<std::shared_ptr<const ticketsim::embedding::embedding_provider>,
                     ticketsim::core::error> {
#if defined(TICKETSIM_HAS_ONNXRUNTIME)
    auto model = ticketsim::core::safe_getenv("TICKETSIM_ONNX_MODEL");
    auto vocab = ticketsim::core::safe_getenv("TICKETSIM_ONNX_VOCAB");
    if (model && vocab) {
        ticketsim::embedding::onnx_minilm_options opts;
        opts.model_path = *model;
        opts.vocab_path = *vocab;
        opts.dimension = s.matcher.dimension;
        auto local = ticketsim::embedding::onnx_minilm_provider::create(opts);
        if (!local) return std::unexpected(local.error());
        spdlog::info("using local MiniLM model {}", *model);
        return std::shared_ptr<const ticketsim::embedding::embedding_provider>(std::move(*local));
    }
#endif
    spdlog::info("using embedding endpoint {} ({})", s.embedding.endpoint, s.embedding.model);
    return std::make_shared<ticketsim::embedding::http_embedding_provider>(s.embedding);
}

int fail(const ticketsim::core::error& e) {
    std::cerr << "Error [" << ticketsim::core::to_string(e.code) << "] " << e.component
              << ": " << e.message << "\n";
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace ticketsim;

    if (auto r = configure_logging(); !r) return fail(r.error());

    settings base;
    base.matcher.corpus_path = argc > 1 ? argv[1] : "tickets.csv";
    if (argc > 2) base.matcher.index_path = argv[2];
    auto s = config_from_env(base);
    if (!s) return fail(s.error());

    auto provider = make_provider(*s);
    if (!provider) return fail(provider.error());

    auto matcher = ticket_matcher::open(s->matcher, std::move(*provider));
    if (!matcher) return fail(matcher.error());
    std::cout << "Indexed " << (*matcher)->size() << " tickets from "
              << s->matcher.corpus_path << "\n";

    const ticket_query ticket{"Printer not connecting to WiFi", "Hardware",
                              "The office printer shows offline for every laptop"};
    auto matches = (*matcher)->find_similar(ticket);
    if (!matches) return fail(matches.error());

    std::cout << "\nSimilar tickets (" << matches->size() << "):\n";
    for (const auto& m : *matches) {
        std::cout << "  " << std::left << std::setw(10) << m.ticket_id << std::fixed
                  << std::setprecision(3) << m.similarity << "  "
                  << (m.resolved ? "resolved  " : "open      ") << m.issue.value_or("-")
                  << "\n";
        if (m.resolved && !m.resolution.empty()) {
            std::cout << "            -> " << m.resolution << "\n";
        }
    }

    auto chat = generation::chat_completions_client::create(s->chat);
    if (!chat) {
        spdlog::info("skipping reply draft: {}", chat.error().message);
        return 0;
    }
    generation::response_drafter drafter(std::shared_ptr<const generation::generation_provider>(
        std::move(*chat)));
    auto reply = drafter.draft(ticket, *matches);
    if (!reply) return fail(reply.error());
    std::cout << "\nDraft reply:\n" << *reply << "\n";
    return 0;
}
