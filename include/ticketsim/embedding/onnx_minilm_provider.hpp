#pragma once

/** \file onnx_minilm_provider.hpp
 *  \brief Local sentence-transformers MiniLM (all-MiniLM-L6-v2) embeddings via onnxruntime.
 *
 * Pipeline: WordPiece ids -> transformer last_hidden_state -> mean pooling over the
 * attention mask -> L2 normalization. Only built when onnxruntime is available
 * (TICKETSIM_HAS_ONNXRUNTIME).
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "ticketsim/embedding/embedding_provider.hpp"
#include "ticketsim/embedding/wordpiece_tokenizer.hpp"

namespace ticketsim::embedding {

struct onnx_minilm_options {
  std::filesystem::path model_path;    /**< model.onnx */
  std::filesystem::path vocab_path;    /**< vocab.txt */
  std::size_t dimension{384};
  std::size_t max_seq_len{256};
  int intra_op_threads{1};
};

class onnx_minilm_provider final : public embedding_provider {
public:
  /** \brief Load tokenizer and session; io_failed / data_integrity for bad files,
   *         provider_failed when onnxruntime rejects the model.
   */
  static auto create(const onnx_minilm_options& options)
      -> std::expected<std::unique_ptr<onnx_minilm_provider>, core::error>;

  auto dimension() const noexcept -> std::size_t override { return options_.dimension; }

  auto embed_batch(std::span<const std::string> texts) const
      -> std::expected<std::vector<std::vector<float>>, core::error> override;

private:
  onnx_minilm_provider(onnx_minilm_options options, wordpiece_tokenizer tokenizer)
      : options_(std::move(options)), tokenizer_(std::move(tokenizer)) {}

  onnx_minilm_options options_;
  wordpiece_tokenizer tokenizer_;

  Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "ticketsim"};
  Ort::SessionOptions session_options_;
  std::unique_ptr<Ort::Session> session_;
  std::vector<std::string> input_names_;
  std::string output_name_;
};

} // namespace ticketsim::embedding
