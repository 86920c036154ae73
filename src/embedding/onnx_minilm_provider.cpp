#include "ticketsim/embedding/onnx_minilm_provider.hpp"

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>

#include "ticketsim/kernels/distance.hpp"

namespace ticketsim::embedding {

namespace {

constexpr const char* kComponent = "embedding.onnx";

} // namespace

auto onnx_minilm_provider::create(const onnx_minilm_options& options)
    -> std::expected<std::unique_ptr<onnx_minilm_provider>, core::error> {
  auto tok = wordpiece_tokenizer::from_vocab_file(options.vocab_path);
  if (!tok) return std::unexpected(tok.error());

  std::unique_ptr<onnx_minilm_provider> p(new onnx_minilm_provider(options, std::move(*tok)));
  try {
    p->session_options_.SetIntraOpNumThreads(options.intra_op_threads);
    p->session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
    p->session_ = std::make_unique<Ort::Session>(p->env_, options.model_path.c_str(),
                                                 p->session_options_);

    Ort::AllocatorWithDefaultOptions allocator;
    const std::size_t n_inputs = p->session_->GetInputCount();
    if (n_inputs < 2 || n_inputs > 3) {
      return core::make_error(core::error_code::provider_failed,
                              "Unexpected input count " + std::to_string(n_inputs) +
                                  " in " + options.model_path.string(),
                              kComponent);
    }
    for (std::size_t i = 0; i < n_inputs; ++i) {
      p->input_names_.emplace_back(p->session_->GetInputNameAllocated(i, allocator).get());
    }
    p->output_name_ = p->session_->GetOutputNameAllocated(0, allocator).get();
  } catch (const Ort::Exception& e) {
    return core::make_error(core::error_code::provider_failed,
                            std::string("onnxruntime: ") + e.what(), kComponent);
  }
  spdlog::info("[{}] loaded {} ({} inputs, output '{}')", kComponent,
               options.model_path.string(), p->input_names_.size(), p->output_name_);
  return p;
}

auto onnx_minilm_provider::embed_batch(std::span<const std::string> texts) const
    -> std::expected<std::vector<std::vector<float>>, core::error> {
  if (texts.empty()) return std::vector<std::vector<float>>{};

  // Pad every sequence to the longest one in the batch.
  std::vector<std::vector<std::int64_t>> encoded;
  encoded.reserve(texts.size());
  std::size_t seq_len = 0;
  for (const auto& t : texts) {
    encoded.push_back(tokenizer_.encode(t, options_.max_seq_len));
    seq_len = std::max(seq_len, encoded.back().size());
  }

  const std::size_t batch = texts.size();
  std::vector<std::int64_t> ids(batch * seq_len, tokenizer_.pad_id());
  std::vector<std::int64_t> mask(batch * seq_len, 0);
  std::vector<std::int64_t> type_ids(batch * seq_len, 0);
  for (std::size_t b = 0; b < batch; ++b) {
    std::copy(encoded[b].begin(), encoded[b].end(), ids.begin() + b * seq_len);
    std::fill_n(mask.begin() + b * seq_len, encoded[b].size(), 1);
  }
  const std::array<std::int64_t, 2> shape{static_cast<std::int64_t>(batch),
                                          static_cast<std::int64_t>(seq_len)};

  try {
    auto mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
    std::vector<Ort::Value> inputs;
    inputs.push_back(Ort::Value::CreateTensor<std::int64_t>(mem, ids.data(), ids.size(),
                                                            shape.data(), shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<std::int64_t>(mem, mask.data(), mask.size(),
                                                            shape.data(), shape.size()));
    if (input_names_.size() == 3) {
      inputs.push_back(Ort::Value::CreateTensor<std::int64_t>(
          mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()));
    }
    std::vector<const char*> in_names;
    for (const auto& n : input_names_) in_names.push_back(n.c_str());
    const char* out_names[1] = {output_name_.c_str()};

    auto outs = session_->Run(Ort::RunOptions{nullptr}, in_names.data(), inputs.data(),
                              inputs.size(), out_names, 1);

    auto shp = outs[0].GetTensorTypeAndShapeInfo().GetShape();   // [batch, seq_len, hidden]
    if (shp.size() != 3 || static_cast<std::size_t>(shp[0]) != batch ||
        static_cast<std::size_t>(shp[1]) != seq_len ||
        static_cast<std::size_t>(shp[2]) != options_.dimension) {
      return core::make_error(core::error_code::provider_failed,
                              "Unexpected output shape from model", kComponent);
    }
    const float* data = outs[0].GetTensorData<float>();
    const std::size_t hidden = options_.dimension;

    std::vector<std::vector<float>> result;
    result.reserve(batch);
    for (std::size_t b = 0; b < batch; ++b) {
      std::vector<float> pooled(hidden, 0.0f);
      const std::size_t tokens = encoded[b].size();
      for (std::size_t t = 0; t < tokens; ++t) {
        const float* row = data + (b * seq_len + t) * hidden;
        for (std::size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
      }
      const float inv = 1.0f / static_cast<float>(tokens);
      for (float& x : pooled) x *= inv;
      kernels::normalize_in_place(pooled);
      result.push_back(std::move(pooled));
    }
    return result;
  } catch (const Ort::Exception& e) {
    return core::make_error(core::error_code::provider_failed,
                            std::string("onnxruntime: ") + e.what(), kComponent);
  }
}

} // namespace ticketsim::embedding
