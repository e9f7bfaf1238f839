#pragma once

#include "TD/Config.hpp"
#include "TD/EncodingBag.hpp"

#include <string>
#include <utility>

namespace td {

// A GRU or LSTM stack behind one interface. The GRU state is a single
// (layers x batch x hidden) tensor; the LSTM state is the tuple (h, c).
class RecurrentLayerImpl : public torch::nn::Module {
public:
  RecurrentLayerImpl(RecurrentUnit unit, int64_t inputDim, int64_t hiddenDim,
                     int64_t numLayers, double dropout);

  // input: (time x batch x inputDim); state may be null for a zero state.
  // Returns per-step outputs (time x batch x hiddenDim) and the final state.
  std::pair<Tensor, FieldValue> forward(const Tensor &input,
                                        const FieldValue *state = nullptr);

  FieldValue zeroState(int64_t batch, const torch::TensorOptions &options) const;

  // Throws ShapeContractError naming `who` if state does not fit this layer
  void checkState(const FieldValue &state, int64_t batch,
                  const std::string &who) const;

  RecurrentUnit unit() const { return unit_; }
  int64_t hiddenDim() const { return hiddenDim_; }
  int64_t numLayers() const { return numLayers_; }

private:
  RecurrentUnit unit_;
  int64_t hiddenDim_;
  int64_t numLayers_;
  torch::nn::GRU gru_{nullptr};
  torch::nn::LSTM lstm_{nullptr};
};

TORCH_MODULE(RecurrentLayer);

} // namespace td
