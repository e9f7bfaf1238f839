#include "TD/Model/RecurrentLayer.hpp"
#include "TD/Errors.hpp"

#include <sstream>

namespace td {

RecurrentLayerImpl::RecurrentLayerImpl(RecurrentUnit unit, int64_t inputDim,
                                       int64_t hiddenDim, int64_t numLayers,
                                       double dropout)
    : unit_(unit), hiddenDim_(hiddenDim), numLayers_(numLayers) {
  // LibTorch only applies dropout between stacked layers
  const double between = numLayers > 1 ? dropout : 0.0;

  switch (unit_) {
  case RecurrentUnit::GRU:
    gru_ = register_module(
        "gru", torch::nn::GRU(torch::nn::GRUOptions(inputDim, hiddenDim)
                                  .num_layers(numLayers)
                                  .dropout(between)));
    break;
  case RecurrentUnit::LSTM:
    lstm_ = register_module(
        "lstm", torch::nn::LSTM(torch::nn::LSTMOptions(inputDim, hiddenDim)
                                    .num_layers(numLayers)
                                    .dropout(between)));
    break;
  }
}

std::pair<Tensor, FieldValue>
RecurrentLayerImpl::forward(const Tensor &input, const FieldValue *state) {
  if (state) {
    checkState(*state, input.size(1), "RecurrentLayer");
  }

  if (unit_ == RecurrentUnit::GRU) {
    Tensor h0 = state ? std::get<Tensor>(*state) : Tensor();
    auto [outputs, hn] = gru_->forward(input, h0);
    return {outputs, FieldValue{hn}};
  }

  torch::optional<std::tuple<Tensor, Tensor>> hx;
  if (state) {
    const auto &tuple = std::get<TensorTuple>(*state);
    hx = std::make_tuple(tuple[0], tuple[1]);
  }
  auto [outputs, hc] = lstm_->forward(input, hx);
  return {outputs, FieldValue{TensorTuple{std::get<0>(hc), std::get<1>(hc)}}};
}

FieldValue RecurrentLayerImpl::zeroState(int64_t batch,
                                         const torch::TensorOptions &options) const {
  Tensor zeros = torch::zeros({numLayers_, batch, hiddenDim_}, options);
  if (unit_ == RecurrentUnit::GRU) {
    return zeros;
  }
  return TensorTuple{zeros, zeros.clone()};
}

void RecurrentLayerImpl::checkState(const FieldValue &state, int64_t batch,
                                    const std::string &who) const {
  const size_t expectedArity = unit_ == RecurrentUnit::GRU ? 0 : 2;

  TensorTuple parts;
  if (const auto *t = std::get_if<Tensor>(&state)) {
    if (expectedArity != 0) {
      throw ShapeContractError(who + ": " + toString(unit_) +
                               " expects an (h, c) tuple state, got a tensor");
    }
    parts.push_back(*t);
  } else {
    parts = std::get<TensorTuple>(state);
    if (parts.size() != expectedArity) {
      throw ShapeContractError(who + ": " + toString(unit_) + " expects " +
                               (expectedArity ? "a 2-tuple" : "a single tensor") +
                               " state, got a " + std::to_string(parts.size()) +
                               "-tuple");
    }
  }

  for (const auto &p : parts) {
    if (p.dim() != 3 || p.size(0) != numLayers_ || p.size(1) != batch ||
        p.size(2) != hiddenDim_) {
      std::ostringstream oss;
      oss << who << ": state of shape " << p.sizes() << " does not match ["
          << numLayers_ << ", " << batch << ", " << hiddenDim_ << "]";
      throw ShapeContractError(oss.str());
    }
  }
}

} // namespace td
