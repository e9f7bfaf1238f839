#pragma once

#include <torch/torch.h>
#include <cstdint>
#include <vector>

namespace td {

// Alias our Tensor type to LibTorch's tensor
using Tensor = torch::Tensor;

// Ordered group of tensors forming one recurrent state, e.g. LSTM (h, c)
using TensorTuple = std::vector<Tensor>;

// Token type used for every id tensor
constexpr auto kTokenDtype = torch::kInt64;

} // namespace td
