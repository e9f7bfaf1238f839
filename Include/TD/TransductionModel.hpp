#pragma once

#include "TD/ArithmeticReducer.hpp"
#include "TD/Config.hpp"
#include "TD/Data/Dataset.hpp"
#include "TD/Data/Vocabulary.hpp"
#include "TD/ExpressionSplitter.hpp"
#include "TD/Model/RecurrentDecoder.hpp"
#include "TD/Model/RecurrentEncoder.hpp"
#include "TD/Runtime/StrategyRegistry.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace td {

// One operand batch (already a complete sub-expression) or an operator
using BatchTerm = std::variant<Batch, Operator>;

// Encoder/decoder pair plus the machinery for composing sub-expression
// encodings arithmetically before decoding.
class TransductionModel : public torch::nn::Module {
public:
  TransductionModel(const ModelConfig &config, const Vocabulary &source,
                    const Vocabulary &target, SplitterOptions splitter = {},
                    std::ostream *err = &std::cerr);

  // Plain encode/decode of a batch
  Tensor forward(const Batch &batch, double tfRatio = 0.0);

  // Splits every source at the operator markers, composes the sub-expression
  // encodings per options and batch.operators, and decodes without teacher
  // forcing. Returns (time x batch x vocabulary) logits.
  Tensor forwardBatchExpression(const Batch &batch,
                                const CompositionOptions &options = {});

  // Same for sub-expressions supplied as separate batches:
  //   {batchA, Operator::Minus, batchB, Operator::Plus, batchC}
  // Examples within one operand batch must have equal unpadded lengths.
  Tensor forwardExpression(const std::vector<BatchTerm> &terms,
                           bool eosAware = false);

  // Composite encoding only, without decoding
  EncodingBag compose(const SubExpressionBatch &split,
                      const std::vector<Operator> &operators,
                      const CompositionOptions &options);

  void setDebug(bool enabled);
  bool debug() const { return debug_; }

  RecurrentEncoder &encoder() { return *encoder_; }
  RecurrentDecoder &decoder() { return *decoder_; }
  const ExpressionSplitter &splitter() const { return splitter_; }

private:
  Tensor decodeComposite(const EncodingBag &composite, const Tensor &source,
                         const Tensor &transform);

  void debugLog(const std::string &msg) const;

  std::shared_ptr<RecurrentEncoder> encoder_;
  std::shared_ptr<RecurrentDecoder> decoder_;
  ExpressionSplitter splitter_;
  ArithmeticReducer reducer_;
  StrategyRegistry strategies_;

  std::ostream *err_{&std::cerr};
  bool debug_{false};
};

} // namespace td
