#include "TD/TransductionModel.hpp"
#include "TD/Errors.hpp"

namespace td {

TransductionModel::TransductionModel(const ModelConfig &config,
                                     const Vocabulary &source,
                                     const Vocabulary &target,
                                     SplitterOptions splitter, std::ostream *err)
    : splitter_(splitter), strategies_(makeDefaultStrategyRegistry()),
      err_(err) {
  encoder_ = register_module(
      "encoder", std::make_shared<RecurrentEncoder>(config, source.size()));

  DecoderVocabulary vocab;
  vocab.sourceSize = source.size();
  vocab.targetSize = target.size();
  vocab.sosId = target.sosId();
  vocab.eosId = target.eosId();
  decoder_ = register_module("decoder",
                             std::make_shared<RecurrentDecoder>(config, vocab));

  strategies_.setErrOut(err_);
}

void TransductionModel::setDebug(bool enabled) {
  debug_ = enabled;
  strategies_.setDebug(enabled);
}

void TransductionModel::debugLog(const std::string &msg) const {
  if (debug_ && err_) {
    (*err_) << "[TransductionModel] " << msg << std::endl;
  }
}

Tensor TransductionModel::forward(const Batch &batch, double tfRatio) {
  EncodingBag state = encoder_->encode(EncodingBag{{Field::Source, batch.source}});
  state.set({{Field::Source, batch.source}, {Field::Transform, batch.annotation}});
  if (batch.target) {
    state.set(Field::Target, *batch.target);
  }

  debugLog("encoded " + toString(state));
  return decoder_->decode(state, tfRatio).tensor(Field::DecOutputs);
}

EncodingBag TransductionModel::compose(const SubExpressionBatch &split,
                                       const std::vector<Operator> &operators,
                                       const CompositionOptions &options) {
  EncodingBag composite =
      strategies_.compose(split, operators, options, *encoder_, reducer_);
  debugLog("composite (" + toString(options) + ", ops [" +
           toString(operators) + "]): " + toString(composite));
  return composite;
}

Tensor TransductionModel::forwardBatchExpression(const Batch &batch,
                                                 const CompositionOptions &options) {
  const SubExpressionBatch split = splitter_.splitBatch(batch.source);
  debugLog("split into " + std::to_string(split.arity()) + " term(s)");

  const EncodingBag composite = compose(split, batch.operators, options);
  return decodeComposite(composite, split.terms.front(), batch.annotation);
}

Tensor TransductionModel::forwardExpression(const std::vector<BatchTerm> &terms,
                                            bool eosAware) {
  SubExpressionBatch split;
  std::vector<Operator> operators;
  const Batch *first = nullptr;

  for (size_t i = 0; i < terms.size(); ++i) {
    const bool expectOperand = i % 2 == 0;
    if (const auto *b = std::get_if<Batch>(&terms[i])) {
      if (!expectOperand) {
        throw PreconditionError("expected an operator at term " + std::to_string(i));
      }
      if (!first) first = b;
      // Validates markers and padding the same way as a joined expression
      SubExpressionBatch operand = splitter_.splitBatch(b->source);
      if (operand.arity() != 1) {
        throw PreconditionError("operand at term " + std::to_string(i) + " holds " +
                                std::to_string(operand.arity()) + " sub-expressions");
      }
      split.terms.push_back(std::move(operand.terms.front()));
    } else {
      if (expectOperand) {
        throw PreconditionError("expected an operand at term " + std::to_string(i));
      }
      operators.push_back(std::get<Operator>(terms[i]));
    }
  }
  if (!first || terms.size() % 2 == 0) {
    throw PreconditionError("expression must start and end with an operand");
  }

  CompositionOptions options;
  options.eosAware = eosAware;
  const EncodingBag composite = compose(split, operators, options);
  return decodeComposite(composite, split.terms.front(), first->annotation);
}

Tensor TransductionModel::decodeComposite(const EncodingBag &composite,
                                          const Tensor &source,
                                          const Tensor &transform) {
  EncodingBag input{{Field::Source, source}, {Field::Transform, transform}};
  input.merge(composite);

  // Never peek at the ground truth when decoding a composition
  return decoder_->decode(input, 0.0).tensor(Field::DecOutputs);
}

} // namespace td
