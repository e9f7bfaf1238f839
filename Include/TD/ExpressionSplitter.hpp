#pragma once

#include "TD/core.hpp"

#include <vector>

namespace td {

struct SplitterOptions {
  // Token id marking an operator between two sub-expressions. Defaults to
  // the vocabulary's <unk> id: "+" and "-" never enter the vocabulary, so
  // they arrive as <unk>. Any genuine <unk> inside a sentence is therefore
  // read as an operator too.
  int64_t delimiterId{0};

  // Markers framing every sub-expression, and the padding that follows the
  // end marker of shorter examples. Defaults match Vocabulary.
  int64_t sosId{2};
  int64_t eosId{3};
  int64_t padId{1};
};

// Sub-expressions of a batch stacked per term: terms[k] is (time_k x batch).
struct SubExpressionBatch {
  std::vector<Tensor> terms;

  size_t arity() const { return terms.size(); }
  int64_t batchSize() const;
};

// Cuts operator-delimited token sequences into sub-expressions, each framed
// by the configured start and end markers:
//
//   <sos> alice sees herself <unk> alice meets claire <eos>
//   -> <sos> alice sees herself <eos>
//   -> <sos> alice meets claire <eos>
class ExpressionSplitter {
public:
  explicit ExpressionSplitter(SplitterOptions options = {});

  const SplitterOptions &options() const { return options_; }

  // Indices of delimiter tokens in a 1-D sequence
  std::vector<int64_t> operatorPositions(const Tensor &sequence) const;

  // Split a single 1-D sequence. Trailing padding is dropped first; the
  // sequence must then begin with sosId and end with eosId. The input is
  // never modified.
  std::vector<Tensor> splitSequence(const Tensor &sequence) const;

  // Split every column of a (time x batch) tensor. All columns must carry
  // the same number of operators. Columns may be padded to different lengths.
  std::vector<std::vector<Tensor>> split(const Tensor &batch) const;

  // As split(), stacking each term across the batch. Operator positions
  // and unpadded lengths must be identical in every column, so that each
  // stacked term ends with eosId in its last row.
  SubExpressionBatch splitBatch(const Tensor &batch) const;

  // Inverse of splitSequence: drops synthesized markers and restores the
  // delimiters between pieces.
  Tensor join(const std::vector<Tensor> &pieces) const;

private:
  void checkMarkers(const std::vector<int64_t> &positions, int64_t length) const;

  // Drops trailing padId tokens
  Tensor unpadded(const Tensor &sequence) const;

  SplitterOptions options_;
};

} // namespace td
