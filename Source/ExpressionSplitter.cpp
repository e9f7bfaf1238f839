#include "TD/ExpressionSplitter.hpp"
#include "TD/Errors.hpp"

#include <sstream>

namespace td {

namespace {

Tensor marker(int64_t id, const Tensor &like) {
  return torch::full({1}, id, like.options());
}

std::vector<int64_t> toVector(const Tensor &positions) {
  Tensor cpu = positions.to(torch::kCPU).to(kTokenDtype).contiguous();
  const int64_t *data = cpu.data_ptr<int64_t>();
  return std::vector<int64_t>(data, data + cpu.numel());
}

std::string toString(const std::vector<int64_t> &v) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) oss << ", ";
    oss << v[i];
  }
  oss << "]";
  return oss.str();
}

} // namespace

int64_t SubExpressionBatch::batchSize() const {
  return terms.empty() ? 0 : terms.front().size(1);
}

ExpressionSplitter::ExpressionSplitter(SplitterOptions options)
    : options_(options) {}

std::vector<int64_t>
ExpressionSplitter::operatorPositions(const Tensor &sequence) const {
  if (sequence.dim() != 1) {
    throw PreconditionError("operatorPositions expects a 1-D sequence, got " +
                            std::to_string(sequence.dim()) + " dimension(s)");
  }
  return toVector(torch::nonzero(sequence == options_.delimiterId).flatten());
}

void ExpressionSplitter::checkMarkers(const std::vector<int64_t> &positions,
                                      int64_t length) const {
  for (size_t i = 0; i < positions.size(); ++i) {
    const int64_t p = positions[i];
    if (p == 0) {
      throw PreconditionError("operator marker replaces the start marker");
    }
    if (p == length - 1) {
      throw PreconditionError("operator marker replaces the end marker");
    }
    if (i > 0 && p == positions[i - 1] + 1) {
      throw PreconditionError("empty sub-expression between operators at " +
                              std::to_string(p - 1) + " and " +
                              std::to_string(p));
    }
  }
}

std::vector<Tensor> ExpressionSplitter::splitSequence(const Tensor &sequence) const {
  if (sequence.dim() != 1) {
    throw PreconditionError("splitSequence expects a 1-D sequence");
  }
  const Tensor content = unpadded(sequence);
  const int64_t length = content.size(0);
  if (length < 2) {
    throw PreconditionError("sequence must hold at least a start and an end marker");
  }
  if (content[0].item<int64_t>() != options_.sosId) {
    throw PreconditionError("sequence does not begin with the start marker " +
                            std::to_string(options_.sosId));
  }
  if (content[length - 1].item<int64_t>() != options_.eosId) {
    throw PreconditionError("sequence does not end with the end marker " +
                            std::to_string(options_.eosId));
  }

  const auto positions = operatorPositions(content);
  checkMarkers(positions, length);

  std::vector<Tensor> pieces;
  pieces.reserve(positions.size() + 1);

  int64_t start = 0;
  for (size_t i = 0; i <= positions.size(); ++i) {
    const int64_t end = i < positions.size() ? positions[i] : length;
    Tensor piece = content.narrow(0, start, end - start).clone();

    if (i > 0) {
      piece[0] = options_.sosId;
    }
    if (i < positions.size()) {
      piece = torch::cat({piece, marker(options_.eosId, content)});
    }

    pieces.push_back(std::move(piece));
    start = end;
  }

  return pieces;
}

Tensor ExpressionSplitter::unpadded(const Tensor &sequence) const {
  int64_t length = sequence.size(0);
  while (length > 0 && sequence[length - 1].item<int64_t>() == options_.padId) {
    --length;
  }
  return sequence.narrow(0, 0, length);
}

std::vector<std::vector<Tensor>> ExpressionSplitter::split(const Tensor &batch) const {
  if (batch.dim() != 2) {
    throw PreconditionError("split expects a (time x batch) tensor");
  }

  std::vector<std::vector<Tensor>> expressions;
  expressions.reserve(batch.size(1));

  for (int64_t b = 0; b < batch.size(1); ++b) {
    auto pieces = splitSequence(batch.select(1, b));
    if (!expressions.empty() && pieces.size() != expressions.front().size()) {
      throw PreconditionError(
          "example " + std::to_string(b) + " has " +
          std::to_string(pieces.size() - 1) + " operator(s), example 0 has " +
          std::to_string(expressions.front().size() - 1));
    }
    expressions.push_back(std::move(pieces));
  }

  return expressions;
}

SubExpressionBatch ExpressionSplitter::splitBatch(const Tensor &batch) const {
  if (batch.dim() != 2 || batch.size(1) == 0) {
    throw PreconditionError("splitBatch expects a non-empty (time x batch) tensor");
  }

  const auto reference = operatorPositions(batch.select(1, 0));
  for (int64_t b = 1; b < batch.size(1); ++b) {
    const auto positions = operatorPositions(batch.select(1, b));
    if (positions != reference) {
      throw PreconditionError("example " + std::to_string(b) +
                              " has operators at " + toString(positions) +
                              ", example 0 at " + toString(reference));
    }
  }

  const auto expressions = split(batch);

  SubExpressionBatch out;
  out.terms.reserve(reference.size() + 1);
  for (size_t k = 0; k <= reference.size(); ++k) {
    std::vector<Tensor> column;
    column.reserve(expressions.size());
    for (size_t b = 0; b < expressions.size(); ++b) {
      const Tensor &piece = expressions[b][k];
      if (!column.empty() && piece.size(0) != column.front().size(0)) {
        throw PreconditionError("term " + std::to_string(k) + " of example " +
                                std::to_string(b) + " spans " +
                                std::to_string(piece.size(0)) +
                                " step(s), example 0 spans " +
                                std::to_string(column.front().size(0)));
      }
      column.push_back(piece);
    }
    out.terms.push_back(torch::stack(column, 1));
  }
  return out;
}

Tensor ExpressionSplitter::join(const std::vector<Tensor> &pieces) const {
  if (pieces.empty()) {
    throw PreconditionError("join expects at least one sub-expression");
  }

  std::vector<Tensor> parts;
  parts.reserve(pieces.size());
  for (size_t i = 0; i < pieces.size(); ++i) {
    Tensor piece = pieces[i].clone();
    if (i + 1 < pieces.size()) {
      piece = piece.narrow(0, 0, piece.size(0) - 1);
    }
    if (i > 0) {
      piece[0] = options_.delimiterId;
    }
    parts.push_back(std::move(piece));
  }
  return torch::cat(parts);
}

} // namespace td
