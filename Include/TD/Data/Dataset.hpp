#pragma once

#include "TD/core.hpp"
#include "TD/Data/ExpressionParser.hpp"
#include "TD/Data/Vocabulary.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace td {

// One line of a TSV file: source \t annotation [\t target]
struct Example {
    ParsedExpression source;
    std::vector<std::string> annotation;
    std::vector<std::string> target;
    bool hasTarget{false};
};

// Time-major padded tensors for a group of examples
struct Batch {
    Tensor source;                 // (time x batch), sub-expressions joined by the delimiter id
    Tensor annotation;             // (time x batch), source vocabulary
    std::optional<Tensor> target;  // (time x batch), target vocabulary, ends with <eos>
    std::vector<Operator> operators;

    int64_t size() const { return source.defined() ? source.size(1) : 0; }
};

// Pads id sequences with padId into a (time x batch) tensor
Tensor padSequences(const std::vector<std::vector<int64_t>>& sequences, int64_t padId);

class Dataset {
public:
    static Dataset fromString(std::string_view tsv, const std::string& sourceName = "<tsv>");
    static Dataset fromFile(const std::string& path);

    const std::vector<Example>& examples() const { return examples_; }
    size_t size() const { return examples_.size(); }
    bool empty() const { return examples_.empty(); }

    // Examples whose canonical source text (see toString(ParsedExpression))
    // matches an ECMAScript pattern anywhere. Throws ParseError on a bad pattern.
    Dataset matching(const std::string& pattern) const;

    // The complement of matching(): the examples left after withholding
    Dataset withholding(const std::string& pattern) const;

    // Registers source/annotation words and target words. Operators are
    // never added: they must keep mapping to the delimiter id.
    void extendVocabularies(Vocabulary& source, Vocabulary& target) const;

    // <sos> term1 <delim> term2 <delim> ... termN <eos>
    static std::vector<int64_t> encodeSource(const Example& ex, const Vocabulary& source, int64_t delimiterId);

    // Consecutive groups of batchSize examples. Examples in one batch must
    // share their operators.
    std::vector<Batch> batches(int64_t batchSize, const Vocabulary& source, const Vocabulary& target,
                               int64_t delimiterId) const;

private:
    Dataset filter(const std::string& pattern, bool keepMatches) const;

    std::vector<Example> examples_;
};

} // namespace td
