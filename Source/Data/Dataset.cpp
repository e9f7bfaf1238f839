#include "TD/Data/Dataset.hpp"
#include "TD/Errors.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>

namespace td {

namespace {

std::vector<std::string> splitColumns(const std::string& line) {
    std::vector<std::string> columns;
    size_t start = 0;
    while (true) {
        const size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            columns.push_back(line.substr(start));
            break;
        }
        columns.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return columns;
}

bool isHeader(const std::vector<std::string>& columns) {
    return !columns.empty() && columns[0] == "source";
}

} // namespace

Tensor padSequences(const std::vector<std::vector<int64_t>>& sequences, int64_t padId) {
    if (sequences.empty()) {
        throw PreconditionError("cannot pad an empty list of sequences");
    }
    size_t longest = 0;
    for (const auto& s : sequences) longest = std::max(longest, s.size());

    Tensor out = torch::full({static_cast<int64_t>(longest), static_cast<int64_t>(sequences.size())},
                             padId, torch::TensorOptions().dtype(kTokenDtype));
    auto acc = out.accessor<int64_t, 2>();
    for (size_t b = 0; b < sequences.size(); ++b) {
        for (size_t t = 0; t < sequences[b].size(); ++t) {
            acc[static_cast<int64_t>(t)][static_cast<int64_t>(b)] = sequences[b][t];
        }
    }
    return out;
}

Dataset Dataset::fromString(std::string_view tsv, const std::string& sourceName) {
    Dataset ds;
    std::istringstream in{std::string(tsv)};
    std::string line;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        const auto columns = splitColumns(line);
        if (lineNo == 1 && isHeader(columns)) continue;

        if (columns.size() < 2 || columns.size() > 3) {
            throw ParseError(sourceName + ":" + std::to_string(lineNo) +
                             ": expected 2 or 3 tab-separated columns, got " +
                             std::to_string(columns.size()));
        }

        Example ex;
        try {
            ex.source = parseExpression(columns[0]);
            ex.annotation = tokenize(columns[1]);
            if (columns.size() == 3) {
                ex.target = tokenize(columns[2]);
                ex.hasTarget = true;
            }
        } catch (const ParseError& e) {
            throw ParseError(sourceName + ":" + std::to_string(lineNo) + ": " + e.what());
        }
        ds.examples_.push_back(std::move(ex));
    }

    return ds;
}

Dataset Dataset::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ParseError("cannot open dataset: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return fromString(buffer.str(), path);
}

Dataset Dataset::filter(const std::string& pattern, bool keepMatches) const {
    std::regex re;
    try {
        re = std::regex(pattern);
    } catch (const std::regex_error& e) {
        throw ParseError("invalid pattern '" + pattern + "': " + e.what());
    }

    Dataset out;
    for (const auto& ex : examples_) {
        if (std::regex_search(toString(ex.source), re) == keepMatches) {
            out.examples_.push_back(ex);
        }
    }
    return out;
}

Dataset Dataset::matching(const std::string& pattern) const {
    return filter(pattern, true);
}

Dataset Dataset::withholding(const std::string& pattern) const {
    return filter(pattern, false);
}

void Dataset::extendVocabularies(Vocabulary& source, Vocabulary& target) const {
    for (const auto& ex : examples_) {
        for (const auto& term : ex.source.terms) {
            for (const auto& w : term) source.add(w);
        }
        for (const auto& w : ex.annotation) source.add(w);
        for (const auto& w : ex.target) target.add(w);
    }
}

std::vector<int64_t> Dataset::encodeSource(const Example& ex, const Vocabulary& source, int64_t delimiterId) {
    std::vector<int64_t> ids{source.sosId()};
    for (size_t k = 0; k < ex.source.terms.size(); ++k) {
        if (k > 0) ids.push_back(delimiterId);
        for (const auto& w : ex.source.terms[k]) ids.push_back(source.lookup(w));
    }
    ids.push_back(source.eosId());
    return ids;
}

std::vector<Batch> Dataset::batches(int64_t batchSize, const Vocabulary& source, const Vocabulary& target,
                                    int64_t delimiterId) const {
    if (batchSize <= 0) {
        throw PreconditionError("batch size must be positive");
    }

    std::vector<Batch> out;
    for (size_t start = 0; start < examples_.size(); start += static_cast<size_t>(batchSize)) {
        const size_t end = std::min(examples_.size(), start + static_cast<size_t>(batchSize));

        std::vector<std::vector<int64_t>> sources, annotations, targets;
        bool allTargets = true;
        const auto& operators = examples_[start].source.operators;

        for (size_t i = start; i < end; ++i) {
            const Example& ex = examples_[i];
            if (ex.source.operators != operators) {
                throw PreconditionError("example " + std::to_string(i) + " uses operators [" +
                                        toString(ex.source.operators) + "], batch uses [" +
                                        toString(operators) + "]");
            }
            sources.push_back(encodeSource(ex, source, delimiterId));
            annotations.push_back(source.encode(ex.annotation, true));
            allTargets = allTargets && ex.hasTarget;
            if (ex.hasTarget) {
                auto ids = target.encode(ex.target, false);
                ids.push_back(target.eosId());
                targets.push_back(std::move(ids));
            }
        }

        Batch batch;
        batch.source = padSequences(sources, source.padId());
        batch.annotation = padSequences(annotations, source.padId());
        if (allTargets) {
            batch.target = padSequences(targets, target.padId());
        }
        batch.operators = operators;
        out.push_back(std::move(batch));
    }
    return out;
}

} // namespace td
