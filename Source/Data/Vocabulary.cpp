#include "TD/Data/Vocabulary.hpp"

#include <stdexcept>

namespace td {

Vocabulary::Vocabulary() {
  add(kUnk);
  add(kPad);
  add(kSos);
  add(kEos);
}

int64_t Vocabulary::add(const std::string &token) {
  auto it = ids_.find(token);
  if (it != ids_.end()) return it->second;
  const int64_t id = size();
  tokens_.push_back(token);
  ids_.emplace(token, id);
  return id;
}

bool Vocabulary::contains(const std::string &token) const {
  return ids_.find(token) != ids_.end();
}

int64_t Vocabulary::lookup(const std::string &token) const {
  auto it = ids_.find(token);
  return it == ids_.end() ? unkId() : it->second;
}

const std::string &Vocabulary::token(int64_t id) const {
  if (id < 0 || id >= size()) {
    throw std::out_of_range("Vocabulary: id out of range: " + std::to_string(id));
  }
  return tokens_[static_cast<size_t>(id)];
}

std::vector<int64_t> Vocabulary::encode(const std::vector<std::string> &tokens,
                                        bool addMarkers) const {
  std::vector<int64_t> ids;
  ids.reserve(tokens.size() + 2);
  if (addMarkers) ids.push_back(sosId());
  for (const auto &t : tokens) ids.push_back(lookup(t));
  if (addMarkers) ids.push_back(eosId());
  return ids;
}

std::vector<std::string> Vocabulary::decode(const std::vector<int64_t> &ids) const {
  std::vector<std::string> out;
  for (int64_t id : ids) {
    if (id == eosId()) break;
    if (id == sosId() || id == padId()) continue;
    out.push_back(token(id));
  }
  return out;
}

} // namespace td
