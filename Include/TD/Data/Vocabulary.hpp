#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace td {

// Token <-> id table with four reserved entries:
//   <unk> = 0, <pad> = 1, <sos> = 2, <eos> = 3
class Vocabulary {
public:
  static constexpr const char *kUnk = "<unk>";
  static constexpr const char *kPad = "<pad>";
  static constexpr const char *kSos = "<sos>";
  static constexpr const char *kEos = "<eos>";

  Vocabulary();

  // Returns the id of token, inserting it if new
  int64_t add(const std::string &token);

  bool contains(const std::string &token) const;

  // Unknown tokens map to <unk>
  int64_t lookup(const std::string &token) const;

  const std::string &token(int64_t id) const; // throws std::out_of_range

  int64_t size() const { return static_cast<int64_t>(tokens_.size()); }

  int64_t unkId() const { return 0; }
  int64_t padId() const { return 1; }
  int64_t sosId() const { return 2; }
  int64_t eosId() const { return 3; }

  // Optionally frames the ids with <sos> ... <eos>
  std::vector<int64_t> encode(const std::vector<std::string> &tokens,
                              bool addMarkers) const;

  // Stops at the first <eos>; skips <sos> and <pad>
  std::vector<std::string> decode(const std::vector<int64_t> &ids) const;

private:
  std::vector<std::string> tokens_;
  std::unordered_map<std::string, int64_t> ids_;
};

} // namespace td
