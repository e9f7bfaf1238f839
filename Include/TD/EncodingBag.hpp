#pragma once

#include "TD/core.hpp"

#include <array>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace td {

// Every slot an encoder or decoder may read or write.
enum class Field {
  Source,     // source token ids (time x batch)
  Target,     // target token ids (time x batch)
  Transform,  // annotation/transform token ids (time x batch)
  EncHidden,  // final encoder state, tensor or tuple (layers x batch x hidden)
  EncOutputs, // per-step encoder outputs (time x batch x hidden)
  DecOutputs  // decoder logits (time x batch x vocabulary)
};

constexpr size_t kFieldCount = 6;

// How the arithmetic reducer treats a field.
enum class CombineRule {
  Carry,     // copied from the first operand (token fields)
  Arithmetic // folded with + / - across operands
};

struct FieldSpec {
  Field field;
  const char *name;
  CombineRule rule;
};

constexpr std::array<FieldSpec, kFieldCount> kFieldTable = {{
    {Field::Source, "Source", CombineRule::Carry},
    {Field::Target, "Target", CombineRule::Carry},
    {Field::Transform, "Transform", CombineRule::Carry},
    {Field::EncHidden, "EncHidden", CombineRule::Arithmetic},
    {Field::EncOutputs, "EncOutputs", CombineRule::Arithmetic},
    {Field::DecOutputs, "DecOutputs", CombineRule::Arithmetic},
}};

constexpr size_t fieldIndex(Field f) { return static_cast<size_t>(f); }

static_assert(kFieldTable[fieldIndex(Field::Source)].field == Field::Source);
static_assert(kFieldTable[fieldIndex(Field::Target)].field == Field::Target);
static_assert(kFieldTable[fieldIndex(Field::Transform)].field == Field::Transform);
static_assert(kFieldTable[fieldIndex(Field::EncHidden)].field == Field::EncHidden);
static_assert(kFieldTable[fieldIndex(Field::EncOutputs)].field == Field::EncOutputs);
static_assert(kFieldTable[fieldIndex(Field::DecOutputs)].field == Field::DecOutputs);

constexpr CombineRule combineRule(Field f) { return kFieldTable[fieldIndex(f)].rule; }

// A field holds either one tensor or a tuple of tensors (recurrent h/c pair).
using FieldValue = std::variant<Tensor, TensorTuple>;

bool isTuple(const FieldValue &v);

// Optional-field record passed between splitter, encoder, reducer and decoder.
// Absence is explicit: a present zero tensor is not the same as a missing field.
class EncodingBag {
public:
  EncodingBag() = default;
  EncodingBag(std::initializer_list<std::pair<Field, FieldValue>> values);

  void set(Field f, FieldValue v);
  void set(std::initializer_list<std::pair<Field, FieldValue>> values);

  // Copies every field present in other, overwriting existing values
  void merge(const EncodingBag &other);

  void erase(Field f);

  bool has(Field f) const;
  bool empty() const;

  const FieldValue &get(Field f) const; // throws MissingFieldError
  const FieldValue *find(Field f) const; // nullptr if absent

  // Single-tensor access; throws if absent or tuple-valued
  const Tensor &tensor(Field f) const;

  // Present fields, in declaration order
  std::vector<Field> fields() const;

private:
  std::array<std::optional<FieldValue>, kFieldCount> values_;
};

std::string toString(Field f);
std::string toString(const FieldValue &v);
std::string toString(const EncodingBag &bag);

} // namespace td
