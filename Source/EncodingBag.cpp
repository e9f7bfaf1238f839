#include "TD/EncodingBag.hpp"
#include "TD/Errors.hpp"

#include <sstream>

namespace td {

bool isTuple(const FieldValue &v) {
  return std::holds_alternative<TensorTuple>(v);
}

EncodingBag::EncodingBag(
    std::initializer_list<std::pair<Field, FieldValue>> values) {
  set(values);
}

void EncodingBag::set(Field f, FieldValue v) {
  values_[fieldIndex(f)] = std::move(v);
}

void EncodingBag::set(
    std::initializer_list<std::pair<Field, FieldValue>> values) {
  for (const auto &[field, value] : values) {
    set(field, value);
  }
}

void EncodingBag::merge(const EncodingBag &other) {
  for (size_t i = 0; i < kFieldCount; ++i) {
    if (other.values_[i].has_value()) {
      values_[i] = other.values_[i];
    }
  }
}

void EncodingBag::erase(Field f) { values_[fieldIndex(f)].reset(); }

bool EncodingBag::has(Field f) const {
  return values_[fieldIndex(f)].has_value();
}

bool EncodingBag::empty() const {
  for (const auto &v : values_) {
    if (v.has_value()) return false;
  }
  return true;
}

const FieldValue &EncodingBag::get(Field f) const {
  const auto &slot = values_[fieldIndex(f)];
  if (!slot) {
    throw MissingFieldError("EncodingBag: field not set: " + toString(f));
  }
  return *slot;
}

const FieldValue *EncodingBag::find(Field f) const {
  const auto &slot = values_[fieldIndex(f)];
  return slot ? &*slot : nullptr;
}

const Tensor &EncodingBag::tensor(Field f) const {
  const FieldValue &v = get(f);
  if (const auto *t = std::get_if<Tensor>(&v)) {
    return *t;
  }
  throw ShapeContractError("EncodingBag: field " + toString(f) +
                           " holds a tuple, expected a single tensor");
}

std::vector<Field> EncodingBag::fields() const {
  std::vector<Field> out;
  for (const auto &spec : kFieldTable) {
    if (has(spec.field)) out.push_back(spec.field);
  }
  return out;
}

std::string toString(Field f) { return kFieldTable[fieldIndex(f)].name; }

std::string toString(const FieldValue &v) {
  std::ostringstream oss;
  if (const auto *t = std::get_if<Tensor>(&v)) {
    if (t->defined()) {
      oss << t->sizes();
    } else {
      oss << "<undefined>";
    }
    return oss.str();
  }
  const auto &tuple = std::get<TensorTuple>(v);
  oss << "(";
  for (size_t i = 0; i < tuple.size(); ++i) {
    if (i) oss << ", ";
    oss << toString(FieldValue{tuple[i]});
  }
  oss << ")";
  return oss.str();
}

std::string toString(const EncodingBag &bag) {
  std::ostringstream oss;
  oss << "{";
  bool first = true;
  for (Field f : bag.fields()) {
    if (!first) oss << ", ";
    first = false;
    oss << toString(f) << "=" << toString(bag.get(f));
  }
  oss << "}";
  return oss.str();
}

} // namespace td
