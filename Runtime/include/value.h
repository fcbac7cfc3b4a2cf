#ifndef FORTHIC_VALUE_H
#define FORTHIC_VALUE_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Forthic::Runtime {

class Word;
class Module;
class Variable;

enum class ValueKind : uint8_t {
  Null,
  Bool,
  Int,
  Float,
  String,
  Array,
  Record,
  Instant,
  PlainDate,
  ZonedDateTime,
  // In-process only; never crosses the wire.
  PlainTime,
  Word,
  Module,
  Variable,
  Options,
};

struct Value;
struct RecordField;

using ValueList = std::vector<Value>;
using FieldList = std::vector<RecordField>;

// Tagged value. Array and record payloads are immutable once built and are
// shared between copies.
struct Value {
  ValueKind kind = ValueKind::Null;
  bool bool_value = false;
  int64_t int_value = 0;
  double float_value = 0.0;
  // String contents, or ISO-8601 text for the temporal kinds.
  std::string text;
  // ZonedDateTime only.
  std::string timezone;
  std::shared_ptr<const ValueList> items;
  // Record and Options.
  std::shared_ptr<const FieldList> fields;
  std::shared_ptr<Word> word;
  std::shared_ptr<Module> module;
  std::shared_ptr<Variable> variable;

  bool IsNull() const { return kind == ValueKind::Null; }
  const ValueList& Items() const;
  const FieldList& Fields() const;
  const Value* FindField(const std::string& key) const;
};

struct RecordField {
  std::string key;
  Value value;
};

Value MakeNull();
Value MakeBool(bool value);
Value MakeInt(int64_t value);
Value MakeFloat(double value);
Value MakeString(std::string text);
Value MakeArray(ValueList items);
// Duplicate keys keep their first position and take the last value.
Value MakeRecord(FieldList fields);
Value MakeOptions(FieldList fields);
Value MakeInstant(std::string iso8601);
Value MakePlainDate(std::string iso8601_date);
Value MakeZonedDateTime(std::string iso8601, std::string timezone);
// HH:MM, 24-hour clock.
Value MakePlainTime(std::string hh_mm);
Value MakeWordRef(std::shared_ptr<Word> word);
Value MakeModuleRef(std::shared_ptr<Module> module);
Value MakeVariableRef(std::shared_ptr<Variable> variable);

const char* ToString(ValueKind kind);
bool IsWireKind(ValueKind kind);

// Records compare without regard to key order; words, modules and variables
// compare by identity.
bool ValuesEqual(const Value& a, const Value& b);

std::string ToDisplayString(const Value& value);
std::string ToJson(const Value& value);

} // namespace Forthic::Runtime

#endif // FORTHIC_VALUE_H
