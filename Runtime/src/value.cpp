#include "value.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "module.h"
#include "word.h"

namespace Forthic::Runtime {

namespace {

const ValueList kEmptyItems;
const FieldList kEmptyFields;

FieldList DedupeFields(FieldList fields) {
  FieldList out;
  out.reserve(fields.size());
  for (auto& field : fields) {
    bool replaced = false;
    for (auto& existing : out) {
      if (existing.key == field.key) {
        existing.value = std::move(field.value);
        replaced = true;
        break;
      }
    }
    if (!replaced) out.push_back(std::move(field));
  }
  return out;
}

std::string FormatFloat(double value) {
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.15g", value);
  if (std::strtod(buffer, nullptr) != value) {
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  }
  std::string text = buffer;
  if (text.find_first_of(".eE") == std::string::npos) text += ".0";
  return text;
}

std::string JsonEscape(const std::string& text) {
  std::string out = "\"";
  for (char c : text) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
          out += buffer;
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  out += "\"";
  return out;
}

} // namespace

const ValueList& Value::Items() const {
  return items ? *items : kEmptyItems;
}

const FieldList& Value::Fields() const {
  return fields ? *fields : kEmptyFields;
}

const Value* Value::FindField(const std::string& key) const {
  for (const auto& field : Fields()) {
    if (field.key == key) return &field.value;
  }
  return nullptr;
}

Value MakeNull() {
  return Value();
}

Value MakeBool(bool value) {
  Value v;
  v.kind = ValueKind::Bool;
  v.bool_value = value;
  return v;
}

Value MakeInt(int64_t value) {
  Value v;
  v.kind = ValueKind::Int;
  v.int_value = value;
  return v;
}

Value MakeFloat(double value) {
  Value v;
  v.kind = ValueKind::Float;
  v.float_value = value;
  return v;
}

Value MakeString(std::string text) {
  Value v;
  v.kind = ValueKind::String;
  v.text = std::move(text);
  return v;
}

Value MakeArray(ValueList items) {
  Value v;
  v.kind = ValueKind::Array;
  v.items = std::make_shared<const ValueList>(std::move(items));
  return v;
}

Value MakeRecord(FieldList fields) {
  Value v;
  v.kind = ValueKind::Record;
  v.fields = std::make_shared<const FieldList>(DedupeFields(std::move(fields)));
  return v;
}

Value MakeOptions(FieldList fields) {
  Value v;
  v.kind = ValueKind::Options;
  v.fields = std::make_shared<const FieldList>(DedupeFields(std::move(fields)));
  return v;
}

Value MakeInstant(std::string iso8601) {
  Value v;
  v.kind = ValueKind::Instant;
  v.text = std::move(iso8601);
  return v;
}

Value MakePlainDate(std::string iso8601_date) {
  Value v;
  v.kind = ValueKind::PlainDate;
  v.text = std::move(iso8601_date);
  return v;
}

Value MakeZonedDateTime(std::string iso8601, std::string timezone) {
  Value v;
  v.kind = ValueKind::ZonedDateTime;
  v.text = std::move(iso8601);
  v.timezone = std::move(timezone);
  return v;
}

Value MakePlainTime(std::string hh_mm) {
  Value v;
  v.kind = ValueKind::PlainTime;
  v.text = std::move(hh_mm);
  return v;
}

Value MakeWordRef(std::shared_ptr<Word> word) {
  Value v;
  v.kind = ValueKind::Word;
  v.word = std::move(word);
  return v;
}

Value MakeModuleRef(std::shared_ptr<Module> module) {
  Value v;
  v.kind = ValueKind::Module;
  v.module = std::move(module);
  return v;
}

Value MakeVariableRef(std::shared_ptr<Variable> variable) {
  Value v;
  v.kind = ValueKind::Variable;
  v.variable = std::move(variable);
  return v;
}

const char* ToString(ValueKind kind) {
  switch (kind) {
    case ValueKind::Null: return "null";
    case ValueKind::Bool: return "bool";
    case ValueKind::Int: return "int";
    case ValueKind::Float: return "float";
    case ValueKind::String: return "string";
    case ValueKind::Array: return "array";
    case ValueKind::Record: return "record";
    case ValueKind::Instant: return "instant";
    case ValueKind::PlainDate: return "plain_date";
    case ValueKind::ZonedDateTime: return "zoned_datetime";
    case ValueKind::PlainTime: return "plain_time";
    case ValueKind::Word: return "word";
    case ValueKind::Module: return "module";
    case ValueKind::Variable: return "variable";
    case ValueKind::Options: return "options";
  }
  return "unknown";
}

bool IsWireKind(ValueKind kind) {
  switch (kind) {
    case ValueKind::PlainTime:
    case ValueKind::Word:
    case ValueKind::Module:
    case ValueKind::Variable:
    case ValueKind::Options:
      return false;
    default:
      return true;
  }
}

bool ValuesEqual(const Value& a, const Value& b) {
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case ValueKind::Null: return true;
    case ValueKind::Bool: return a.bool_value == b.bool_value;
    case ValueKind::Int: return a.int_value == b.int_value;
    case ValueKind::Float: return a.float_value == b.float_value;
    case ValueKind::String:
    case ValueKind::Instant:
    case ValueKind::PlainDate:
    case ValueKind::PlainTime:
      return a.text == b.text;
    case ValueKind::ZonedDateTime:
      return a.text == b.text && a.timezone == b.timezone;
    case ValueKind::Array: {
      const ValueList& left = a.Items();
      const ValueList& right = b.Items();
      if (left.size() != right.size()) return false;
      for (size_t i = 0; i < left.size(); ++i) {
        if (!ValuesEqual(left[i], right[i])) return false;
      }
      return true;
    }
    case ValueKind::Record: {
      if (a.Fields().size() != b.Fields().size()) return false;
      for (const auto& field : a.Fields()) {
        const Value* other = b.FindField(field.key);
        if (!other || !ValuesEqual(field.value, *other)) return false;
      }
      return true;
    }
    case ValueKind::Options: {
      const FieldList& left = a.Fields();
      const FieldList& right = b.Fields();
      if (left.size() != right.size()) return false;
      for (size_t i = 0; i < left.size(); ++i) {
        if (left[i].key != right[i].key || !ValuesEqual(left[i].value, right[i].value)) {
          return false;
        }
      }
      return true;
    }
    case ValueKind::Word: return a.word == b.word;
    case ValueKind::Module: return a.module == b.module;
    case ValueKind::Variable: return a.variable == b.variable;
  }
  return false;
}

std::string ToJson(const Value& value) {
  switch (value.kind) {
    case ValueKind::Null: return "null";
    case ValueKind::Bool: return value.bool_value ? "true" : "false";
    case ValueKind::Int: return std::to_string(value.int_value);
    case ValueKind::Float: return FormatFloat(value.float_value);
    case ValueKind::String:
    case ValueKind::Instant:
    case ValueKind::PlainDate:
    case ValueKind::ZonedDateTime:
    case ValueKind::PlainTime:
      return JsonEscape(value.text);
    case ValueKind::Array: {
      std::string out = "[";
      bool first = true;
      for (const auto& item : value.Items()) {
        if (!first) out += ", ";
        first = false;
        out += ToJson(item);
      }
      return out + "]";
    }
    case ValueKind::Record:
    case ValueKind::Options: {
      std::string out = "{";
      bool first = true;
      for (const auto& field : value.Fields()) {
        if (!first) out += ", ";
        first = false;
        out += JsonEscape(field.key) + ": " + ToJson(field.value);
      }
      return out + "}";
    }
    case ValueKind::Word:
    case ValueKind::Module:
    case ValueKind::Variable:
      return JsonEscape(ToDisplayString(value));
  }
  return "null";
}

std::string ToDisplayString(const Value& value) {
  switch (value.kind) {
    case ValueKind::String:
    case ValueKind::Instant:
    case ValueKind::PlainDate:
    case ValueKind::PlainTime:
      return value.text;
    case ValueKind::ZonedDateTime:
      return value.text + "[" + value.timezone + "]";
    case ValueKind::Word:
      return "<word " + (value.word ? value.word->QualifiedName() : std::string("?")) + ">";
    case ValueKind::Module:
      return "<module " + (value.module ? value.module->Name() : std::string("?")) + ">";
    case ValueKind::Variable:
      return "<variable " + (value.variable ? value.variable->Name() : std::string("?")) + ">";
    default:
      return ToJson(value);
  }
}

} // namespace Forthic::Runtime
