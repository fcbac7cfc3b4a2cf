#include "bridge_serializer.h"

#include <algorithm>
#include <vector>

namespace Forthic::Bridge {

using Runtime::Value;
using Runtime::ValueKind;

bool EncodeValue(const Value& value, pb::StackValue* out, std::string* error) {
  if (!Runtime::IsWireKind(value.kind)) {
    if (error) {
      *error = std::string("cannot serialize ") + Runtime::ToString(value.kind) +
               " value across runtimes";
    }
    return false;
  }
  switch (value.kind) {
    case ValueKind::Null:
      out->mutable_null_value();
      return true;
    case ValueKind::Bool:
      out->set_bool_value(value.bool_value);
      return true;
    case ValueKind::Int:
      out->set_int_value(value.int_value);
      return true;
    case ValueKind::Float:
      out->set_float_value(value.float_value);
      return true;
    case ValueKind::String:
      out->set_string_value(value.text);
      return true;
    case ValueKind::Array: {
      pb::ArrayValue* array = out->mutable_array_value();
      for (const Value& item : value.Items()) {
        if (!EncodeValue(item, array->add_items(), error)) return false;
      }
      return true;
    }
    case ValueKind::Record: {
      auto* fields = out->mutable_record_value()->mutable_fields();
      for (const auto& field : value.Fields()) {
        if (!EncodeValue(field.value, &(*fields)[field.key], error)) return false;
      }
      return true;
    }
    case ValueKind::Instant:
      out->mutable_instant_value()->set_iso8601(value.text);
      return true;
    case ValueKind::PlainDate:
      out->mutable_plain_date_value()->set_iso8601_date(value.text);
      return true;
    case ValueKind::ZonedDateTime: {
      pb::ZonedDateTimeValue* zoned = out->mutable_zoned_datetime_value();
      zoned->set_iso8601(value.text);
      zoned->set_timezone(value.timezone);
      return true;
    }
    case ValueKind::PlainTime:
    case ValueKind::Word:
    case ValueKind::Module:
    case ValueKind::Variable:
    case ValueKind::Options:
      break;
  }
  return false;
}

bool DecodeValue(const pb::StackValue& in, Value* out, std::string* error) {
  switch (in.value_case()) {
    case pb::StackValue::kIntValue:
      *out = Runtime::MakeInt(in.int_value());
      return true;
    case pb::StackValue::kStringValue:
      *out = Runtime::MakeString(in.string_value());
      return true;
    case pb::StackValue::kBoolValue:
      *out = Runtime::MakeBool(in.bool_value());
      return true;
    case pb::StackValue::kFloatValue:
      *out = Runtime::MakeFloat(in.float_value());
      return true;
    case pb::StackValue::kNullValue:
      *out = Runtime::MakeNull();
      return true;
    case pb::StackValue::kArrayValue: {
      Runtime::ValueList items;
      items.reserve(static_cast<size_t>(in.array_value().items_size()));
      for (const auto& item : in.array_value().items()) {
        Value decoded;
        if (!DecodeValue(item, &decoded, error)) return false;
        items.push_back(std::move(decoded));
      }
      *out = Runtime::MakeArray(std::move(items));
      return true;
    }
    case pb::StackValue::kRecordValue: {
      // Map order is unspecified on the wire; keys are sorted for stable output.
      std::vector<std::string> keys;
      for (const auto& entry : in.record_value().fields()) keys.push_back(entry.first);
      std::sort(keys.begin(), keys.end());
      Runtime::FieldList fields;
      for (const auto& key : keys) {
        Value decoded;
        if (!DecodeValue(in.record_value().fields().at(key), &decoded, error)) return false;
        fields.push_back(Runtime::RecordField{key, std::move(decoded)});
      }
      *out = Runtime::MakeRecord(std::move(fields));
      return true;
    }
    case pb::StackValue::kInstantValue:
      *out = Runtime::MakeInstant(in.instant_value().iso8601());
      return true;
    case pb::StackValue::kPlainDateValue:
      *out = Runtime::MakePlainDate(in.plain_date_value().iso8601_date());
      return true;
    case pb::StackValue::kZonedDatetimeValue:
      *out = Runtime::MakeZonedDateTime(in.zoned_datetime_value().iso8601(),
                                        in.zoned_datetime_value().timezone());
      return true;
    case pb::StackValue::VALUE_NOT_SET:
      break;
  }
  if (error) *error = "stack value has no variant set";
  return false;
}

bool EncodeStack(const Runtime::ValueList& values,
                 google::protobuf::RepeatedPtrField<pb::StackValue>* out,
                 std::string* error) {
  for (size_t i = 0; i < values.size(); ++i) {
    std::string item_error;
    if (!EncodeValue(values[i], out->Add(), &item_error)) {
      if (error) *error = "stack item " + std::to_string(i) + ": " + item_error;
      return false;
    }
  }
  return true;
}

bool DecodeStack(const google::protobuf::RepeatedPtrField<pb::StackValue>& in,
                 Runtime::ValueList* out,
                 std::string* error) {
  out->clear();
  out->reserve(static_cast<size_t>(in.size()));
  for (int i = 0; i < in.size(); ++i) {
    Value decoded;
    std::string item_error;
    if (!DecodeValue(in.Get(i), &decoded, &item_error)) {
      if (error) *error = "stack item " + std::to_string(i) + ": " + item_error;
      return false;
    }
    out->push_back(std::move(decoded));
  }
  return true;
}

void EncodeError(const Runtime::ErrorInfo& error, pb::ErrorInfo* out) {
  out->set_message(error.message);
  out->set_runtime(error.runtime);
  for (const auto& frame : error.stack_trace) out->add_stack_trace(frame);
  out->set_error_type(error.error_type);
  out->set_word_location(error.word_location);
  out->set_module_name(error.module_name);
  auto* context = out->mutable_context();
  for (const auto& entry : error.context) (*context)[entry.first] = entry.second;
}

Runtime::ErrorInfo DecodeError(const pb::ErrorInfo& in) {
  Runtime::ErrorInfo error;
  error.kind = Runtime::ErrorKindFromTypeName(in.error_type());
  error.message = in.message();
  error.runtime = in.runtime();
  error.stack_trace.assign(in.stack_trace().begin(), in.stack_trace().end());
  error.error_type = in.error_type();
  error.word_location = in.word_location();
  error.module_name = in.module_name();
  for (const auto& entry : in.context()) error.context[entry.first] = entry.second;
  return error;
}

} // namespace Forthic::Bridge
