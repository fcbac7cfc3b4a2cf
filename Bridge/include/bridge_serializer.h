#ifndef FORTHIC_BRIDGE_SERIALIZER_H
#define FORTHIC_BRIDGE_SERIALIZER_H

#include <string>

#include "errors.h"
#include "forthic_runtime.pb.h"
#include "value.h"

namespace Forthic::Bridge {

namespace pb = ::forthic;

// Word, module, variable and options values are in-process only; encoding
// them fails.
bool EncodeValue(const Runtime::Value& value, pb::StackValue* out, std::string* error);
bool DecodeValue(const pb::StackValue& in, Runtime::Value* out, std::string* error);

bool EncodeStack(const Runtime::ValueList& values,
                 google::protobuf::RepeatedPtrField<pb::StackValue>* out,
                 std::string* error);
bool DecodeStack(const google::protobuf::RepeatedPtrField<pb::StackValue>& in,
                 Runtime::ValueList* out,
                 std::string* error);

void EncodeError(const Runtime::ErrorInfo& error, pb::ErrorInfo* out);
Runtime::ErrorInfo DecodeError(const pb::ErrorInfo& in);

} // namespace Forthic::Bridge

#endif // FORTHIC_BRIDGE_SERIALIZER_H
