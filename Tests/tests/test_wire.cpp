#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "bridge_serializer.h"
#include "bridge_service.h"
#include "module_loader.h"
#include "test_utils.h"

namespace Forthic::Tests {

namespace {

namespace pb = ::forthic;

using Bridge::BridgeService;
using Runtime::ErrorKind;
using Runtime::Value;

std::shared_ptr<Runtime::ModuleRegistry> MakeServiceRegistry() {
  auto registry = MakeCoreRegistry();
  auto math = std::make_shared<Runtime::Module>("math", "Thirty numbered words");
  for (int i = 0; i < 30; ++i) {
    const int64_t n = i;
    math->AddDirectWord("W" + std::to_string(i), "( -- n:int )", "Pushes its number",
                        [n](Runtime::Interpreter& interp) {
                          interp.Push(Runtime::MakeInt(n));
                          return true;
                        });
  }
  auto extras = std::make_shared<Runtime::Module>("extras");
  extras->AddDirectWord("OPTS", "( -- options:WordOptions )", "Pushes an options value",
                        [](Runtime::Interpreter& interp) {
                          interp.Push(Runtime::MakeOptions({{"depth", Runtime::MakeInt(1)}}));
                          return true;
                        });
  std::string error;
  if (!registry->Register(math, &error) || !registry->Register(extras, &error)) {
    std::cerr << error << "\n";
  }
  return registry;
}

// Service registry plus a file module keeping a variable.
std::shared_ptr<Runtime::ModuleRegistry> MakeCounterServiceRegistry() {
  auto registry = MakeServiceRegistry();
  const std::string path = TempPath("forthic_test_service_counter.forthic");
  const std::string code =
      "[\"counter\"] VARIABLES : SET counter ! ; : GET counter @ ; : HELPER 0 ; "
      "@: START 1 ; [\"SET\" \"GET\"] EXPORT\n";
  if (!WriteFileText(path, code)) return registry;
  std::vector<Modules::ModuleConfigEntry> entries(1);
  entries[0].name = "counter";
  entries[0].import_path = std::string(Modules::kFileImportPrefix) + path;
  entries[0].runtime_specific = true;
  std::string error;
  if (!Modules::LoadModules(entries, Modules::BuiltinFactories(), registry, &error)) {
    std::cerr << error << "\n";
  }
  return registry;
}

// Records three deep, every wire variant, and the int64 limits.
Value MakeNestedValue() {
  Runtime::ValueList inner = {Runtime::MakeBool(true), Runtime::MakeNull(),
                              Runtime::MakeFloat(2.5), Runtime::MakeFloat(3.0)};
  Runtime::ValueList middle = {Runtime::MakeString("a"), Runtime::MakeArray(inner)};
  Value deepest = Runtime::MakeRecord({
    {"low", Runtime::MakeInt(std::numeric_limits<int64_t>::min())},
    {"high", Runtime::MakeInt(std::numeric_limits<int64_t>::max())},
    {"at", Runtime::MakeInstant("2024-03-01T09:30:00Z")},
  });
  Value level2 = Runtime::MakeRecord({{"deepest", deepest}, {"empty", Runtime::MakeRecord({})}});
  Runtime::FieldList fields = {
    {"b", Runtime::MakeArray(middle)},
    {"a", Runtime::MakeInt(-7)},
    {"when", Runtime::MakeZonedDateTime("2024-03-01T09:30:00-05:00", "America/New_York")},
    {"nested", level2},
  };
  return Runtime::MakeArray({Runtime::MakeInt(1), Runtime::MakeRecord(fields),
                             Runtime::MakePlainDate("2024-03-01")});
}

bool WireNestedValueSurvives() {
  const Value original = MakeNestedValue();
  pb::StackValue encoded;
  std::string error;
  if (!Bridge::EncodeValue(original, &encoded, &error)) {
    std::cerr << error << "\n";
    return false;
  }
  if (encoded.value_case() != pb::StackValue::kArrayValue) return false;
  Value decoded;
  if (!Bridge::DecodeValue(encoded, &decoded, &error)) {
    std::cerr << error << "\n";
    return false;
  }
  if (!Runtime::ValuesEqual(original, decoded)) {
    std::cerr << "decoded " << Runtime::ToJson(decoded) << "\n";
    return false;
  }
  const Value& record = decoded.Items()[1];
  const Value* when = record.FindField("when");
  if (!when || when->kind != Runtime::ValueKind::ZonedDateTime ||
      when->timezone != "America/New_York") {
    return false;
  }
  const Value& whole_float = record.FindField("b")->Items()[1].Items()[3];
  if (whole_float.kind != Runtime::ValueKind::Float || whole_float.float_value != 3.0) return false;
  const Value* deepest = record.FindField("nested")->FindField("deepest");
  if (!deepest) return false;
  const Value* low = deepest->FindField("low");
  const Value* at = deepest->FindField("at");
  return low && low->int_value == std::numeric_limits<int64_t>::min() && at &&
         at->kind == Runtime::ValueKind::Instant && at->text == "2024-03-01T09:30:00Z";
}

bool WireRecordKeysDecodeSorted() {
  pb::StackValue encoded;
  auto* fields = encoded.mutable_record_value()->mutable_fields();
  (*fields)["zeta"].set_int_value(1);
  (*fields)["alpha"].set_string_value("x");
  Value decoded;
  std::string error;
  if (!Bridge::DecodeValue(encoded, &decoded, &error)) return false;
  const Runtime::FieldList& list = decoded.Fields();
  return list.size() == 2 && list[0].key == "alpha" && list[1].key == "zeta";
}

bool WireRejectsInProcessValues() {
  pb::StackValue encoded;
  std::string error;
  if (Bridge::EncodeValue(Runtime::MakeOptions({}), &encoded, &error)) return false;
  if (error != "cannot serialize options value across runtimes") return false;

  Runtime::ValueList stack = {Runtime::MakeInt(1),
                              Runtime::MakeArray({Runtime::MakeOptions({})})};
  google::protobuf::RepeatedPtrField<pb::StackValue> items;
  if (Bridge::EncodeStack(stack, &items, &error)) return false;
  if (error.compare(0, 14, "stack item 1: ") != 0) return false;

  if (Bridge::EncodeValue(Runtime::MakePlainTime("09:00"), &encoded, &error)) return false;
  return error == "cannot serialize plain_time value across runtimes";
}

bool WireRejectsUnsetValue() {
  google::protobuf::RepeatedPtrField<pb::StackValue> items;
  items.Add()->set_int_value(3);
  items.Add();
  Runtime::ValueList stack;
  std::string error;
  if (Bridge::DecodeStack(items, &stack, &error)) return false;
  return error == "stack item 1: stack value has no variant set";
}

bool WireErrorFieldsSurvive() {
  Runtime::ErrorInfo original = Runtime::MakeError(ErrorKind::UnknownWord, "Unknown word: NOPE");
  original.stack_trace = {"OUTER", "NOPE"};
  original.word_location = "<input>:1:7";
  original.module_name = "math";
  original.context["word_name"] = "NOPE";
  pb::ErrorInfo encoded;
  Bridge::EncodeError(original, &encoded);
  if (encoded.runtime() != Runtime::kRuntimeName) return false;
  if (encoded.error_type() != "UnknownWordError") return false;

  const Runtime::ErrorInfo decoded = Bridge::DecodeError(encoded);
  return decoded.kind == ErrorKind::UnknownWord && decoded.message == original.message &&
         decoded.stack_trace == original.stack_trace &&
         decoded.word_location == original.word_location &&
         decoded.module_name == "math" && decoded.context == original.context;
}

bool WireUnknownErrorTypeIsRemote() {
  pb::ErrorInfo encoded;
  encoded.set_error_type("ZeroDivisionError");
  encoded.set_runtime("python");
  const Runtime::ErrorInfo decoded = Bridge::DecodeError(encoded);
  return decoded.kind == ErrorKind::RemoteExecution && decoded.error_type == "ZeroDivisionError" &&
         decoded.runtime == "python";
}

bool ServiceExecutesWord() {
  BridgeService service(MakeServiceRegistry());
  pb::ExecuteWordRequest request;
  request.set_word_name("DUP");
  request.add_stack()->set_string_value("echo");
  pb::ExecuteWordResponse response;
  service.ExecuteWord(request, &response);
  if (response.has_error()) {
    std::cerr << response.error().message() << "\n";
    return false;
  }
  return response.result_stack_size() == 2 &&
         response.result_stack(0).string_value() == "echo" &&
         response.result_stack(1).string_value() == "echo";
}

bool ServiceUnknownWordReportsError() {
  BridgeService service(MakeServiceRegistry());
  pb::ExecuteWordRequest request;
  request.set_word_name("NO-SUCH-WORD");
  request.add_stack()->set_int_value(1);
  pb::ExecuteWordResponse response;
  service.ExecuteWord(request, &response);
  if (response.result_stack_size() != 0 || !response.has_error()) return false;
  const pb::ErrorInfo& error = response.error();
  if (error.error_type() != "UnknownWordError" || error.runtime() != Runtime::kRuntimeName) {
    return false;
  }
  auto it = error.context().find("word_name");
  return it != error.context().end() && it->second == "NO-SUCH-WORD";
}

bool ServiceUnencodableResultReportsError() {
  BridgeService service(MakeServiceRegistry());
  pb::ExecuteWordRequest request;
  request.set_word_name("OPTS");
  pb::ExecuteWordResponse response;
  service.ExecuteWord(request, &response);
  return response.result_stack_size() == 0 &&
         response.error().error_type() == "RemoteExecutionError";
}

bool ServiceExecutesSequence() {
  BridgeService service(MakeServiceRegistry());
  pb::ExecuteSequenceRequest request;
  request.add_word_names("DUP");
  request.add_word_names("SWAP");
  request.add_stack()->set_int_value(5);
  pb::ExecuteSequenceResponse response;
  service.ExecuteSequence(request, &response);
  if (response.has_error()) return false;
  return response.result_stack_size() == 2 && response.result_stack(0).int_value() == 5 &&
         response.result_stack(1).int_value() == 5;
}

bool ServiceSequenceReportsFailedIndex() {
  BridgeService service(MakeServiceRegistry());
  pb::ExecuteSequenceRequest request;
  request.add_word_names("W3");
  request.add_word_names("MISSING");
  request.add_word_names("DUP");
  pb::ExecuteSequenceResponse response;
  service.ExecuteSequence(request, &response);
  if (response.result_stack_size() != 0 || !response.has_error()) return false;
  const auto& context = response.error().context();
  return context.at("failed_index") == "1" && context.at("failed_word") == "MISSING" &&
         context.at("word_sequence") == "W3 MISSING DUP";
}

bool ServiceRequestsDoNotShareState() {
  BridgeService service(MakeCounterServiceRegistry());
  pb::ExecuteSequenceRequest first;
  first.add_word_names("W1");
  pb::ExecuteSequenceResponse first_response;
  service.ExecuteSequence(first, &first_response);

  pb::ExecuteSequenceRequest second;
  second.add_word_names("W2");
  pb::ExecuteSequenceResponse second_response;
  service.ExecuteSequence(second, &second_response);
  if (second_response.result_stack_size() != 1 ||
      second_response.result_stack(0).int_value() != 2) {
    return false;
  }

  pb::ExecuteWordRequest set;
  set.set_word_name("SET");
  set.add_stack()->set_int_value(7);
  pb::ExecuteWordResponse set_response;
  service.ExecuteWord(set, &set_response);
  if (set_response.has_error() || set_response.result_stack_size() != 0) return false;

  pb::ExecuteWordRequest get;
  get.set_word_name("GET");
  pb::ExecuteWordResponse get_response;
  service.ExecuteWord(get, &get_response);
  if (get_response.has_error()) {
    std::cerr << get_response.error().message() << "\n";
    return false;
  }
  return get_response.result_stack_size() == 1 &&
         get_response.result_stack(0).value_case() == pb::StackValue::kNullValue;
}

bool ServiceListsModules() {
  BridgeService service(MakeCounterServiceRegistry());
  pb::ListModulesResponse response;
  service.ListModules(pb::ListModulesRequest(), &response);
  if (response.modules_size() != 4) return false;
  const pb::ModuleSummary& math = response.modules(1);
  if (response.modules(0).name() != "core" || math.name() != "math" ||
      math.word_count() != 30 || math.description() != "Thirty numbered words" ||
      math.runtime_specific() || response.modules(2).word_count() != 1) {
    return false;
  }
  const pb::ModuleSummary& counter = response.modules(3);
  if (counter.name() != "counter" || !counter.runtime_specific() || counter.word_count() != 2) {
    return false;
  }

  pb::GetModuleInfoRequest request;
  request.set_module_name("counter");
  pb::GetModuleInfoResponse info;
  std::string error;
  if (!service.GetModuleInfo(request, &info, &error)) return false;
  return info.words_size() == static_cast<int>(counter.word_count());
}

bool ServiceRejectsModuleReferenceResult() {
  BridgeService service(MakeServiceRegistry());
  pb::ExecuteWordRequest request;
  request.set_word_name("CUR-MODULE");
  pb::ExecuteWordResponse response;
  service.ExecuteWord(request, &response);
  if (response.result_stack_size() != 0) return false;
  const std::string& message = response.error().message();
  return response.error().error_type() == "RemoteExecutionError" &&
         message.find("cannot serialize module value across runtimes") != std::string::npos;
}

bool ServiceDescribesModule() {
  BridgeService service(MakeServiceRegistry());
  pb::GetModuleInfoRequest request;
  request.set_module_name("math");
  pb::GetModuleInfoResponse response;
  std::string error;
  if (!service.GetModuleInfo(request, &response, &error)) return false;
  if (response.name() != "math" || response.words_size() != 30) return false;
  for (const auto& word : response.words()) {
    if (word.name() == "W29") {
      return word.stack_effect() == "( -- n:int )" && word.description() == "Pushes its number";
    }
  }
  return false;
}

bool ServiceUnknownModuleFails() {
  BridgeService service(MakeServiceRegistry());
  pb::GetModuleInfoRequest request;
  request.set_module_name("ghost");
  pb::GetModuleInfoResponse response;
  std::string error;
  if (service.GetModuleInfo(request, &response, &error)) return false;
  return error == "Module 'ghost' not found";
}

const TestCase kWireCodecTests[] = {
  {"wire_nested_value_survives", WireNestedValueSurvives},
  {"wire_record_keys_sorted", WireRecordKeysDecodeSorted},
  {"wire_rejects_in_process_values", WireRejectsInProcessValues},
  {"wire_rejects_unset_value", WireRejectsUnsetValue},
  {"wire_error_fields_survive", WireErrorFieldsSurvive},
  {"wire_unknown_error_type_is_remote", WireUnknownErrorTypeIsRemote},
};

const TestCase kWireServiceTests[] = {
  {"service_execute_word", ServiceExecutesWord},
  {"service_unknown_word", ServiceUnknownWordReportsError},
  {"service_unencodable_result", ServiceUnencodableResultReportsError},
  {"service_module_reference_result", ServiceRejectsModuleReferenceResult},
  {"service_execute_sequence", ServiceExecutesSequence},
  {"service_sequence_failed_index", ServiceSequenceReportsFailedIndex},
  {"service_requests_isolated", ServiceRequestsDoNotShareState},
  {"service_list_modules", ServiceListsModules},
  {"service_describe_module", ServiceDescribesModule},
  {"service_unknown_module", ServiceUnknownModuleFails},
};

} // namespace

static const TestSection kWireSections[] = {
  {"wire_codec", kWireCodecTests, sizeof(kWireCodecTests) / sizeof(kWireCodecTests[0])},
  {"wire_service", kWireServiceTests, sizeof(kWireServiceTests) / sizeof(kWireServiceTests[0])},
};

const TestSection* GetWireSections(size_t* count) {
  if (count) *count = sizeof(kWireSections) / sizeof(kWireSections[0]);
  return kWireSections;
}

} // namespace Forthic::Tests
