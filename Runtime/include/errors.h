#ifndef FORTHIC_ERRORS_H
#define FORTHIC_ERRORS_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Forthic::Runtime {

enum class ErrorKind : uint8_t {
  None,
  Tokenize,
  UnknownWord,
  NativeWord,
  Options,
  ModuleImport,
  ModuleLoad,
  RemoteExecution,
  StackUnderflow,
  Definition,
  InvalidVariableName,
  IntentionalStop,
};

inline constexpr const char* kRuntimeName = "cpp";

struct ErrorInfo {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::string runtime = kRuntimeName;
  std::vector<std::string> stack_trace;
  std::string error_type;
  std::string word_location;
  std::string module_name;
  std::map<std::string, std::string> context;

  bool Ok() const { return kind == ErrorKind::None; }
};

const char* ErrorTypeName(ErrorKind kind);
ErrorKind ErrorKindFromTypeName(const std::string& name);

ErrorInfo MakeError(ErrorKind kind, std::string message);

// error[UnknownWordError]: Unknown word: FOO
//   at <input>:1:5
std::string FormatError(const ErrorInfo& error);

} // namespace Forthic::Runtime

#endif // FORTHIC_ERRORS_H
