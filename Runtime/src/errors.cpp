#include "errors.h"

namespace Forthic::Runtime {

namespace {

struct ErrorTypeEntry {
  ErrorKind kind;
  const char* name;
};

const ErrorTypeEntry kErrorTypes[] = {
  {ErrorKind::Tokenize, "TokenizeError"},
  {ErrorKind::UnknownWord, "UnknownWordError"},
  {ErrorKind::NativeWord, "NativeWordError"},
  {ErrorKind::Options, "OptionsError"},
  {ErrorKind::ModuleImport, "ModuleImportError"},
  {ErrorKind::ModuleLoad, "ModuleLoadError"},
  {ErrorKind::RemoteExecution, "RemoteExecutionError"},
  {ErrorKind::StackUnderflow, "StackUnderflowError"},
  {ErrorKind::Definition, "DefinitionError"},
  {ErrorKind::InvalidVariableName, "InvalidVariableNameError"},
  {ErrorKind::IntentionalStop, "IntentionalStopError"},
};

} // namespace

const char* ErrorTypeName(ErrorKind kind) {
  for (const auto& entry : kErrorTypes) {
    if (entry.kind == kind) return entry.name;
  }
  return "";
}

ErrorKind ErrorKindFromTypeName(const std::string& name) {
  for (const auto& entry : kErrorTypes) {
    if (name == entry.name) return entry.kind;
  }
  return ErrorKind::RemoteExecution;
}

ErrorInfo MakeError(ErrorKind kind, std::string message) {
  ErrorInfo error;
  error.kind = kind;
  error.message = std::move(message);
  error.error_type = ErrorTypeName(kind);
  return error;
}

std::string FormatError(const ErrorInfo& error) {
  std::string out = "error[" + error.error_type + "]: " + error.message;
  if (!error.word_location.empty()) {
    out += "\n  at " + error.word_location;
  }
  for (const auto& frame : error.stack_trace) {
    out += "\n  in " + frame;
  }
  return out;
}

} // namespace Forthic::Runtime
