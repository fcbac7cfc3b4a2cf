#ifndef FORTHIC_INTERPRETER_H
#define FORTHIC_INTERPRETER_H

#include <chrono>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "errors.h"
#include "lang_token.h"
#include "module.h"
#include "value.h"
#include "word.h"

namespace Forthic::Runtime {

// Returns true and fills out when text is a literal this handler accepts.
using LiteralHandler = std::function<bool(const std::string& text, Value* out)>;

struct ProfileTimestamp {
  std::string label;
  double time_ms = 0.0;
};

// One interpreter per logical thread of execution. Registry modules are
// imported as interpreter-local instances, so execution never mutates the
// shared registry.
class Interpreter {
public:
  explicit Interpreter(std::shared_ptr<const ModuleRegistry> registry = nullptr);
  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  bool Run(const std::string& source);
  bool Run(const std::string& source, const Lang::CodeLocation& reference);
  bool ExecuteTokens(const std::vector<Lang::Token>& tokens);
  // Resolves one word by exact name, then dispatches it.
  bool ExecuteWordByName(const std::string& name);
  bool Dispatch(Word& word, const Lang::CodeLocation* location);
  // Executes without profiling; failures go through the word's handlers.
  bool ExecuteWithHandlers(Word& word);
  bool RunModuleCode(const std::shared_ptr<Module>& module);

  const ErrorInfo& Error() const { return error_; }
  ErrorInfo& MutableError() { return error_; }
  void ClearError() { error_ = ErrorInfo(); }
  bool Fail(ErrorKind kind, const std::string& message);

  void Push(Value value);
  bool Pop(Value* out);
  bool PopValues(size_t count, ValueList* out);
  bool Peek(Value* out);
  size_t StackSize() const { return stack_.size(); }
  const ValueList& Stack() const { return stack_; }
  void SetStack(ValueList stack) { stack_ = std::move(stack); }
  void ClearStack() { stack_.clear(); }

  std::shared_ptr<Module> AppModule() const { return app_module_; }
  std::shared_ptr<Module> CurModule() const { return module_stack_.back(); }
  const std::vector<std::shared_ptr<Module>>& ModuleStack() const { return module_stack_; }
  void PushModule(std::shared_ptr<Module> module);
  bool PopModule();
  size_t ModuleDepth() const { return module_stack_.size(); }
  void RestoreModuleDepth(size_t depth);

  const std::shared_ptr<const ModuleRegistry>& Registry() const { return registry_; }
  void RegisterModule(std::shared_ptr<Module> module);
  std::shared_ptr<Module> FindModule(const std::string& name) const;
  // This interpreter's instance of a registry module; other modules are
  // returned unchanged.
  std::shared_ptr<Module> LocalInstance(const std::shared_ptr<Module>& module);
  bool UseModule(const std::string& name, const std::string& prefix);
  // Items are module names or [name prefix] pairs.
  bool UseModules(const Value& names);
  bool UseAllRegisteredModules();

  std::shared_ptr<Word> FindWord(const std::string& name) const;
  bool ResolveWord(const std::string& name, std::shared_ptr<Word>* out);
  std::vector<std::string> ScopeChainNames() const;

  void AddLiteralHandler(LiteralHandler handler);
  bool ResolveLiteral(const std::string& text, Value* out) const;
  const std::string& Timezone() const { return timezone_; }
  void SetTimezone(std::string timezone) { timezone_ = std::move(timezone); }

  void StartProfiling();
  void StopProfiling();
  bool IsProfiling() const { return profiling_; }
  void CountWordExecution(const Word& word);
  void AddTimestamp(const std::string& label);
  Value ProfileData() const;

  std::ostream& Out() { return *out_; }
  void SetOutput(std::ostream* out);

private:
  struct RunState {
    std::vector<size_t> array_marks;
    std::shared_ptr<DefinitionWord> definition;
    bool memo = false;
  };

  void InstallLiteralHandlers();
  bool HandleToken(const Lang::Token& token, RunState& state);
  bool HandleArrayClose(const Lang::Token& token, RunState& state);
  bool HandleModuleOpen(const Lang::Token& token);
  bool HandleDefinitionClose(const Lang::Token& token, RunState& state);
  bool HandleWordToken(const Lang::Token& token);
  bool FailAt(ErrorKind kind, const std::string& message, const Lang::CodeLocation& location);
  std::shared_ptr<Module> Instantiate(const std::shared_ptr<Module>& shared);
  void RebindImports(Module& instance);

  std::shared_ptr<const ModuleRegistry> registry_;
  std::shared_ptr<Module> app_module_;
  std::vector<std::shared_ptr<Module>> module_stack_;
  std::map<std::string, std::shared_ptr<Module>> local_modules_;
  std::map<const Module*, std::shared_ptr<Module>> instances_;
  ValueList stack_;
  ErrorInfo error_;
  std::vector<LiteralHandler> literal_handlers_;
  std::string timezone_ = "UTC";

  bool profiling_ = false;
  std::map<std::string, int64_t> word_counts_;
  std::vector<ProfileTimestamp> timestamps_;
  std::chrono::steady_clock::time_point profile_start_;

  std::ostream* out_ = nullptr;
};

} // namespace Forthic::Runtime

#endif // FORTHIC_INTERPRETER_H
