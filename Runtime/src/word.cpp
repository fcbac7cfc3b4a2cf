#include "word.h"

#include "interpreter.h"
#include "module.h"

namespace Forthic::Runtime {

Word::Word(std::string name, std::string module_name)
    : name_(std::move(name)), module_name_(std::move(module_name)) {}

std::string Word::QualifiedName() const {
  if (module_name_.empty()) return name_;
  return module_name_ + "." + name_;
}

void Word::SetDocumentation(std::string stack_effect, std::string description) {
  stack_effect_ = std::move(stack_effect);
  description_ = std::move(description);
}

size_t Word::AddErrorHandler(WordErrorHandler handler) {
  const size_t id = next_handler_id_++;
  error_handlers_.emplace_back(id, std::move(handler));
  return id;
}

bool Word::RemoveErrorHandler(size_t id) {
  for (auto it = error_handlers_.begin(); it != error_handlers_.end(); ++it) {
    if (it->first == id) {
      error_handlers_.erase(it);
      return true;
    }
  }
  return false;
}

void Word::ClearErrorHandlers() {
  error_handlers_.clear();
}

bool Word::TryErrorHandlers(const ErrorInfo& error, Interpreter& interp) const {
  for (const auto& entry : error_handlers_) {
    if (entry.second(error, interp)) {
      interp.ClearError();
      return true;
    }
    interp.ClearError();
  }
  return false;
}

PushValueWord::PushValueWord(std::string name, Value value)
    : Word(std::move(name), ""), value_(std::move(value)) {}

bool PushValueWord::Execute(Interpreter& interp) {
  interp.Push(value_);
  return true;
}

DefinitionWord::DefinitionWord(std::string name, std::string module_name)
    : Word(std::move(name), std::move(module_name)) {}

bool DefinitionWord::Execute(Interpreter& interp) {
  if (interp.ExecuteTokens(tokens_)) return true;
  ErrorInfo& error = interp.MutableError();
  if (error.kind != ErrorKind::IntentionalStop) {
    error.stack_trace.push_back(QualifiedName() + " (" + Lang::FormatLocation(location_) + ")");
  }
  return false;
}

NativeWord::NativeWord(std::string name, std::string module_name, size_t input_count,
                       bool has_options, NativeWordFn impl)
    : Word(std::move(name), std::move(module_name)),
      input_count_(input_count),
      has_options_(has_options),
      impl_(std::move(impl)) {}

bool NativeWord::Execute(Interpreter& interp) {
  Value options = MakeOptions(FieldList());
  bool popped_options = false;
  if (has_options_ && interp.StackSize() > 0 &&
      interp.Stack().back().kind == ValueKind::Options) {
    interp.Pop(&options);
    popped_options = true;
  }
  if (interp.StackSize() < input_count_) {
    if (popped_options) interp.Push(options);
    return interp.Fail(ErrorKind::StackUnderflow,
                       QualifiedName() + " expects " + std::to_string(input_count_) +
                           " argument(s), stack has " + std::to_string(interp.StackSize()));
  }
  ValueList args;
  interp.PopValues(input_count_, &args);

  Value result;
  bool has_result = false;
  std::string error;
  if (!impl_(args, options, result, has_result, error)) {
    interp.Fail(ErrorKind::NativeWord,
                "Error in word " + name_ + " (module " + module_name_ + "): " + error);
    ErrorInfo& info = interp.MutableError();
    info.module_name = module_name_;
    info.context["word_name"] = name_;
    return false;
  }
  if (has_result) interp.Push(std::move(result));
  return true;
}

DirectWord::DirectWord(std::string name, std::string module_name, DirectWordFn impl)
    : Word(std::move(name), std::move(module_name)), impl_(std::move(impl)) {}

bool DirectWord::Execute(Interpreter& interp) {
  return impl_(interp);
}

MemoWord::MemoWord(std::shared_ptr<Word> wrapped)
    : Word(wrapped->Name(), wrapped->ModuleName()), wrapped_(std::move(wrapped)) {
  SetDocumentation(wrapped_->StackEffect(), wrapped_->Description());
}

bool MemoWord::Execute(Interpreter& interp) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (has_value_) {
      interp.Push(value_);
      return true;
    }
  }
  return Refresh(interp, true);
}

bool MemoWord::Refresh(Interpreter& interp, bool push_result) {
  // Computed outside the lock; the wrapped word may re-enter the interpreter.
  if (!interp.Dispatch(*wrapped_, nullptr)) return false;
  Value result;
  if (!interp.Pop(&result)) return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = result;
    has_value_ = true;
  }
  if (push_result) interp.Push(std::move(result));
  return true;
}

MemoRefreshWord::MemoRefreshWord(std::shared_ptr<MemoWord> memo, bool push_result)
    : Word(memo->Name() + (push_result ? "!@" : "!"), memo->ModuleName()),
      memo_(std::move(memo)),
      push_result_(push_result) {}

bool MemoRefreshWord::Execute(Interpreter& interp) {
  return memo_->Refresh(interp, push_result_);
}

ImportedWord::ImportedWord(std::string name, std::shared_ptr<Word> word,
                           std::shared_ptr<Module> module)
    : Word(std::move(name), word->ModuleName()), word_(std::move(word)), module_(std::move(module)) {
  SetDocumentation(word_->StackEffect(), word_->Description());
}

bool ImportedWord::Execute(Interpreter& interp) {
  if (!word_->RunsInModuleContext()) return interp.ExecuteWithHandlers(*word_);
  const size_t depth = interp.ModuleDepth();
  interp.PushModule(module_);
  const bool ok = interp.ExecuteWithHandlers(*word_);
  interp.RestoreModuleDepth(depth);
  return ok;
}

} // namespace Forthic::Runtime
