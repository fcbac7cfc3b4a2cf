#ifndef FORTHIC_WORD_H
#define FORTHIC_WORD_H

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "lang_token.h"
#include "value.h"

namespace Forthic::Runtime {

class Interpreter;
class Module;

// Returns true when the handler recovered from the failure; the failing word
// is then treated as having completed.
using WordErrorHandler = std::function<bool(const ErrorInfo& error, Interpreter& interp)>;

class Word {
public:
  Word(std::string name, std::string module_name);
  virtual ~Word() = default;

  const std::string& Name() const { return name_; }
  const std::string& ModuleName() const { return module_name_; }
  virtual std::string QualifiedName() const;

  const std::string& StackEffect() const { return stack_effect_; }
  const std::string& Description() const { return description_; }
  void SetDocumentation(std::string stack_effect, std::string description);

  const Lang::CodeLocation& Location() const { return location_; }
  void SetLocation(const Lang::CodeLocation& location) { location_ = location; }

  virtual bool Execute(Interpreter& interp) = 0;
  // Memo cache hits are not dispatches of the wrapped word.
  virtual bool CountsAsDispatch() const { return true; }
  // Forthic-defined words resolve names inside their owning module.
  virtual bool RunsInModuleContext() const { return false; }

  size_t AddErrorHandler(WordErrorHandler handler);
  bool RemoveErrorHandler(size_t id);
  void ClearErrorHandlers();
  bool HasErrorHandlers() const { return !error_handlers_.empty(); }
  bool TryErrorHandlers(const ErrorInfo& error, Interpreter& interp) const;

protected:
  std::string name_;
  std::string module_name_;
  std::string stack_effect_;
  std::string description_;
  Lang::CodeLocation location_;

private:
  std::vector<std::pair<size_t, WordErrorHandler>> error_handlers_;
  size_t next_handler_id_ = 1;
};

class PushValueWord : public Word {
public:
  PushValueWord(std::string name, Value value);

  const Value& PushedValue() const { return value_; }
  bool Execute(Interpreter& interp) override;

private:
  Value value_;
};

// User-defined word; its tokens are resolved on every execution.
class DefinitionWord : public Word {
public:
  DefinitionWord(std::string name, std::string module_name);

  void AddToken(const Lang::Token& token) { tokens_.push_back(token); }
  const std::vector<Lang::Token>& Tokens() const { return tokens_; }
  bool Execute(Interpreter& interp) override;
  bool RunsInModuleContext() const override { return true; }

private:
  std::vector<Lang::Token> tokens_;
};

using NativeWordFn = std::function<bool(const std::vector<Value>& args,
                                        const Value& options,
                                        Value& out_ret,
                                        bool& out_has_ret,
                                        std::string& out_error)>;

class NativeWord : public Word {
public:
  NativeWord(std::string name, std::string module_name, size_t input_count, bool has_options,
             NativeWordFn impl);

  size_t InputCount() const { return input_count_; }
  bool HasOptions() const { return has_options_; }
  bool Execute(Interpreter& interp) override;

private:
  size_t input_count_ = 0;
  bool has_options_ = false;
  NativeWordFn impl_;
};

using DirectWordFn = std::function<bool(Interpreter& interp)>;

class DirectWord : public Word {
public:
  DirectWord(std::string name, std::string module_name, DirectWordFn impl);

  bool Execute(Interpreter& interp) override;

private:
  DirectWordFn impl_;
};

class MemoWord : public Word {
public:
  explicit MemoWord(std::shared_ptr<Word> wrapped);

  bool Execute(Interpreter& interp) override;
  bool CountsAsDispatch() const override { return false; }
  bool RunsInModuleContext() const override { return wrapped_->RunsInModuleContext(); }
  // Re-executes the wrapped word and replaces the cached result.
  bool Refresh(Interpreter& interp, bool push_result);

private:
  std::shared_ptr<Word> wrapped_;
  std::mutex mutex_;
  bool has_value_ = false;
  Value value_;
};

// NAME! refreshes the cache, NAME!@ refreshes and pushes.
class MemoRefreshWord : public Word {
public:
  MemoRefreshWord(std::shared_ptr<MemoWord> memo, bool push_result);

  bool Execute(Interpreter& interp) override;
  bool RunsInModuleContext() const override { return memo_->RunsInModuleContext(); }

private:
  std::shared_ptr<MemoWord> memo_;
  bool push_result_ = false;
};

// Exported word reached through an import. Forthic-defined targets run with
// their owning module on the module stack so its private words stay
// reachable.
class ImportedWord : public Word {
public:
  ImportedWord(std::string name, std::shared_ptr<Word> word, std::shared_ptr<Module> module);

  const std::shared_ptr<Word>& Target() const { return word_; }
  std::string QualifiedName() const override { return word_->QualifiedName(); }
  bool Execute(Interpreter& interp) override;
  bool CountsAsDispatch() const override { return word_->CountsAsDispatch(); }

private:
  std::shared_ptr<Word> word_;
  std::shared_ptr<Module> module_;
};

} // namespace Forthic::Runtime

#endif // FORTHIC_WORD_H
