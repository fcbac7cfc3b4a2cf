#ifndef FORTHIC_MODULE_H
#define FORTHIC_MODULE_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "value.h"
#include "word.h"
#include "word_binding.h"

namespace Forthic::Runtime {

class Variable {
public:
  explicit Variable(std::string name, Value value = Value());

  const std::string& Name() const { return name_; }
  Value Get() const;
  void Set(Value value);

private:
  std::string name_;
  mutable std::mutex mutex_;
  Value value_;
};

struct ModuleImport {
  std::shared_ptr<Module> module;
  std::string prefix;
};

class Module {
public:
  // Fills a fresh per-interpreter instance with words bound to that instance.
  using InstanceInit = std::function<void(Module& instance)>;

  explicit Module(std::string name, std::string description = "", std::string forthic_code = "");
  Module(const Module&) = delete;
  Module& operator=(const Module&) = delete;

  const std::string& Name() const { return name_; }
  const std::string& Description() const { return description_; }
  void SetDescription(std::string description) { description_ = std::move(description); }
  const std::string& ForthicCode() const { return forthic_code_; }
  bool RuntimeSpecific() const { return runtime_specific_; }
  void SetRuntimeSpecific(bool value) { runtime_specific_ = value; }

  void AddWord(std::shared_ptr<Word> word);
  void AddExportableWord(std::shared_ptr<Word> word);
  bool AddNativeWord(const WordBinding& binding, std::string* error);
  void AddDirectWord(const std::string& name,
                     const std::string& stack_effect,
                     const std::string& description,
                     DirectWordFn impl);
  // Adds NAME plus its NAME! and NAME!@ companions.
  std::shared_ptr<MemoWord> AddMemoWords(std::shared_ptr<Word> wrapped);

  void AddExportable(const std::vector<std::string>& names);
  bool IsExported(const std::string& name) const;

  std::vector<std::shared_ptr<Word>> Words() const;
  std::vector<std::shared_ptr<Word>> ExportedWords() const;
  // Same count as ExportedWords().
  size_t WordCount() const;

  // Newest word first, then variables. Variables resolve to a word pushing
  // the variable reference.
  std::shared_ptr<Word> FindWord(const std::string& name, bool exported_only) const;

  std::shared_ptr<Variable> FindVariable(const std::string& name) const;
  std::shared_ptr<Variable> GetOrCreateVariable(const std::string& name);

  std::shared_ptr<Module> FindChild(const std::string& name) const;
  void AddChild(std::shared_ptr<Module> child);

  std::vector<std::shared_ptr<Module>> Children() const;

  void AddImport(std::shared_ptr<Module> module, std::string prefix);
  std::vector<ModuleImport> Imports() const;
  void SetImports(std::vector<ModuleImport> imports);

  void SetInstanceInit(InstanceInit init) { instance_init_ = std::move(init); }
  // Copy sharing the word objects but owning its variables (seeded with the
  // current values), children and import list. With an instance init set,
  // the copy starts without words and the init adds them.
  std::shared_ptr<Module> Duplicate() const;

private:
  std::string name_;
  std::string description_;
  std::string forthic_code_;
  bool runtime_specific_ = false;
  InstanceInit instance_init_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Word>> words_;
  std::vector<std::string> exportable_;
  std::map<std::string, std::shared_ptr<Variable>> variables_;
  std::map<std::string, std::shared_ptr<Module>> children_;
  std::vector<ModuleImport> imports_;
};

// Filled at startup, read-only afterwards; shared by every interpreter.
class ModuleRegistry {
public:
  bool Register(std::shared_ptr<Module> module, std::string* error);
  std::shared_ptr<Module> Find(const std::string& name) const;
  const std::vector<std::shared_ptr<Module>>& Modules() const { return modules_; }

private:
  std::vector<std::shared_ptr<Module>> modules_;
};

} // namespace Forthic::Runtime

#endif // FORTHIC_MODULE_H
