#include "module.h"

#include <algorithm>
#include <set>

namespace Forthic::Runtime {

Variable::Variable(std::string name, Value value)
    : name_(std::move(name)), value_(std::move(value)) {}

Value Variable::Get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return value_;
}

void Variable::Set(Value value) {
  std::lock_guard<std::mutex> lock(mutex_);
  value_ = std::move(value);
}

Module::Module(std::string name, std::string description, std::string forthic_code)
    : name_(std::move(name)),
      description_(std::move(description)),
      forthic_code_(std::move(forthic_code)) {}

void Module::AddWord(std::shared_ptr<Word> word) {
  std::lock_guard<std::mutex> lock(mutex_);
  words_.push_back(std::move(word));
}

void Module::AddExportableWord(std::shared_ptr<Word> word) {
  std::lock_guard<std::mutex> lock(mutex_);
  exportable_.push_back(word->Name());
  words_.push_back(std::move(word));
}

bool Module::AddNativeWord(const WordBinding& binding, std::string* error) {
  std::shared_ptr<NativeWord> word = BindNativeWord(binding, name_, error);
  if (!word) return false;
  AddExportableWord(std::move(word));
  return true;
}

void Module::AddDirectWord(const std::string& name,
                           const std::string& stack_effect,
                           const std::string& description,
                           DirectWordFn impl) {
  auto word = std::make_shared<DirectWord>(name, name_, std::move(impl));
  word->SetDocumentation(stack_effect, description);
  AddExportableWord(std::move(word));
}

std::shared_ptr<MemoWord> Module::AddMemoWords(std::shared_ptr<Word> wrapped) {
  auto memo = std::make_shared<MemoWord>(std::move(wrapped));
  std::lock_guard<std::mutex> lock(mutex_);
  words_.push_back(memo);
  words_.push_back(std::make_shared<MemoRefreshWord>(memo, false));
  words_.push_back(std::make_shared<MemoRefreshWord>(memo, true));
  return memo;
}

void Module::AddExportable(const std::vector<std::string>& names) {
  std::lock_guard<std::mutex> lock(mutex_);
  exportable_.insert(exportable_.end(), names.begin(), names.end());
}

bool Module::IsExported(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::find(exportable_.begin(), exportable_.end(), name) != exportable_.end();
}

std::vector<std::shared_ptr<Word>> Module::Words() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return words_;
}

std::vector<std::shared_ptr<Word>> Module::ExportedWords() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<Word>> out;
  std::set<std::string> seen;
  for (auto it = words_.rbegin(); it != words_.rend(); ++it) {
    const std::string& name = (*it)->Name();
    if (seen.count(name)) continue;
    seen.insert(name);
    if (std::find(exportable_.begin(), exportable_.end(), name) != exportable_.end()) {
      out.push_back(*it);
    }
  }
  std::reverse(out.begin(), out.end());
  return out;
}

size_t Module::WordCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> names;
  for (const auto& word : words_) {
    if (std::find(exportable_.begin(), exportable_.end(), word->Name()) != exportable_.end()) {
      names.insert(word->Name());
    }
  }
  return names.size();
}

std::shared_ptr<Word> Module::FindWord(const std::string& name, bool exported_only) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (exported_only &&
      std::find(exportable_.begin(), exportable_.end(), name) == exportable_.end()) {
    return nullptr;
  }
  for (auto it = words_.rbegin(); it != words_.rend(); ++it) {
    if ((*it)->Name() == name) return *it;
  }
  auto var = variables_.find(name);
  if (var != variables_.end()) {
    auto word = std::make_shared<PushValueWord>(name, MakeVariableRef(var->second));
    return word;
  }
  return nullptr;
}

std::shared_ptr<Variable> Module::FindVariable(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = variables_.find(name);
  return it == variables_.end() ? nullptr : it->second;
}

std::shared_ptr<Variable> Module::GetOrCreateVariable(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = variables_.find(name);
  if (it != variables_.end()) return it->second;
  auto variable = std::make_shared<Variable>(name);
  variables_[name] = variable;
  return variable;
}

std::shared_ptr<Module> Module::FindChild(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = children_.find(name);
  return it == children_.end() ? nullptr : it->second;
}

void Module::AddChild(std::shared_ptr<Module> child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_[child->Name()] = std::move(child);
}

std::vector<std::shared_ptr<Module>> Module::Children() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<Module>> out;
  for (const auto& entry : children_) out.push_back(entry.second);
  return out;
}

void Module::AddImport(std::shared_ptr<Module> module, std::string prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  imports_.push_back(ModuleImport{std::move(module), std::move(prefix)});
}

std::vector<ModuleImport> Module::Imports() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return imports_;
}

void Module::SetImports(std::vector<ModuleImport> imports) {
  std::lock_guard<std::mutex> lock(mutex_);
  imports_ = std::move(imports);
}

std::shared_ptr<Module> Module::Duplicate() const {
  auto copy = std::make_shared<Module>(name_, description_, forthic_code_);
  copy->runtime_specific_ = runtime_specific_;
  copy->instance_init_ = instance_init_;
  std::vector<std::shared_ptr<Module>> children;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!instance_init_) {
      copy->words_ = words_;
      copy->exportable_ = exportable_;
    }
    for (const auto& entry : variables_) {
      copy->variables_[entry.first] = std::make_shared<Variable>(entry.first, entry.second->Get());
    }
    for (const auto& entry : children_) children.push_back(entry.second);
    copy->imports_ = imports_;
  }
  for (const auto& child : children) copy->AddChild(child->Duplicate());
  if (instance_init_) instance_init_(*copy);
  return copy;
}

bool ModuleRegistry::Register(std::shared_ptr<Module> module, std::string* error) {
  if (!module) {
    if (error) *error = "cannot register a null module";
    return false;
  }
  if (Find(module->Name())) {
    if (error) *error = "module '" + module->Name() + "' is already registered";
    return false;
  }
  modules_.push_back(std::move(module));
  return true;
}

std::shared_ptr<Module> ModuleRegistry::Find(const std::string& name) const {
  for (const auto& module : modules_) {
    if (module->Name() == name) return module;
  }
  return nullptr;
}

} // namespace Forthic::Runtime
