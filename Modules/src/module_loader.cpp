#include "module_loader.h"

#include <fstream>
#include <iostream>
#include <sstream>

#include "core_module.h"
#include "interpreter.h"

namespace Forthic::Modules {

namespace {

std::string Trim(const std::string& text) {
  const char* kSpace = " \t\r";
  size_t begin = text.find_first_not_of(kSpace);
  if (begin == std::string::npos) return "";
  size_t end = text.find_last_not_of(kSpace);
  return text.substr(begin, end - begin + 1);
}

std::string StripComment(const std::string& line) {
  char quote = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote) {
      if (c == quote) quote = 0;
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      continue;
    }
    if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
      text.back() == text.front()) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

bool ParseBool(const std::string& text, bool* out) {
  if (text == "true" || text == "True" || text == "yes") {
    *out = true;
    return true;
  }
  if (text == "false" || text == "False" || text == "no") {
    *out = false;
    return true;
  }
  return false;
}

bool ApplyField(ModuleConfigEntry& entry, const std::string& key, const std::string& raw,
                size_t line_no, std::string* error) {
  const std::string value = Unquote(raw);
  if (key == "name") {
    entry.name = value;
  } else if (key == "import_path") {
    entry.import_path = value;
  } else if (key == "description") {
    entry.description = value;
  } else if (key == "optional" || key == "runtime_specific") {
    bool* flag = key == "optional" ? &entry.optional : &entry.runtime_specific;
    if (!ParseBool(value, flag)) {
      if (error) *error = "line " + std::to_string(line_no) + ": invalid boolean '" + value + "'";
      return false;
    }
  } else {
    if (error) *error = "line " + std::to_string(line_no) + ": unknown module field '" + key + "'";
    return false;
  }
  return true;
}

bool SplitKeyValue(const std::string& text, std::string* key, std::string* value) {
  const size_t colon = text.find(':');
  if (colon == std::string::npos) return false;
  *key = Trim(text.substr(0, colon));
  *value = Trim(text.substr(colon + 1));
  return !key->empty();
}

bool ReadFileText(const std::string& path, std::string* out, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) *error = "failed to open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return true;
}

bool ValidateEntry(const ModuleConfigEntry& entry, size_t index, std::string* error) {
  if (entry.name.empty()) {
    if (error) *error = "module entry " + std::to_string(index) + " has no name";
    return false;
  }
  if (entry.import_path.empty()) {
    if (error) *error = "module '" + entry.name + "' has no import_path";
    return false;
  }
  return true;
}

} // namespace

bool ParseModuleConfig(const std::string& text,
                       std::vector<ModuleConfigEntry>* out,
                       std::string* error) {
  out->clear();
  std::istringstream lines(text);
  std::string raw_line;
  size_t line_no = 0;
  bool in_modules = false;
  bool have_entry = false;
  ModuleConfigEntry entry;

  while (std::getline(lines, raw_line)) {
    ++line_no;
    const std::string line = StripComment(raw_line);
    const std::string trimmed = Trim(line);
    if (trimmed.empty()) continue;

    const size_t indent = line.find_first_not_of(" \t");
    if (indent == 0) {
      std::string key;
      std::string value;
      if (!SplitKeyValue(trimmed, &key, &value) || key != "modules") {
        if (error) *error = "line " + std::to_string(line_no) + ": expected 'modules:'";
        return false;
      }
      if (!value.empty() && value != "[]") {
        if (error) *error = "line " + std::to_string(line_no) + ": 'modules' must be a list";
        return false;
      }
      in_modules = true;
      continue;
    }
    if (!in_modules) {
      if (error) *error = "line " + std::to_string(line_no) + ": content before 'modules:'";
      return false;
    }

    std::string item = trimmed;
    if (item[0] == '-') {
      if (have_entry) out->push_back(entry);
      entry = ModuleConfigEntry();
      have_entry = true;
      item = Trim(item.substr(1));
      if (item.empty()) continue;
    } else if (!have_entry) {
      if (error) *error = "line " + std::to_string(line_no) + ": expected '- name: ...'";
      return false;
    }

    std::string key;
    std::string value;
    if (!SplitKeyValue(item, &key, &value)) {
      if (error) *error = "line " + std::to_string(line_no) + ": expected 'key: value'";
      return false;
    }
    if (!ApplyField(entry, key, value, line_no, error)) return false;
  }
  if (have_entry) out->push_back(entry);

  for (size_t i = 0; i < out->size(); ++i) {
    if (!ValidateEntry((*out)[i], i, error)) return false;
  }
  return true;
}

bool LoadModuleConfigFile(const std::string& path,
                          std::vector<ModuleConfigEntry>* out,
                          std::string* error) {
  std::string text;
  if (!ReadFileText(path, &text, error)) return false;
  std::string parse_error;
  if (!ParseModuleConfig(text, out, &parse_error)) {
    if (error) *error = path + ": " + parse_error;
    return false;
  }
  return true;
}

void ModuleFactoryRegistry::Add(const std::string& import_path, ModuleFactory factory) {
  factories_[import_path] = std::move(factory);
}

const ModuleFactory* ModuleFactoryRegistry::Find(const std::string& import_path) const {
  auto it = factories_.find(import_path);
  return it == factories_.end() ? nullptr : &it->second;
}

std::vector<std::string> ModuleFactoryRegistry::ImportPaths() const {
  std::vector<std::string> paths;
  for (const auto& entry : factories_) paths.push_back(entry.first);
  return paths;
}

ModuleFactoryRegistry BuiltinFactories() {
  ModuleFactoryRegistry factories;
  factories.Add("forthic.core", CreateCoreModule);
  return factories;
}

bool BuildModule(const ModuleConfigEntry& entry,
                 const ModuleFactoryRegistry& factories,
                 const std::shared_ptr<Runtime::ModuleRegistry>& registry,
                 std::shared_ptr<Runtime::Module>* out,
                 std::string* error) {
  const std::string prefix = kFileImportPrefix;
  if (entry.import_path.compare(0, prefix.size(), prefix) == 0) {
    std::string code;
    if (!ReadFileText(entry.import_path.substr(prefix.size()), &code, error)) return false;
    auto module = std::make_shared<Runtime::Module>(entry.name, entry.description, code);
    module->SetRuntimeSpecific(entry.runtime_specific);
    Runtime::Interpreter interp(registry);
    if (!interp.UseAllRegisteredModules() || !interp.RunModuleCode(module)) {
      if (error) *error = Runtime::FormatError(interp.Error());
      return false;
    }
    *out = std::move(module);
    return true;
  }

  const ModuleFactory* factory = factories.Find(entry.import_path);
  if (!factory) {
    if (error) *error = "unknown import_path '" + entry.import_path + "'";
    return false;
  }
  std::shared_ptr<Runtime::Module> module;
  if (!(*factory)(&module, error)) return false;
  if (module->Name() != entry.name) {
    if (error) *error = "import_path '" + entry.import_path + "' provides module '" +
                        module->Name() + "', not '" + entry.name + "'";
    return false;
  }
  if (!entry.description.empty()) module->SetDescription(entry.description);
  if (entry.runtime_specific) module->SetRuntimeSpecific(true);
  *out = std::move(module);
  return true;
}

bool LoadModules(const std::vector<ModuleConfigEntry>& entries,
                 const ModuleFactoryRegistry& factories,
                 const std::shared_ptr<Runtime::ModuleRegistry>& registry,
                 std::string* error) {
  for (const auto& entry : entries) {
    std::shared_ptr<Runtime::Module> module;
    std::string load_error;
    bool ok = BuildModule(entry, factories, registry, &module, &load_error);
    if (ok) ok = registry->Register(module, &load_error);
    if (ok) continue;
    if (entry.optional) {
      std::cerr << "[module_loader] skipping optional module '" << entry.name
                << "': " << load_error << "\n";
      continue;
    }
    if (error) *error = "ModuleLoadError: failed to load required module '" + entry.name +
                        "': " + load_error;
    return false;
  }
  return true;
}

bool BuildRegistry(const std::string& config_path,
                   const ModuleFactoryRegistry& factories,
                   std::shared_ptr<Runtime::ModuleRegistry>* out,
                   std::string* error) {
  std::vector<ModuleConfigEntry> entries;
  if (!config_path.empty() && !LoadModuleConfigFile(config_path, &entries, error)) return false;

  auto registry = std::make_shared<Runtime::ModuleRegistry>();
  bool config_has_core = false;
  for (const auto& entry : entries) {
    if (entry.name == kCoreModuleName) config_has_core = true;
  }
  if (!config_has_core) {
    std::shared_ptr<Runtime::Module> core;
    if (!CreateCoreModule(&core, error)) return false;
    if (!registry->Register(core, error)) return false;
  }
  if (!LoadModules(entries, factories, registry, error)) return false;
  *out = std::move(registry);
  return true;
}

} // namespace Forthic::Modules
