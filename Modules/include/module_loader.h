#ifndef FORTHIC_MODULE_LOADER_H
#define FORTHIC_MODULE_LOADER_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "module.h"

namespace Forthic::Modules {

inline constexpr const char* kModulesConfigEnv = "FORTHIC_MODULES_CONFIG";
inline constexpr const char* kFileImportPrefix = "file:";

struct ModuleConfigEntry {
  std::string name;
  std::string import_path;
  bool optional = false;
  std::string description;
  // Reported to remote callers; marks modules other runtimes lack.
  bool runtime_specific = false;
};

// Parses the YAML subset used by module config files:
//
//   modules:
//     - name: core
//       import_path: forthic.core
//       optional: false
//       runtime_specific: false
//       description: Core words
bool ParseModuleConfig(const std::string& text,
                       std::vector<ModuleConfigEntry>* out,
                       std::string* error);
bool LoadModuleConfigFile(const std::string& path,
                          std::vector<ModuleConfigEntry>* out,
                          std::string* error);

using ModuleFactory = std::function<bool(std::shared_ptr<Runtime::Module>* out, std::string* error)>;

// Compiled-in module constructors keyed by import path.
class ModuleFactoryRegistry {
public:
  void Add(const std::string& import_path, ModuleFactory factory);
  const ModuleFactory* Find(const std::string& import_path) const;
  std::vector<std::string> ImportPaths() const;

private:
  std::map<std::string, ModuleFactory> factories_;
};

// forthic.core
ModuleFactoryRegistry BuiltinFactories();

// Builds one module from an entry: a factory import path, or file:<path> for
// a module whose words are defined by Forthic source.
bool BuildModule(const ModuleConfigEntry& entry,
                 const ModuleFactoryRegistry& factories,
                 const std::shared_ptr<Runtime::ModuleRegistry>& registry,
                 std::shared_ptr<Runtime::Module>* out,
                 std::string* error);

// Registers every entry in order. A failing required entry stops loading and
// returns false; a failing optional entry is logged and skipped.
bool LoadModules(const std::vector<ModuleConfigEntry>& entries,
                 const ModuleFactoryRegistry& factories,
                 const std::shared_ptr<Runtime::ModuleRegistry>& registry,
                 std::string* error);

// The core module plus every module named by the config file, if any.
bool BuildRegistry(const std::string& config_path,
                   const ModuleFactoryRegistry& factories,
                   std::shared_ptr<Runtime::ModuleRegistry>* out,
                   std::string* error);

} // namespace Forthic::Modules

#endif // FORTHIC_MODULE_LOADER_H
