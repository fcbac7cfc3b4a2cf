#include "remote_module.h"

#include "interpreter.h"

namespace Forthic::Bridge {

using Runtime::ErrorKind;
using Runtime::Interpreter;
using Runtime::Value;
using Runtime::ValueKind;
using Runtime::ValueList;

RemoteWord::RemoteWord(std::string name,
                       std::string module_name,
                       std::string runtime_name,
                       std::shared_ptr<BridgeClient> client)
    : Word(std::move(name), std::move(module_name)),
      runtime_name_(std::move(runtime_name)),
      client_(std::move(client)) {}

bool RemoteWord::Execute(Interpreter& interp) {
  ValueList result;
  Runtime::ErrorInfo error;
  if (!client_->ExecuteWord(name_, interp.Stack(), &result, &error)) {
    error.context["runtime_name"] = runtime_name_;
    error.context["word_name"] = name_;
    if (error.module_name.empty()) error.module_name = module_name_;
    interp.MutableError() = error;
    return false;
  }
  interp.SetStack(std::move(result));
  return true;
}

bool CreateRemoteModule(const std::shared_ptr<BridgeClient>& client,
                        const std::string& runtime_name,
                        const std::string& module_name,
                        std::shared_ptr<Runtime::Module>* out,
                        Runtime::ErrorInfo* error) {
  RemoteModuleInfo info;
  if (!client->GetModuleInfo(module_name, &info, error)) {
    if (error) {
      error->kind = ErrorKind::ModuleImport;
      error->error_type = Runtime::ErrorTypeName(ErrorKind::ModuleImport);
      error->message = "Cannot import " + module_name + " from " + runtime_name +
                       " runtime: " + error->message;
      error->context["runtime_name"] = runtime_name;
    }
    return false;
  }
  auto module = std::make_shared<Runtime::Module>(info.name, info.description);
  for (const auto& word_info : info.words) {
    auto word = std::make_shared<RemoteWord>(word_info.name, info.name, runtime_name, client);
    word->SetDocumentation(word_info.stack_effect, word_info.description);
    module->AddExportableWord(word);
  }
  *out = std::move(module);
  return true;
}

std::shared_ptr<BridgeClient> RuntimeManager::Connect(const std::string& runtime_name,
                                                      const std::string& address) {
  auto client = std::make_shared<BridgeClient>(address);
  std::lock_guard<std::mutex> lock(mutex_);
  clients_[runtime_name] = client;
  return client;
}

bool RuntimeManager::Disconnect(const std::string& runtime_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.erase(runtime_name) > 0;
}

std::shared_ptr<BridgeClient> RuntimeManager::Find(const std::string& runtime_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = clients_.find(runtime_name);
  return it == clients_.end() ? nullptr : it->second;
}

std::vector<std::string> RuntimeManager::RuntimeNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto& entry : clients_) names.push_back(entry.first);
  return names;
}

namespace {

bool ExpectString(Interpreter& interp, const Value& value, const char* what) {
  if (value.kind == ValueKind::String && !value.text.empty()) return true;
  return interp.Fail(ErrorKind::NativeWord,
                     std::string("Expected ") + what + " string, got " + Runtime::ToString(value.kind));
}

// Registers each named remote module in the interpreter and imports it.
bool ImportRemoteModules(Interpreter& interp,
                         RuntimeManager& manager,
                         const Value& names,
                         const std::string& runtime_name,
                         const std::string& prefix) {
  std::shared_ptr<BridgeClient> client = manager.Find(runtime_name);
  if (!client) {
    Runtime::ErrorInfo error = Runtime::MakeError(
        ErrorKind::RemoteExecution, "Runtime '" + runtime_name + "' is not connected");
    error.context["runtime_name"] = runtime_name;
    interp.MutableError() = error;
    return false;
  }
  ValueList items = names.kind == ValueKind::Array ? names.Items() : ValueList{names};
  for (const Value& name : items) {
    if (!ExpectString(interp, name, "module name")) return false;
    std::shared_ptr<Runtime::Module> module;
    Runtime::ErrorInfo error;
    if (!CreateRemoteModule(client, runtime_name, name.text, &module, &error)) {
      interp.MutableError() = error;
      return false;
    }
    interp.RegisterModule(module);
    if (!interp.UseModule(module->Name(), prefix)) return false;
  }
  return true;
}

void AddRuntimeWords(Runtime::Module* module, std::shared_ptr<RuntimeManager> runtimes) {
  module->AddDirectWord("CONNECT-RUNTIME", "( runtime:str address:str -- )",
                        "Connects a named runtime at host:port", [runtimes](Interpreter& interp) {
                          ValueList items;
                          if (!interp.PopValues(2, &items)) return false;
                          if (!ExpectString(interp, items[0], "runtime name")) return false;
                          if (!ExpectString(interp, items[1], "address")) return false;
                          runtimes->Connect(items[0].text, items[1].text);
                          return true;
                        });
  module->AddDirectWord("DISCONNECT-RUNTIME", "( runtime:str -- )", "Drops a named runtime",
                        [runtimes](Interpreter& interp) {
                          Value name;
                          if (!interp.Pop(&name)) return false;
                          if (!ExpectString(interp, name, "runtime name")) return false;
                          runtimes->Disconnect(name.text);
                          return true;
                        });
  module->AddDirectWord("LIST-RUNTIMES", "( -- runtimes:str[] )", "Names of connected runtimes",
                        [runtimes](Interpreter& interp) {
                          ValueList names;
                          for (const auto& name : runtimes->RuntimeNames()) {
                            names.push_back(Runtime::MakeString(name));
                          }
                          interp.Push(Runtime::MakeArray(std::move(names)));
                          return true;
                        });
  module->AddDirectWord("USE-REMOTE-MODULES", "( modules:str[] runtime:str -- )",
                        "Imports modules from a connected runtime", [runtimes](Interpreter& interp) {
                          ValueList items;
                          if (!interp.PopValues(2, &items)) return false;
                          if (!ExpectString(interp, items[1], "runtime name")) return false;
                          return ImportRemoteModules(interp, *runtimes, items[0], items[1].text, "");
                        });
  module->AddDirectWord("USE-REMOTE-MODULES-AS", "( modules:str[] runtime:str prefix:str -- )",
                        "Imports modules from a connected runtime under a prefix",
                        [runtimes](Interpreter& interp) {
                          ValueList items;
                          if (!interp.PopValues(3, &items)) return false;
                          if (!ExpectString(interp, items[1], "runtime name")) return false;
                          if (items[2].kind != ValueKind::String) {
                            return interp.Fail(ErrorKind::NativeWord, "Expected prefix string");
                          }
                          return ImportRemoteModules(interp, *runtimes, items[0], items[1].text,
                                                     items[2].text);
                        });
}

} // namespace

bool CreateRemoteRuntimeModule(std::shared_ptr<RuntimeManager> manager,
                               std::shared_ptr<Runtime::Module>* out,
                               std::string*) {
  auto module = std::make_shared<Runtime::Module>(
      kRemoteRuntimeModuleName, "Connections to remote Forthic runtimes");
  module->SetRuntimeSpecific(true);
  if (manager) {
    AddRuntimeWords(module.get(), std::move(manager));
  } else {
    AddRuntimeWords(module.get(), std::make_shared<RuntimeManager>());
    module->SetInstanceInit([](Runtime::Module& instance) {
      AddRuntimeWords(&instance, std::make_shared<RuntimeManager>());
    });
  }
  *out = std::move(module);
  return true;
}

void AddRemoteFactories(Modules::ModuleFactoryRegistry* factories) {
  factories->Add("forthic.remote_runtime",
                 [](std::shared_ptr<Runtime::Module>* out, std::string* error) {
                   return CreateRemoteRuntimeModule(nullptr, out, error);
                 });
}

} // namespace Forthic::Bridge
