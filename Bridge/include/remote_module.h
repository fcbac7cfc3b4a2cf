#ifndef FORTHIC_REMOTE_MODULE_H
#define FORTHIC_REMOTE_MODULE_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "bridge_client.h"
#include "module.h"
#include "module_loader.h"
#include "word.h"

namespace Forthic::Bridge {

inline constexpr const char* kRemoteRuntimeModuleName = "remote_runtime";

// Proxy for a word living in another runtime. The whole local stack is sent
// and replaced by the remote result stack.
class RemoteWord : public Runtime::Word {
public:
  RemoteWord(std::string name,
             std::string module_name,
             std::string runtime_name,
             std::shared_ptr<BridgeClient> client);

  const std::string& RuntimeName() const { return runtime_name_; }
  bool Execute(Runtime::Interpreter& interp) override;

private:
  std::string runtime_name_;
  std::shared_ptr<BridgeClient> client_;
};

// Builds a local module whose exported words proxy the remote module's
// exported words.
bool CreateRemoteModule(const std::shared_ptr<BridgeClient>& client,
                        const std::string& runtime_name,
                        const std::string& module_name,
                        std::shared_ptr<Runtime::Module>* out,
                        Runtime::ErrorInfo* error);

// Named connections to remote runtimes.
class RuntimeManager {
public:
  // Replaces any existing connection with the same name.
  std::shared_ptr<BridgeClient> Connect(const std::string& runtime_name, const std::string& address);
  bool Disconnect(const std::string& runtime_name);
  std::shared_ptr<BridgeClient> Find(const std::string& runtime_name) const;
  std::vector<std::string> RuntimeNames() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<BridgeClient>> clients_;
};

// Connection words bound to the given manager. A null manager gives every
// interpreter using the module its own connection table.
bool CreateRemoteRuntimeModule(std::shared_ptr<RuntimeManager> manager,
                               std::shared_ptr<Runtime::Module>* out,
                               std::string* error);

// Adds forthic.remote_runtime with one connection table per interpreter.
void AddRemoteFactories(Modules::ModuleFactoryRegistry* factories);

} // namespace Forthic::Bridge

#endif // FORTHIC_REMOTE_MODULE_H
