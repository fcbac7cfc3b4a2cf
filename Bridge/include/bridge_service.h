#ifndef FORTHIC_BRIDGE_SERVICE_H
#define FORTHIC_BRIDGE_SERVICE_H

#include <memory>
#include <string>

#include "forthic_runtime.pb.h"
#include "module.h"

namespace Forthic::Bridge {

namespace pb = ::forthic;

// Transport-independent request handling. Every request runs on its own
// interpreter with every registered module imported; the registry is never
// mutated. Failures are reported in the response's error field.
class BridgeService {
public:
  explicit BridgeService(std::shared_ptr<const Runtime::ModuleRegistry> registry);

  void ExecuteWord(const pb::ExecuteWordRequest& request, pb::ExecuteWordResponse* response) const;
  void ExecuteSequence(const pb::ExecuteSequenceRequest& request,
                       pb::ExecuteSequenceResponse* response) const;
  void ListModules(const pb::ListModulesRequest& request, pb::ListModulesResponse* response) const;
  // Returns false when the module is not registered.
  bool GetModuleInfo(const pb::GetModuleInfoRequest& request,
                     pb::GetModuleInfoResponse* response,
                     std::string* error) const;

private:
  std::shared_ptr<const Runtime::ModuleRegistry> registry_;
};

} // namespace Forthic::Bridge

#endif // FORTHIC_BRIDGE_SERVICE_H
