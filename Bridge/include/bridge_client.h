#ifndef FORTHIC_BRIDGE_CLIENT_H
#define FORTHIC_BRIDGE_CLIENT_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "errors.h"
#include "forthic_runtime.grpc.pb.h"
#include "value.h"

namespace Forthic::Bridge {

namespace pb = ::forthic;

struct RemoteModuleSummary {
  std::string name;
  std::string description;
  int word_count = 0;
  bool runtime_specific = false;
};

struct RemoteWordInfo {
  std::string name;
  std::string stack_effect;
  std::string description;
};

struct RemoteModuleInfo {
  std::string name;
  std::string description;
  std::vector<RemoteWordInfo> words;
};

// Typed calls against a remote ForthicRuntime service. Transport and remote
// failures come back as RemoteExecutionError.
class BridgeClient {
public:
  explicit BridgeClient(const std::string& address);
  BridgeClient(std::shared_ptr<grpc::Channel> channel, std::string address);

  const std::string& Address() const { return address_; }
  // Zero disables the per-call deadline.
  void SetTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

  bool ExecuteWord(const std::string& word_name,
                   const Runtime::ValueList& stack,
                   Runtime::ValueList* result,
                   Runtime::ErrorInfo* error);
  bool ExecuteSequence(const std::vector<std::string>& word_names,
                       const Runtime::ValueList& stack,
                       Runtime::ValueList* result,
                       Runtime::ErrorInfo* error);
  bool ListModules(std::vector<RemoteModuleSummary>* out, Runtime::ErrorInfo* error);
  bool GetModuleInfo(const std::string& module_name,
                     RemoteModuleInfo* out,
                     Runtime::ErrorInfo* error);

private:
  void PrepareContext(grpc::ClientContext* context) const;
  Runtime::ErrorInfo TransportError(const grpc::Status& status, const std::string& call) const;

  std::string address_;
  std::unique_ptr<pb::ForthicRuntime::Stub> stub_;
  std::chrono::milliseconds timeout_{0};
};

} // namespace Forthic::Bridge

#endif // FORTHIC_BRIDGE_CLIENT_H
