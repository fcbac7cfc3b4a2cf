#ifndef FORTHIC_BRIDGE_SERVER_H
#define FORTHIC_BRIDGE_SERVER_H

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "bridge_service.h"
#include "forthic_runtime.grpc.pb.h"

namespace Forthic::Bridge {

struct ServerOptions {
  std::string host = "0.0.0.0";
  int port = 50051;
};

class RuntimeServicer final : public pb::ForthicRuntime::Service {
public:
  explicit RuntimeServicer(std::shared_ptr<const Runtime::ModuleRegistry> registry);

  grpc::Status ExecuteWord(grpc::ServerContext* context,
                           const pb::ExecuteWordRequest* request,
                           pb::ExecuteWordResponse* response) override;
  grpc::Status ExecuteSequence(grpc::ServerContext* context,
                               const pb::ExecuteSequenceRequest* request,
                               pb::ExecuteSequenceResponse* response) override;
  grpc::Status ListModules(grpc::ServerContext* context,
                           const pb::ListModulesRequest* request,
                           pb::ListModulesResponse* response) override;
  grpc::Status GetModuleInfo(grpc::ServerContext* context,
                             const pb::GetModuleInfoRequest* request,
                             pb::GetModuleInfoResponse* response) override;

private:
  BridgeService service_;
};

// Port 0 picks a free port, reported through selected_port.
std::unique_ptr<grpc::Server> StartServer(const ServerOptions& options,
                                          RuntimeServicer* servicer,
                                          int* selected_port,
                                          std::string* error);

// Blocks until the server shuts down. Returns a process exit code.
int RunServer(const ServerOptions& options,
              std::shared_ptr<const Runtime::ModuleRegistry> registry);

} // namespace Forthic::Bridge

#endif // FORTHIC_BRIDGE_SERVER_H
