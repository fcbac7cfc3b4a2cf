#include "bridge_server.h"

#include <exception>
#include <iostream>

#include "bridge_serializer.h"

namespace Forthic::Bridge {

namespace {

template <typename Response>
void ReportInternalError(const std::exception& e, Response* response) {
  response->clear_result_stack();
  Runtime::ErrorInfo error =
      Runtime::MakeError(Runtime::ErrorKind::RemoteExecution, std::string("internal error: ") + e.what());
  EncodeError(error, response->mutable_error());
}

} // namespace

RuntimeServicer::RuntimeServicer(std::shared_ptr<const Runtime::ModuleRegistry> registry)
    : service_(std::move(registry)) {}

grpc::Status RuntimeServicer::ExecuteWord(grpc::ServerContext*,
                                          const pb::ExecuteWordRequest* request,
                                          pb::ExecuteWordResponse* response) {
  try {
    service_.ExecuteWord(*request, response);
  } catch (const std::exception& e) {
    ReportInternalError(e, response);
  }
  return grpc::Status::OK;
}

grpc::Status RuntimeServicer::ExecuteSequence(grpc::ServerContext*,
                                              const pb::ExecuteSequenceRequest* request,
                                              pb::ExecuteSequenceResponse* response) {
  try {
    service_.ExecuteSequence(*request, response);
  } catch (const std::exception& e) {
    ReportInternalError(e, response);
  }
  return grpc::Status::OK;
}

grpc::Status RuntimeServicer::ListModules(grpc::ServerContext*,
                                          const pb::ListModulesRequest* request,
                                          pb::ListModulesResponse* response) {
  service_.ListModules(*request, response);
  return grpc::Status::OK;
}

grpc::Status RuntimeServicer::GetModuleInfo(grpc::ServerContext*,
                                            const pb::GetModuleInfoRequest* request,
                                            pb::GetModuleInfoResponse* response) {
  std::string error;
  if (!service_.GetModuleInfo(*request, response, &error)) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, error);
  }
  return grpc::Status::OK;
}

std::unique_ptr<grpc::Server> StartServer(const ServerOptions& options,
                                          RuntimeServicer* servicer,
                                          int* selected_port,
                                          std::string* error) {
  const std::string address = options.host + ":" + std::to_string(options.port);
  int bound_port = 0;
  grpc::ServerBuilder builder;
  builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &bound_port);
  builder.RegisterService(servicer);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || bound_port == 0) {
    if (error) *error = "failed to listen on " + address;
    return nullptr;
  }
  if (selected_port) *selected_port = bound_port;
  return server;
}

int RunServer(const ServerOptions& options,
              std::shared_ptr<const Runtime::ModuleRegistry> registry) {
  RuntimeServicer servicer(registry);
  int port = 0;
  std::string error;
  std::unique_ptr<grpc::Server> server = StartServer(options, &servicer, &port, &error);
  if (!server) {
    std::cerr << "error: " << error << "\n";
    return 1;
  }
  std::cout << "[server] forthic runtime listening on " << options.host << ":" << port << "\n";
  for (const auto& module : registry->Modules()) {
    std::cout << "[server] module " << module->Name() << " (" << module->WordCount()
              << " words)\n";
  }
  server->Wait();
  return 0;
}

} // namespace Forthic::Bridge
