#include <iostream>
#include <string>

#include "bridge_client.h"
#include "bridge_server.h"
#include "remote_module.h"
#include "test_utils.h"

namespace Forthic::Tests {

namespace {

using Bridge::BridgeClient;
using Runtime::ErrorKind;
using Runtime::Interpreter;

std::shared_ptr<Runtime::ModuleRegistry> MakeServerRegistry() {
  auto registry = MakeCoreRegistry();
  auto math = std::make_shared<Runtime::Module>("math", "Integer arithmetic");
  math->AddDirectWord("ADD", "( a:int b:int -- sum:int )", "Adds two integers",
                      [](Interpreter& interp) {
                        Runtime::ValueList args;
                        if (!interp.PopValues(2, &args)) return false;
                        interp.Push(Runtime::MakeInt(args[0].int_value + args[1].int_value));
                        return true;
                      });
  std::string error;
  if (!registry->Register(math, &error)) std::cerr << error << "\n";
  return registry;
}

struct TestServer {
  std::unique_ptr<Bridge::RuntimeServicer> servicer;
  std::unique_ptr<grpc::Server> server;
  int port = 0;

  ~TestServer() {
    if (server) server->Shutdown();
  }

  std::string Address() const { return "127.0.0.1:" + std::to_string(port); }
};

bool StartTestServer(TestServer* out) {
  out->servicer = std::make_unique<Bridge::RuntimeServicer>(MakeServerRegistry());
  Bridge::ServerOptions options;
  options.host = "127.0.0.1";
  options.port = 0;
  std::string error;
  out->server = Bridge::StartServer(options, out->servicer.get(), &out->port, &error);
  if (!out->server) {
    std::cerr << error << "\n";
    return false;
  }
  return true;
}

// Core plus remote_runtime words backed by the given manager; null gives
// each interpreter its own.
std::shared_ptr<Runtime::ModuleRegistry> MakeClientRegistry(
    std::shared_ptr<Bridge::RuntimeManager> manager) {
  auto registry = MakeCoreRegistry();
  std::shared_ptr<Runtime::Module> remote;
  std::string error;
  if (!Bridge::CreateRemoteRuntimeModule(std::move(manager), &remote, &error) ||
      !registry->Register(remote, &error)) {
    std::cerr << error << "\n";
  }
  return registry;
}

bool RunOk(Interpreter& interp, const std::string& src) {
  if (interp.Run(src)) return true;
  std::cerr << Runtime::FormatError(interp.Error()) << "\n";
  return false;
}

bool ContextEquals(const Runtime::ErrorInfo& error, const std::string& key, const std::string& value) {
  auto it = error.context.find(key);
  if (it == error.context.end() || it->second != value) {
    std::cerr << "context " << key << " mismatch in: " << Runtime::FormatError(error) << "\n";
    return false;
  }
  return true;
}

bool RpcExecutesWord() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  BridgeClient client(server.Address());
  Runtime::ValueList result;
  Runtime::ErrorInfo error;
  if (!client.ExecuteWord("ADD", {Runtime::MakeInt(2), Runtime::MakeInt(3)}, &result, &error)) {
    std::cerr << Runtime::FormatError(error) << "\n";
    return false;
  }
  return result.size() == 1 && ExpectInt(result[0], 5);
}

bool RpcExecutesSequence() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  BridgeClient client(server.Address());
  Runtime::ValueList result;
  Runtime::ErrorInfo error;
  if (!client.ExecuteSequence({"DUP", "ADD"}, {Runtime::MakeInt(21)}, &result, &error)) {
    std::cerr << Runtime::FormatError(error) << "\n";
    return false;
  }
  return result.size() == 1 && ExpectInt(result[0], 42);
}

bool RpcRemoteErrorIsWrapped() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  BridgeClient client(server.Address());
  Runtime::ValueList result;
  Runtime::ErrorInfo error;
  if (client.ExecuteWord("NOPE", {}, &result, &error)) return false;
  if (error.kind != ErrorKind::RemoteExecution || error.runtime != Runtime::kRuntimeName) return false;
  const std::string prefix = "Remote word 'NOPE' failed in cpp runtime: ";
  if (error.message.compare(0, prefix.size(), prefix) != 0) {
    std::cerr << "unexpected message: " << error.message << "\n";
    return false;
  }
  return ContextEquals(error, "remote_error_type", "UnknownWordError");
}

bool RpcListsModules() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  BridgeClient client(server.Address());
  std::vector<Bridge::RemoteModuleSummary> modules;
  Runtime::ErrorInfo error;
  if (!client.ListModules(&modules, &error)) return false;
  return modules.size() == 2 && modules[0].name == "core" && modules[1].name == "math" &&
         modules[1].word_count == 1 && modules[1].description == "Integer arithmetic";
}

bool RpcDescribesModule() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  BridgeClient client(server.Address());
  Bridge::RemoteModuleInfo info;
  Runtime::ErrorInfo error;
  if (!client.GetModuleInfo("math", &info, &error)) return false;
  return info.name == "math" && info.words.size() == 1 && info.words[0].name == "ADD" &&
         info.words[0].stack_effect == "( a:int b:int -- sum:int )";
}

bool RpcUnknownModuleIsNotFound() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  BridgeClient client(server.Address());
  Bridge::RemoteModuleInfo info;
  Runtime::ErrorInfo error;
  if (client.GetModuleInfo("ghost", &info, &error)) return false;
  if (error.kind != ErrorKind::RemoteExecution || error.module_name != "ghost") return false;
  return ContextEquals(error, "grpc_code", std::to_string(static_cast<int>(grpc::StatusCode::NOT_FOUND)));
}

bool RpcUnreachableRuntime() {
  BridgeClient client("127.0.0.1:1");
  client.SetTimeout(std::chrono::milliseconds(500));
  std::vector<Bridge::RemoteModuleSummary> modules;
  Runtime::ErrorInfo error;
  if (client.ListModules(&modules, &error)) return false;
  return error.kind == ErrorKind::RemoteExecution && ContextEquals(error, "address", "127.0.0.1:1");
}

bool RpcUsesRemoteModules() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  auto manager = std::make_shared<Bridge::RuntimeManager>();
  Interpreter interp(MakeClientRegistry(manager));
  if (!interp.UseAllRegisteredModules()) return false;
  const std::string src = "\"peer\" \"" + server.Address() + "\" CONNECT-RUNTIME "
                          "[\"math\"] \"peer\" USE-REMOTE-MODULES 2 3 ADD";
  if (!RunOk(interp, src)) return false;
  return ExpectStackJson(interp, {"5"});
}

bool RpcUsesRemoteModulesWithPrefix() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  auto manager = std::make_shared<Bridge::RuntimeManager>();
  manager->Connect("peer", server.Address());
  Interpreter interp(MakeClientRegistry(manager));
  if (!interp.UseAllRegisteredModules()) return false;
  if (!RunOk(interp, "[\"math\"] \"peer\" \"m\" USE-REMOTE-MODULES-AS 4 6 m.ADD")) return false;
  if (!ExpectStackJson(interp, {"10"})) return false;
  if (interp.Run("ADD")) return false;
  return interp.Error().kind == ErrorKind::UnknownWord;
}

bool RpcRemoteWordFailureCarriesRuntime() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  auto manager = std::make_shared<Bridge::RuntimeManager>();
  manager->Connect("peer", server.Address());
  Interpreter interp(MakeClientRegistry(manager));
  if (!interp.UseAllRegisteredModules()) return false;
  if (!RunOk(interp, "[\"math\"] \"peer\" USE-REMOTE-MODULES")) return false;
  if (interp.Run("1 ADD")) return false;
  const Runtime::ErrorInfo& error = interp.Error();
  if (error.kind != ErrorKind::RemoteExecution) return false;
  return ContextEquals(error, "runtime_name", "peer") && ContextEquals(error, "word_name", "ADD") &&
         ContextEquals(error, "remote_error_type", "StackUnderflowError");
}

bool RpcMissingRemoteModuleFailsImport() {
  TestServer server;
  if (!StartTestServer(&server)) return false;
  auto manager = std::make_shared<Bridge::RuntimeManager>();
  manager->Connect("peer", server.Address());
  Interpreter interp(MakeClientRegistry(manager));
  if (!interp.UseAllRegisteredModules()) return false;
  if (interp.Run("[\"ghost\"] \"peer\" USE-REMOTE-MODULES")) return false;
  const Runtime::ErrorInfo& error = interp.Error();
  const std::string prefix = "Cannot import ghost from peer runtime: ";
  return error.kind == ErrorKind::ModuleImport && error.message.compare(0, prefix.size(), prefix) == 0;
}

bool RpcUnconnectedRuntimeFails() {
  auto manager = std::make_shared<Bridge::RuntimeManager>();
  Interpreter interp(MakeClientRegistry(manager));
  if (!interp.UseAllRegisteredModules()) return false;
  if (interp.Run("[\"math\"] \"nobody\" USE-REMOTE-MODULES")) return false;
  return interp.Error().kind == ErrorKind::RemoteExecution &&
         ContextEquals(interp.Error(), "runtime_name", "nobody");
}

bool RpcConnectAndListRuntimes() {
  auto manager = std::make_shared<Bridge::RuntimeManager>();
  Interpreter interp(MakeClientRegistry(manager));
  if (!interp.UseAllRegisteredModules()) return false;
  if (!RunOk(interp, "\"b\" \"127.0.0.1:2\" CONNECT-RUNTIME \"a\" \"127.0.0.1:1\" CONNECT-RUNTIME "
                     "LIST-RUNTIMES \"b\" DISCONNECT-RUNTIME LIST-RUNTIMES")) {
    return false;
  }
  if (!ExpectStackJson(interp, {"[\"a\", \"b\"]", "[\"a\"]"})) return false;
  return manager->Find("b") == nullptr && manager->Find("a")->Address() == "127.0.0.1:1";
}

bool RpcConnectionsArePerInterpreter() {
  auto registry = MakeClientRegistry(nullptr);
  Interpreter first(registry);
  Interpreter second(registry);
  if (!first.UseAllRegisteredModules() || !second.UseAllRegisteredModules()) return false;
  if (!RunOk(first, "\"peer\" \"127.0.0.1:1\" CONNECT-RUNTIME LIST-RUNTIMES")) return false;
  if (!RunOk(second, "LIST-RUNTIMES")) return false;
  if (!ExpectStackJson(first, {"[\"peer\"]"})) return false;
  if (!ExpectStackJson(second, {"[]"})) return false;
  return registry->Find(Bridge::kRemoteRuntimeModuleName)->RuntimeSpecific();
}

bool RpcReconnectReplacesClient() {
  Bridge::RuntimeManager manager;
  auto first = manager.Connect("peer", "127.0.0.1:1");
  auto second = manager.Connect("peer", "127.0.0.1:2");
  return first != second && manager.Find("peer") == second && manager.RuntimeNames().size() == 1 &&
         !manager.Disconnect("other") && manager.Disconnect("peer");
}

const TestCase kRpcClientTests[] = {
  {"rpc_execute_word", RpcExecutesWord},
  {"rpc_execute_sequence", RpcExecutesSequence},
  {"rpc_remote_error_wrapped", RpcRemoteErrorIsWrapped},
  {"rpc_list_modules", RpcListsModules},
  {"rpc_describe_module", RpcDescribesModule},
  {"rpc_unknown_module_not_found", RpcUnknownModuleIsNotFound},
  {"rpc_unreachable_runtime", RpcUnreachableRuntime},
};

const TestCase kRpcRemoteModuleTests[] = {
  {"rpc_use_remote_modules", RpcUsesRemoteModules},
  {"rpc_use_remote_modules_prefix", RpcUsesRemoteModulesWithPrefix},
  {"rpc_remote_word_failure", RpcRemoteWordFailureCarriesRuntime},
  {"rpc_missing_remote_module", RpcMissingRemoteModuleFailsImport},
  {"rpc_unconnected_runtime", RpcUnconnectedRuntimeFails},
  {"rpc_connect_list_runtimes", RpcConnectAndListRuntimes},
  {"rpc_connections_per_interpreter", RpcConnectionsArePerInterpreter},
  {"rpc_reconnect_replaces_client", RpcReconnectReplacesClient},
};

} // namespace

static const TestSection kRpcSections[] = {
  {"rpc_client", kRpcClientTests, sizeof(kRpcClientTests) / sizeof(kRpcClientTests[0])},
  {"rpc_remote_modules", kRpcRemoteModuleTests,
   sizeof(kRpcRemoteModuleTests) / sizeof(kRpcRemoteModuleTests[0])},
};

const TestSection* GetRpcSections(size_t* count) {
  if (count) *count = sizeof(kRpcSections) / sizeof(kRpcSections[0]);
  return kRpcSections;
}

} // namespace Forthic::Tests
