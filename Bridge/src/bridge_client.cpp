#include "bridge_client.h"

#include "bridge_serializer.h"

namespace Forthic::Bridge {

namespace {

Runtime::ErrorInfo RemoteFailure(const pb::ErrorInfo& remote, const std::string& what) {
  Runtime::ErrorInfo error = DecodeError(remote);
  error.context["remote_error_type"] = error.error_type;
  error.context["remote_message"] = error.message;
  error.kind = Runtime::ErrorKind::RemoteExecution;
  error.error_type = Runtime::ErrorTypeName(Runtime::ErrorKind::RemoteExecution);
  error.message = what + " failed in " + (error.runtime.empty() ? "remote" : error.runtime) +
                  " runtime: " + error.message;
  return error;
}

Runtime::ErrorInfo MarshalFailure(const std::string& message) {
  return Runtime::MakeError(Runtime::ErrorKind::RemoteExecution, message);
}

} // namespace

BridgeClient::BridgeClient(const std::string& address)
    : BridgeClient(grpc::CreateChannel(address, grpc::InsecureChannelCredentials()), address) {}

BridgeClient::BridgeClient(std::shared_ptr<grpc::Channel> channel, std::string address)
    : address_(std::move(address)), stub_(pb::ForthicRuntime::NewStub(channel)) {}

void BridgeClient::PrepareContext(grpc::ClientContext* context) const {
  if (timeout_.count() > 0) {
    context->set_deadline(std::chrono::system_clock::now() + timeout_);
  }
}

Runtime::ErrorInfo BridgeClient::TransportError(const grpc::Status& status,
                                                const std::string& call) const {
  Runtime::ErrorInfo error = MarshalFailure(call + " to " + address_ + " failed: " +
                                            status.error_message());
  error.context["grpc_code"] = std::to_string(static_cast<int>(status.error_code()));
  error.context["address"] = address_;
  return error;
}

bool BridgeClient::ExecuteWord(const std::string& word_name,
                               const Runtime::ValueList& stack,
                               Runtime::ValueList* result,
                               Runtime::ErrorInfo* error) {
  pb::ExecuteWordRequest request;
  request.set_word_name(word_name);
  std::string marshal_error;
  if (!EncodeStack(stack, request.mutable_stack(), &marshal_error)) {
    if (error) *error = MarshalFailure("cannot send stack for " + word_name + ": " + marshal_error);
    return false;
  }
  pb::ExecuteWordResponse response;
  grpc::ClientContext context;
  PrepareContext(&context);
  const grpc::Status status = stub_->ExecuteWord(&context, request, &response);
  if (!status.ok()) {
    if (error) *error = TransportError(status, "ExecuteWord");
    return false;
  }
  if (response.has_error()) {
    if (error) *error = RemoteFailure(response.error(), "Remote word '" + word_name + "'");
    return false;
  }
  if (!DecodeStack(response.result_stack(), result, &marshal_error)) {
    if (error) *error = MarshalFailure("invalid result stack from " + word_name + ": " + marshal_error);
    return false;
  }
  return true;
}

bool BridgeClient::ExecuteSequence(const std::vector<std::string>& word_names,
                                   const Runtime::ValueList& stack,
                                   Runtime::ValueList* result,
                                   Runtime::ErrorInfo* error) {
  pb::ExecuteSequenceRequest request;
  for (const auto& name : word_names) request.add_word_names(name);
  std::string marshal_error;
  if (!EncodeStack(stack, request.mutable_stack(), &marshal_error)) {
    if (error) *error = MarshalFailure("cannot send stack: " + marshal_error);
    return false;
  }
  pb::ExecuteSequenceResponse response;
  grpc::ClientContext context;
  PrepareContext(&context);
  const grpc::Status status = stub_->ExecuteSequence(&context, request, &response);
  if (!status.ok()) {
    if (error) *error = TransportError(status, "ExecuteSequence");
    return false;
  }
  if (response.has_error()) {
    if (error) *error = RemoteFailure(response.error(), "Remote sequence");
    return false;
  }
  if (!DecodeStack(response.result_stack(), result, &marshal_error)) {
    if (error) *error = MarshalFailure("invalid result stack: " + marshal_error);
    return false;
  }
  return true;
}

bool BridgeClient::ListModules(std::vector<RemoteModuleSummary>* out, Runtime::ErrorInfo* error) {
  pb::ListModulesRequest request;
  pb::ListModulesResponse response;
  grpc::ClientContext context;
  PrepareContext(&context);
  const grpc::Status status = stub_->ListModules(&context, request, &response);
  if (!status.ok()) {
    if (error) *error = TransportError(status, "ListModules");
    return false;
  }
  out->clear();
  for (const auto& module : response.modules()) {
    RemoteModuleSummary summary;
    summary.name = module.name();
    summary.description = module.description();
    summary.word_count = module.word_count();
    summary.runtime_specific = module.runtime_specific();
    out->push_back(summary);
  }
  return true;
}

bool BridgeClient::GetModuleInfo(const std::string& module_name,
                                 RemoteModuleInfo* out,
                                 Runtime::ErrorInfo* error) {
  pb::GetModuleInfoRequest request;
  request.set_module_name(module_name);
  pb::GetModuleInfoResponse response;
  grpc::ClientContext context;
  PrepareContext(&context);
  const grpc::Status status = stub_->GetModuleInfo(&context, request, &response);
  if (!status.ok()) {
    if (error) {
      *error = TransportError(status, "GetModuleInfo");
      error->module_name = module_name;
    }
    return false;
  }
  out->name = response.name();
  out->description = response.description();
  out->words.clear();
  for (const auto& word : response.words()) {
    out->words.push_back(RemoteWordInfo{word.name(), word.stack_effect(), word.description()});
  }
  return true;
}

} // namespace Forthic::Bridge
