#include "bridge_service.h"

#include "bridge_serializer.h"
#include "interpreter.h"

namespace Forthic::Bridge {

namespace {

std::string JoinWords(const google::protobuf::RepeatedPtrField<std::string>& words) {
  std::string out;
  for (int i = 0; i < words.size(); ++i) {
    if (i > 0) out += " ";
    out += words.Get(i);
  }
  return out;
}

Runtime::ErrorInfo MarshalError(const std::string& message) {
  return Runtime::MakeError(Runtime::ErrorKind::RemoteExecution, message);
}

} // namespace

BridgeService::BridgeService(std::shared_ptr<const Runtime::ModuleRegistry> registry)
    : registry_(std::move(registry)) {}

void BridgeService::ExecuteWord(const pb::ExecuteWordRequest& request,
                                pb::ExecuteWordResponse* response) const {
  Runtime::ErrorInfo failure;
  Runtime::ValueList stack;
  std::string marshal_error;
  if (!DecodeStack(request.stack(), &stack, &marshal_error)) {
    failure = MarshalError("invalid request stack: " + marshal_error);
  } else {
    Runtime::Interpreter interp(registry_);
    interp.SetStack(std::move(stack));
    if (!interp.UseAllRegisteredModules() || !interp.ExecuteWordByName(request.word_name())) {
      failure = interp.Error();
    } else if (!EncodeStack(interp.Stack(), response->mutable_result_stack(), &marshal_error)) {
      response->clear_result_stack();
      failure = MarshalError("result stack: " + marshal_error);
    }
  }
  if (failure.Ok()) return;
  failure.context["word_name"] = request.word_name();
  EncodeError(failure, response->mutable_error());
}

void BridgeService::ExecuteSequence(const pb::ExecuteSequenceRequest& request,
                                    pb::ExecuteSequenceResponse* response) const {
  Runtime::ErrorInfo failure;
  Runtime::ValueList stack;
  std::string marshal_error;
  if (!DecodeStack(request.stack(), &stack, &marshal_error)) {
    failure = MarshalError("invalid request stack: " + marshal_error);
  } else {
    Runtime::Interpreter interp(registry_);
    interp.SetStack(std::move(stack));
    if (!interp.UseAllRegisteredModules()) failure = interp.Error();
    for (int i = 0; failure.Ok() && i < request.word_names_size(); ++i) {
      if (!interp.ExecuteWordByName(request.word_names(i))) {
        failure = interp.Error();
        failure.context["failed_index"] = std::to_string(i);
        failure.context["failed_word"] = request.word_names(i);
        break;
      }
    }
    if (failure.Ok() &&
        !EncodeStack(interp.Stack(), response->mutable_result_stack(), &marshal_error)) {
      response->clear_result_stack();
      failure = MarshalError("result stack: " + marshal_error);
    }
  }
  if (failure.Ok()) return;
  failure.context["word_sequence"] = JoinWords(request.word_names());
  EncodeError(failure, response->mutable_error());
}

void BridgeService::ListModules(const pb::ListModulesRequest&,
                                pb::ListModulesResponse* response) const {
  if (!registry_) return;
  for (const auto& module : registry_->Modules()) {
    pb::ModuleSummary* summary = response->add_modules();
    summary->set_name(module->Name());
    summary->set_description(module->Description());
    summary->set_word_count(static_cast<int32_t>(module->WordCount()));
    summary->set_runtime_specific(module->RuntimeSpecific());
  }
}

bool BridgeService::GetModuleInfo(const pb::GetModuleInfoRequest& request,
                                  pb::GetModuleInfoResponse* response,
                                  std::string* error) const {
  std::shared_ptr<Runtime::Module> module =
      registry_ ? registry_->Find(request.module_name()) : nullptr;
  if (!module) {
    if (error) *error = "Module '" + request.module_name() + "' not found";
    return false;
  }
  response->set_name(module->Name());
  response->set_description(module->Description());
  for (const auto& word : module->ExportedWords()) {
    pb::WordInfo* info = response->add_words();
    info->set_name(word->Name());
    info->set_stack_effect(word->StackEffect());
    info->set_description(word->Description());
  }
  return true;
}

} // namespace Forthic::Bridge
