#include "interpreter.h"

#include <algorithm>
#include <iterator>
#include <iostream>

#include "lang_literals.h"
#include "lang_tokenizer.h"

namespace Forthic::Runtime {

namespace {

std::string DisplayModuleName(const Module& module) {
  return module.Name().empty() ? "<app>" : module.Name();
}

std::string JoinNames(const std::vector<std::string>& names, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out += sep;
    out += names[i];
  }
  return out;
}

Value TemporalToValue(const Lang::TemporalLiteral& literal) {
  switch (literal.kind) {
    case Lang::TemporalKind::Instant: return MakeInstant(literal.text);
    case Lang::TemporalKind::ZonedDateTime:
      return MakeZonedDateTime(literal.text, literal.timezone);
    case Lang::TemporalKind::PlainDate: return MakePlainDate(literal.text);
  }
  return MakeNull();
}

} // namespace

Interpreter::Interpreter(std::shared_ptr<const ModuleRegistry> registry)
    : registry_(std::move(registry)), app_module_(std::make_shared<Module>("")) {
  module_stack_.push_back(app_module_);
  out_ = &std::cout;
  InstallLiteralHandlers();
}

void Interpreter::InstallLiteralHandlers() {
  literal_handlers_.push_back([](const std::string& text, Value* out) {
    bool value = false;
    if (!Lang::ParseBoolLiteral(text, &value)) return false;
    *out = MakeBool(value);
    return true;
  });
  literal_handlers_.push_back([](const std::string& text, Value* out) {
    int64_t value = 0;
    if (!Lang::ParseIntLiteral(text, &value)) return false;
    *out = MakeInt(value);
    return true;
  });
  literal_handlers_.push_back([](const std::string& text, Value* out) {
    double value = 0.0;
    if (!Lang::ParseFloatLiteral(text, &value)) return false;
    *out = MakeFloat(value);
    return true;
  });
  literal_handlers_.push_back([this](const std::string& text, Value* out) {
    Lang::TemporalLiteral literal;
    if (!Lang::ParseDateTimeLiteral(text, timezone_, &literal)) return false;
    *out = TemporalToValue(literal);
    return true;
  });
  literal_handlers_.push_back([](const std::string& text, Value* out) {
    Lang::TemporalLiteral literal;
    if (!Lang::ParsePlainDateLiteral(text, &literal)) return false;
    *out = TemporalToValue(literal);
    return true;
  });
  literal_handlers_.push_back([](const std::string& text, Value* out) {
    std::string clock;
    if (!Lang::ParseTimeLiteral(text, &clock)) return false;
    *out = MakePlainTime(std::move(clock));
    return true;
  });
}

bool Interpreter::Run(const std::string& source) {
  return Run(source, Lang::CodeLocation());
}

bool Interpreter::Run(const std::string& source, const Lang::CodeLocation& reference) {
  error_ = ErrorInfo();
  Lang::Tokenizer tokenizer(source, reference);
  RunState state;
  const size_t module_depth = module_stack_.size();
  for (;;) {
    Lang::Token token;
    if (!tokenizer.Next(&token)) {
      FailAt(ErrorKind::Tokenize, tokenizer.Error(), tokenizer.ErrorLocation());
      break;
    }
    if (token.kind == Lang::TokenKind::End) {
      if (state.definition) {
        FailAt(ErrorKind::Definition,
               "Missing semicolon: definition '" + state.definition->Name() + "' is not closed",
               state.definition->Location());
        break;
      }
      return true;
    }
    if (!HandleToken(token, state)) break;
  }
  RestoreModuleDepth(module_depth);
  return false;
}

bool Interpreter::ExecuteTokens(const std::vector<Lang::Token>& tokens) {
  RunState state;
  const size_t module_depth = module_stack_.size();
  for (const Lang::Token& token : tokens) {
    if (!HandleToken(token, state)) {
      RestoreModuleDepth(module_depth);
      return false;
    }
  }
  if (state.definition) {
    RestoreModuleDepth(module_depth);
    return FailAt(ErrorKind::Definition,
                  "Missing semicolon: definition '" + state.definition->Name() + "' is not closed",
                  state.definition->Location());
  }
  return true;
}

bool Interpreter::ExecuteWordByName(const std::string& name) {
  error_ = ErrorInfo();
  Lang::Token token;
  token.kind = Lang::TokenKind::Word;
  token.text = name;
  token.location.source = "<remote>";
  return HandleWordToken(token);
}

bool Interpreter::Dispatch(Word& word, const Lang::CodeLocation* location) {
  if (profiling_ && word.CountsAsDispatch()) CountWordExecution(word);
  if (ExecuteWithHandlers(word)) return true;
  if (error_.word_location.empty() && location) {
    error_.word_location = Lang::FormatLocation(*location);
  }
  if (error_.module_name.empty()) error_.module_name = word.ModuleName();
  return false;
}

bool Interpreter::ExecuteWithHandlers(Word& word) {
  if (word.Execute(*this)) return true;
  if (error_.kind == ErrorKind::None) {
    Fail(ErrorKind::NativeWord, "word " + word.QualifiedName() + " failed");
  }
  if (error_.kind == ErrorKind::IntentionalStop || !word.HasErrorHandlers()) return false;
  const ErrorInfo failure = error_;
  error_ = ErrorInfo();
  if (word.TryErrorHandlers(failure, *this)) return true;
  error_ = failure;
  return false;
}

bool Interpreter::RunModuleCode(const std::shared_ptr<Module>& module) {
  const size_t depth = module_stack_.size();
  PushModule(module);
  Lang::CodeLocation location;
  location.source = module->Name();
  const bool ok = Run(module->ForthicCode(), location);
  RestoreModuleDepth(depth);
  if (ok) return true;

  ErrorInfo cause = error_;
  error_ = MakeError(ErrorKind::ModuleLoad,
                     "Error loading module '" + module->Name() + "': " + cause.message);
  error_.stack_trace = cause.stack_trace;
  error_.word_location = cause.word_location;
  error_.module_name = module->Name();
  error_.context = cause.context;
  error_.context["cause"] = cause.error_type;
  return false;
}

bool Interpreter::Fail(ErrorKind kind, const std::string& message) {
  error_ = MakeError(kind, message);
  return false;
}

bool Interpreter::FailAt(ErrorKind kind, const std::string& message,
                         const Lang::CodeLocation& location) {
  Fail(kind, message);
  error_.word_location = Lang::FormatLocation(location);
  return false;
}

void Interpreter::Push(Value value) {
  stack_.push_back(std::move(value));
}

bool Interpreter::Pop(Value* out) {
  if (stack_.empty()) return Fail(ErrorKind::StackUnderflow, "Stack underflow");
  *out = std::move(stack_.back());
  stack_.pop_back();
  return true;
}

bool Interpreter::PopValues(size_t count, ValueList* out) {
  if (stack_.size() < count) {
    return Fail(ErrorKind::StackUnderflow,
                "Stack underflow: need " + std::to_string(count) + " value(s), have " +
                    std::to_string(stack_.size()));
  }
  const auto first = stack_.end() - static_cast<std::ptrdiff_t>(count);
  out->assign(std::make_move_iterator(first), std::make_move_iterator(stack_.end()));
  stack_.erase(first, stack_.end());
  return true;
}

bool Interpreter::Peek(Value* out) {
  if (stack_.empty()) return Fail(ErrorKind::StackUnderflow, "Stack underflow");
  *out = stack_.back();
  return true;
}

void Interpreter::PushModule(std::shared_ptr<Module> module) {
  module_stack_.push_back(std::move(module));
}

bool Interpreter::PopModule() {
  if (module_stack_.size() <= 1) {
    return Fail(ErrorKind::Definition, "Cannot pop the app module off the module stack");
  }
  module_stack_.pop_back();
  return true;
}

void Interpreter::RestoreModuleDepth(size_t depth) {
  if (depth == 0) depth = 1;
  if (module_stack_.size() > depth) module_stack_.resize(depth);
}

void Interpreter::RegisterModule(std::shared_ptr<Module> module) {
  local_modules_[module->Name()] = std::move(module);
}

std::shared_ptr<Module> Interpreter::FindModule(const std::string& name) const {
  auto it = local_modules_.find(name);
  if (it != local_modules_.end()) return it->second;
  if (registry_) return registry_->Find(name);
  return nullptr;
}

bool Interpreter::UseModule(const std::string& name, const std::string& prefix) {
  std::shared_ptr<Module> module = FindModule(name);
  if (!module) {
    Fail(ErrorKind::ModuleImport, "Module not found: " + name);
    error_.module_name = name;
    return false;
  }
  CurModule()->AddImport(LocalInstance(module), prefix);
  return true;
}

bool Interpreter::UseModules(const Value& names) {
  if (names.kind != ValueKind::Array) {
    return Fail(ErrorKind::ModuleImport,
                std::string("USE-MODULES expects an array, got ") + ToString(names.kind));
  }
  for (const Value& item : names.Items()) {
    if (item.kind == ValueKind::String) {
      if (!UseModule(item.text, "")) return false;
      continue;
    }
    const ValueList& pair = item.Items();
    if (item.kind == ValueKind::Array && pair.size() == 2 &&
        pair[0].kind == ValueKind::String && pair[1].kind == ValueKind::String) {
      if (!UseModule(pair[0].text, pair[1].text)) return false;
      continue;
    }
    return Fail(ErrorKind::ModuleImport,
                "USE-MODULES entry must be a name or [name prefix], got " + ToJson(item));
  }
  return true;
}

bool Interpreter::UseAllRegisteredModules() {
  if (!registry_) return true;
  for (const auto& module : registry_->Modules()) {
    CurModule()->AddImport(LocalInstance(module), "");
  }
  return true;
}

std::shared_ptr<Module> Interpreter::LocalInstance(const std::shared_ptr<Module>& module) {
  if (!module || !registry_ || registry_->Find(module->Name()) != module) return module;
  return Instantiate(module);
}

std::shared_ptr<Module> Interpreter::Instantiate(const std::shared_ptr<Module>& shared) {
  auto it = instances_.find(shared.get());
  if (it != instances_.end()) return it->second;
  std::shared_ptr<Module> instance = shared->Duplicate();
  instances_[shared.get()] = instance;
  RebindImports(*instance);
  return instance;
}

// Imports captured while a module loaded point at modules other
// interpreters also see; swap them for instances owned here.
void Interpreter::RebindImports(Module& instance) {
  std::vector<ModuleImport> imports = instance.Imports();
  for (ModuleImport& imp : imports) {
    std::shared_ptr<Module> shared = registry_->Find(imp.module->Name());
    imp.module = Instantiate(shared ? shared : imp.module);
  }
  instance.SetImports(std::move(imports));
  for (const auto& child : instance.Children()) RebindImports(*child);
}

std::shared_ptr<Word> Interpreter::FindWord(const std::string& name) const {
  for (auto it = module_stack_.rbegin(); it != module_stack_.rend(); ++it) {
    const Module& module = **it;
    if (auto word = module.FindWord(name, false)) return word;
    const std::vector<ModuleImport> imports = module.Imports();
    for (auto imp = imports.rbegin(); imp != imports.rend(); ++imp) {
      std::string local_name = name;
      if (!imp->prefix.empty()) {
        const std::string lead = imp->prefix + ".";
        if (name.compare(0, lead.size(), lead) != 0) continue;
        local_name = name.substr(lead.size());
      }
      if (auto word = imp->module->FindWord(local_name, true)) {
        return std::make_shared<ImportedWord>(name, word, imp->module);
      }
    }
  }
  return nullptr;
}

bool Interpreter::ResolveWord(const std::string& name, std::shared_ptr<Word>* out) {
  *out = FindWord(name);
  if (*out) return true;
  Fail(ErrorKind::UnknownWord, "Unknown word: " + name);
  error_.context["word_name"] = name;
  error_.context["scope_chain"] = JoinNames(ScopeChainNames(), " > ");
  return false;
}

std::vector<std::string> Interpreter::ScopeChainNames() const {
  std::vector<std::string> names;
  for (auto it = module_stack_.rbegin(); it != module_stack_.rend(); ++it) {
    names.push_back(DisplayModuleName(**it));
    const std::vector<ModuleImport> imports = (*it)->Imports();
    for (auto imp = imports.rbegin(); imp != imports.rend(); ++imp) {
      std::string entry = DisplayModuleName(*imp->module);
      if (!imp->prefix.empty()) entry += " as " + imp->prefix;
      names.push_back(entry);
    }
  }
  return names;
}

void Interpreter::AddLiteralHandler(LiteralHandler handler) {
  literal_handlers_.push_back(std::move(handler));
}

bool Interpreter::ResolveLiteral(const std::string& text, Value* out) const {
  for (const auto& handler : literal_handlers_) {
    if (handler(text, out)) return true;
  }
  return false;
}

bool Interpreter::HandleToken(const Lang::Token& token, RunState& state) {
  using Lang::TokenKind;
  if (state.definition) {
    switch (token.kind) {
      case TokenKind::DefinitionOpen:
      case TokenKind::MemoDefinitionOpen:
        return FailAt(ErrorKind::Definition,
                      "Missing semicolon: definition '" + state.definition->Name() +
                          "' is not closed before '" + token.text + "'",
                      token.location);
      case TokenKind::DefinitionClose:
        return HandleDefinitionClose(token, state);
      case TokenKind::Comment:
      case TokenKind::End:
        return true;
      default:
        state.definition->AddToken(token);
        return true;
    }
  }

  switch (token.kind) {
    case TokenKind::End:
    case TokenKind::Comment:
      return true;
    case TokenKind::String:
    case TokenKind::DotSymbol:
      Push(MakeString(token.text));
      return true;
    case TokenKind::ArrayOpen:
      state.array_marks.push_back(stack_.size());
      return true;
    case TokenKind::ArrayClose:
      return HandleArrayClose(token, state);
    case TokenKind::ModuleOpen:
      return HandleModuleOpen(token);
    case TokenKind::ModuleClose:
      if (!PopModule()) {
        error_.word_location = Lang::FormatLocation(token.location);
        return false;
      }
      return true;
    case TokenKind::DefinitionOpen:
    case TokenKind::MemoDefinitionOpen:
      state.definition = std::make_shared<DefinitionWord>(token.text, CurModule()->Name());
      state.definition->SetLocation(token.location);
      state.memo = token.kind == TokenKind::MemoDefinitionOpen;
      return true;
    case TokenKind::DefinitionClose:
      return HandleDefinitionClose(token, state);
    case TokenKind::Number:
    case TokenKind::Word:
      return HandleWordToken(token);
  }
  return true;
}

bool Interpreter::HandleArrayClose(const Lang::Token& token, RunState& state) {
  if (state.array_marks.empty()) {
    return FailAt(ErrorKind::Tokenize, "unmatched ']'", token.location);
  }
  const size_t mark = state.array_marks.back();
  state.array_marks.pop_back();
  if (stack_.size() < mark) {
    return FailAt(ErrorKind::StackUnderflow,
                  "Array literal consumed values pushed before its '['", token.location);
  }
  ValueList items;
  PopValues(stack_.size() - mark, &items);
  Push(MakeArray(std::move(items)));
  return true;
}

bool Interpreter::HandleModuleOpen(const Lang::Token& token) {
  if (token.text.empty()) {
    PushModule(app_module_);
    return true;
  }
  std::shared_ptr<Module> parent = CurModule();
  std::shared_ptr<Module> module = parent->FindChild(token.text);
  if (!module) {
    module = std::make_shared<Module>(token.text);
    parent->AddChild(module);
    if (parent == app_module_) RegisterModule(module);
  }
  PushModule(std::move(module));
  return true;
}

bool Interpreter::HandleDefinitionClose(const Lang::Token& token, RunState& state) {
  if (!state.definition) {
    return FailAt(ErrorKind::Definition, "Extra semicolon", token.location);
  }
  if (state.memo) {
    CurModule()->AddMemoWords(state.definition);
  } else {
    CurModule()->AddWord(state.definition);
  }
  state.definition.reset();
  state.memo = false;
  return true;
}

bool Interpreter::HandleWordToken(const Lang::Token& token) {
  Value literal;
  if (ResolveLiteral(token.text, &literal)) {
    Push(std::move(literal));
    return true;
  }
  std::shared_ptr<Word> word;
  if (!ResolveWord(token.text, &word)) {
    error_.word_location = Lang::FormatLocation(token.location);
    return false;
  }
  return Dispatch(*word, &token.location);
}

void Interpreter::StartProfiling() {
  word_counts_.clear();
  timestamps_.clear();
  profiling_ = true;
  profile_start_ = std::chrono::steady_clock::now();
  AddTimestamp("START");
}

void Interpreter::StopProfiling() {
  AddTimestamp("END");
  profiling_ = false;
}

void Interpreter::CountWordExecution(const Word& word) {
  ++word_counts_[word.QualifiedName()];
}

void Interpreter::AddTimestamp(const std::string& label) {
  if (!profiling_) return;
  const auto elapsed = std::chrono::steady_clock::now() - profile_start_;
  ProfileTimestamp stamp;
  stamp.label = label;
  stamp.time_ms = std::chrono::duration<double, std::milli>(elapsed).count();
  timestamps_.push_back(stamp);
}

Value Interpreter::ProfileData() const {
  std::vector<std::pair<std::string, int64_t>> counts(word_counts_.begin(), word_counts_.end());
  std::stable_sort(counts.begin(), counts.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });
  ValueList count_items;
  for (const auto& entry : counts) {
    count_items.push_back(MakeRecord({{"word", MakeString(entry.first)},
                                      {"count", MakeInt(entry.second)}}));
  }

  ValueList stamp_items;
  double previous = 0.0;
  for (const auto& stamp : timestamps_) {
    stamp_items.push_back(MakeRecord({{"label", MakeString(stamp.label)},
                                      {"time_ms", MakeFloat(stamp.time_ms)},
                                      {"delta", MakeFloat(stamp.time_ms - previous)}}));
    previous = stamp.time_ms;
  }
  return MakeRecord({{"word_counts", MakeArray(std::move(count_items))},
                     {"timestamps", MakeArray(std::move(stamp_items))}});
}

void Interpreter::SetOutput(std::ostream* out) {
  out_ = out ? out : &std::cout;
}

} // namespace Forthic::Runtime
