#include "core_module.h"

#include <cctype>
#include <ostream>

#include "interpreter.h"
#include "word_binding.h"

namespace Forthic::Modules {

using Runtime::ErrorKind;
using Runtime::Interpreter;
using Runtime::Value;
using Runtime::ValueKind;
using Runtime::ValueList;

namespace {

bool IsEmptyValue(const Value& value) {
  return value.IsNull() || (value.kind == ValueKind::String && value.text.empty());
}

bool ValidateVariableName(Interpreter& interp, const std::string& name) {
  if (name.compare(0, 2, "__") == 0) {
    return interp.Fail(ErrorKind::InvalidVariableName,
                       "Invalid variable name: " + name + " (names starting with '__' are reserved)");
  }
  return true;
}

// Accepts a variable reference or a variable name; names are created in the
// current module on first use.
bool ResolveVariable(Interpreter& interp, const Value& ref,
                     std::shared_ptr<Runtime::Variable>* out) {
  if (ref.kind == ValueKind::Variable && ref.variable) {
    *out = ref.variable;
    return true;
  }
  if (ref.kind == ValueKind::String) {
    if (!ValidateVariableName(interp, ref.text)) return false;
    *out = interp.CurModule()->GetOrCreateVariable(ref.text);
    return true;
  }
  return interp.Fail(ErrorKind::InvalidVariableName,
                     std::string("Expected a variable or variable name, got ") +
                         Runtime::ToString(ref.kind));
}

// Pops an Options value if one is on top; otherwise yields empty options.
Value PopOptionalOptions(Interpreter& interp) {
  Value options = Runtime::MakeOptions(Runtime::FieldList());
  if (interp.StackSize() > 0 && interp.Stack().back().kind == ValueKind::Options) {
    interp.Pop(&options);
  }
  return options;
}

struct FormatOptions {
  std::string separator = ", ";
  std::string null_text = "null";
  bool json = false;
};

FormatOptions ReadFormatOptions(const Value& options) {
  FormatOptions format;
  if (const Value* sep = options.FindField("separator")) {
    if (sep->kind == ValueKind::String) format.separator = sep->text;
  }
  if (const Value* null_text = options.FindField("null_text")) {
    if (null_text->kind == ValueKind::String) format.null_text = null_text->text;
  }
  if (const Value* json = options.FindField("json")) {
    format.json = json->kind == ValueKind::Bool && json->bool_value;
  }
  return format;
}

std::string ValueToText(const Value& value, const FormatOptions& format) {
  if (value.IsNull()) return format.null_text;
  if (format.json) return Runtime::ToJson(value);
  if (value.kind == ValueKind::Array) {
    std::string out;
    bool first = true;
    for (const auto& item : value.Items()) {
      if (!first) out += format.separator;
      first = false;
      out += Runtime::ToDisplayString(item);
    }
    return out;
  }
  return Runtime::ToDisplayString(value);
}

bool IsVarStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsVarPart(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// Replaces .name (at start or after whitespace) with the variable's value.
// "\." stays a literal dot.
bool Interpolate(Interpreter& interp, const std::string& text, const FormatOptions& format,
                 std::string* out) {
  std::string result;
  size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '\\' && i + 1 < text.size() && text[i + 1] == '.') {
      result.push_back('.');
      i += 2;
      continue;
    }
    const bool at_boundary =
        i == 0 || std::isspace(static_cast<unsigned char>(text[i - 1]));
    if (c == '.' && at_boundary && i + 1 < text.size() && IsVarStart(text[i + 1])) {
      size_t end = i + 1;
      while (end < text.size() && IsVarPart(text[end])) ++end;
      const std::string name = text.substr(i + 1, end - i - 1);
      std::shared_ptr<Runtime::Variable> variable;
      if (!ResolveVariable(interp, Runtime::MakeString(name), &variable)) return false;
      result += ValueToText(variable->Get(), format);
      i = end;
      continue;
    }
    result.push_back(c);
    ++i;
  }
  *out = std::move(result);
  return true;
}

bool AddBindings(Runtime::Module& module, std::string* error) {
  const Runtime::WordBinding bindings[] = {
    {"POP", "( a:any -- )", "Removes top item from stack",
     [](const ValueList&, const Value&, Value&, bool& has_ret, std::string&) {
       has_ret = false;
       return true;
     }},
    {"IDENTITY", "( -- )", "Does nothing",
     [](const ValueList&, const Value&, Value&, bool& has_ret, std::string&) {
       has_ret = false;
       return true;
     }},
    {"NOP", "( -- )", "Does nothing",
     [](const ValueList&, const Value&, Value&, bool& has_ret, std::string&) {
       has_ret = false;
       return true;
     }},
    {"NULL", "( -- null:any )", "Pushes null",
     [](const ValueList&, const Value&, Value& ret, bool& has_ret, std::string&) {
       ret = Runtime::MakeNull();
       has_ret = true;
       return true;
     }},
    {"ARRAY?", "( value:any -- boolean:bool )", "Returns true if value is an array",
     [](const ValueList& args, const Value&, Value& ret, bool& has_ret, std::string&) {
       ret = Runtime::MakeBool(args[0].kind == ValueKind::Array);
       has_ret = true;
       return true;
     }},
    {"DEFAULT", "( value:any default_value:any -- result:any )",
     "Returns value, or default_value if value is null or an empty string",
     [](const ValueList& args, const Value&, Value& ret, bool& has_ret, std::string&) {
       ret = IsEmptyValue(args[0]) ? args[1] : args[0];
       has_ret = true;
       return true;
     }},
  };
  for (const auto& binding : bindings) {
    if (!module.AddNativeWord(binding, error)) return false;
  }
  return true;
}

void AddStackWords(Runtime::Module& module) {
  module.AddDirectWord("DUP", "( a:any -- a:any a:any )", "Duplicates top stack item",
                       [](Interpreter& interp) {
                         Value a;
                         if (!interp.Pop(&a)) return false;
                         interp.Push(a);
                         interp.Push(a);
                         return true;
                       });
  module.AddDirectWord("SWAP", "( a:any b:any -- b:any a:any )", "Swaps top two stack items",
                       [](Interpreter& interp) {
                         ValueList items;
                         if (!interp.PopValues(2, &items)) return false;
                         interp.Push(items[1]);
                         interp.Push(items[0]);
                         return true;
                       });
  module.AddDirectWord("PEEK!", "( -- )", "Prints top of stack and stops execution",
                       [](Interpreter& interp) {
                         if (interp.StackSize() == 0) {
                           interp.Out() << "<STACK EMPTY>\n";
                         } else {
                           interp.Out() << Runtime::ToDisplayString(interp.Stack().back()) << "\n";
                         }
                         return interp.Fail(ErrorKind::IntentionalStop, "PEEK!");
                       });
  module.AddDirectWord("STACK!", "( -- )", "Prints the stack, top first, and stops execution",
                       [](Interpreter& interp) {
                         ValueList reversed(interp.Stack().rbegin(), interp.Stack().rend());
                         interp.Out() << Runtime::ToJson(Runtime::MakeArray(reversed)) << "\n";
                         return interp.Fail(ErrorKind::IntentionalStop, "STACK!");
                       });
}

void AddVariableWords(Runtime::Module& module) {
  module.AddDirectWord("VARIABLES", "( varnames:str[] -- )", "Creates variables in current module",
                       [](Interpreter& interp) {
                         Value names;
                         if (!interp.Pop(&names)) return false;
                         for (const Value& name : names.Items()) {
                           if (name.kind != ValueKind::String) {
                             return interp.Fail(ErrorKind::InvalidVariableName,
                                                "Variable names must be strings");
                           }
                           if (!ValidateVariableName(interp, name.text)) return false;
                           interp.CurModule()->GetOrCreateVariable(name.text);
                         }
                         return true;
                       });
  module.AddDirectWord("!", "( value:any variable:any -- )", "Sets variable value",
                       [](Interpreter& interp) {
                         ValueList items;
                         if (!interp.PopValues(2, &items)) return false;
                         std::shared_ptr<Runtime::Variable> variable;
                         if (!ResolveVariable(interp, items[1], &variable)) return false;
                         variable->Set(items[0]);
                         return true;
                       });
  module.AddDirectWord("@", "( variable:any -- value:any )", "Gets variable value",
                       [](Interpreter& interp) {
                         Value ref;
                         if (!interp.Pop(&ref)) return false;
                         std::shared_ptr<Runtime::Variable> variable;
                         if (!ResolveVariable(interp, ref, &variable)) return false;
                         interp.Push(variable->Get());
                         return true;
                       });
  module.AddDirectWord("!@", "( value:any variable:any -- value:any )",
                       "Sets variable and returns value", [](Interpreter& interp) {
                         ValueList items;
                         if (!interp.PopValues(2, &items)) return false;
                         std::shared_ptr<Runtime::Variable> variable;
                         if (!ResolveVariable(interp, items[1], &variable)) return false;
                         variable->Set(items[0]);
                         interp.Push(variable->Get());
                         return true;
                       });
}

void AddExecutionWords(Runtime::Module& module) {
  module.AddDirectWord("INTERPRET", "( string:str -- )", "Interprets Forthic string in current context",
                       [](Interpreter& interp) {
                         Value code;
                         if (!interp.Pop(&code)) return false;
                         if (IsEmptyValue(code)) return true;
                         Lang::CodeLocation location;
                         location.source = "<interpret>";
                         return interp.Run(code.text, location);
                       });
  module.AddDirectWord("FIND-WORD", "( name:str -- word:Word )",
                       "Resolves a word by name in the current context",
                       [](Interpreter& interp) {
                         Value name;
                         if (!interp.Pop(&name)) return false;
                         if (name.kind != ValueKind::String) {
                           return interp.Fail(ErrorKind::NativeWord,
                                              std::string("FIND-WORD expects a string, got ") +
                                                  Runtime::ToString(name.kind));
                         }
                         std::shared_ptr<Runtime::Word> word;
                         if (!interp.ResolveWord(name.text, &word)) return false;
                         interp.Push(Runtime::MakeWordRef(std::move(word)));
                         return true;
                       });
  module.AddDirectWord("EXECUTE", "( word:Word -- )", "Runs a word reference",
                       [](Interpreter& interp) {
                         Value word;
                         if (!interp.Pop(&word)) return false;
                         if (word.kind != ValueKind::Word || !word.word) {
                           return interp.Fail(ErrorKind::NativeWord,
                                              std::string("EXECUTE expects a word, got ") +
                                                  Runtime::ToString(word.kind));
                         }
                         return interp.Dispatch(*word.word, nullptr);
                       });
  module.AddDirectWord("CUR-MODULE", "( -- module:Module )", "Pushes the current module",
                       [](Interpreter& interp) {
                         interp.Push(Runtime::MakeModuleRef(interp.CurModule()));
                         return true;
                       });
  module.AddDirectWord("*DEFAULT", "( value:any default_forthic:str -- result:any )",
                       "Returns value, or runs default_forthic if value is null or empty",
                       [](Interpreter& interp) {
                         ValueList items;
                         if (!interp.PopValues(2, &items)) return false;
                         if (!IsEmptyValue(items[0])) {
                           interp.Push(items[0]);
                           return true;
                         }
                         Lang::CodeLocation location;
                         location.source = "<*DEFAULT>";
                         return interp.Run(items[1].text, location);
                       });
  module.AddDirectWord("TRY", "( forthic:str -- error:any )",
                       "Runs forthic; pushes null on success or an error record on failure",
                       [](Interpreter& interp) {
                         Value code;
                         if (!interp.Pop(&code)) return false;
                         Lang::CodeLocation location;
                         location.source = "<try>";
                         if (interp.Run(code.text, location)) {
                           interp.Push(Runtime::MakeNull());
                           return true;
                         }
                         if (interp.Error().kind == ErrorKind::IntentionalStop) return false;
                         const Runtime::ErrorInfo failure = interp.Error();
                         interp.ClearError();
                         interp.Push(Runtime::MakeRecord({
                           {"message", Runtime::MakeString(failure.message)},
                           {"error_type", Runtime::MakeString(failure.error_type)},
                           {"module_name", Runtime::MakeString(failure.module_name)},
                           {"word_location", Runtime::MakeString(failure.word_location)},
                         }));
                         return true;
                       });
}

void AddModuleWords(Runtime::Module& module) {
  module.AddDirectWord("EXPORT", "( names:str[] -- )", "Exports words from current module",
                       [](Interpreter& interp) {
                         Value names;
                         if (!interp.Pop(&names)) return false;
                         std::vector<std::string> exported;
                         for (const Value& name : names.Items()) {
                           if (name.kind == ValueKind::String) exported.push_back(name.text);
                         }
                         interp.CurModule()->AddExportable(exported);
                         return true;
                       });
  module.AddDirectWord("USE-MODULES", "( names:any[] -- )",
                       "Imports modules by name or [name prefix] pair",
                       [](Interpreter& interp) {
                         Value names;
                         if (!interp.Pop(&names)) return false;
                         if (names.IsNull()) return true;
                         return interp.UseModules(names);
                       });
  module.AddDirectWord("~>", "( array:any[] -- options:WordOptions )",
                       "Converts [.key value ...] into word options", [](Interpreter& interp) {
                         Value array;
                         if (!interp.Pop(&array)) return false;
                         if (array.kind != ValueKind::Array) {
                           return interp.Fail(ErrorKind::Options,
                                              std::string("~> expects an array, got ") +
                                                  Runtime::ToString(array.kind));
                         }
                         Value options;
                         std::string error;
                         if (!Runtime::MakeOptionsFromPairs(array.Items(), &options, &error)) {
                           return interp.Fail(ErrorKind::Options, error);
                         }
                         interp.Push(std::move(options));
                         return true;
                       });
}

void AddProfilingWords(Runtime::Module& module) {
  module.AddDirectWord("PROFILE-START", "( -- )", "Starts profiling word execution",
                       [](Interpreter& interp) {
                         interp.StartProfiling();
                         return true;
                       });
  module.AddDirectWord("PROFILE-END", "( -- )", "Stops profiling word execution",
                       [](Interpreter& interp) {
                         interp.StopProfiling();
                         return true;
                       });
  module.AddDirectWord("PROFILE-TIMESTAMP", "( label:str -- )",
                       "Records profiling timestamp with label", [](Interpreter& interp) {
                         Value label;
                         if (!interp.Pop(&label)) return false;
                         interp.AddTimestamp(Runtime::ToDisplayString(label));
                         return true;
                       });
  module.AddDirectWord("PROFILE-DATA", "( -- profile_data:record )",
                       "Returns profiling data (word counts and timestamps)",
                       [](Interpreter& interp) {
                         interp.Push(interp.ProfileData());
                         return true;
                       });
}

void AddOutputWords(Runtime::Module& module) {
  module.AddDirectWord("INTERPOLATE", "( string:str [options:WordOptions] -- result:str )",
                       "Interpolates variables (.name); \\. escapes a literal dot",
                       [](Interpreter& interp) {
                         const FormatOptions format = ReadFormatOptions(PopOptionalOptions(interp));
                         Value text;
                         if (!interp.Pop(&text)) return false;
                         std::string result;
                         if (!Interpolate(interp, text.text, format, &result)) return false;
                         interp.Push(Runtime::MakeString(std::move(result)));
                         return true;
                       });
  module.AddDirectWord("PRINT", "( value:any [options:WordOptions] -- )",
                       "Prints value; strings interpolate variables (.name)",
                       [](Interpreter& interp) {
                         const FormatOptions format = ReadFormatOptions(PopOptionalOptions(interp));
                         Value value;
                         if (!interp.Pop(&value)) return false;
                         std::string text;
                         if (value.kind == ValueKind::String) {
                           if (!Interpolate(interp, value.text, format, &text)) return false;
                         } else {
                           text = ValueToText(value, format);
                         }
                         interp.Out() << text << "\n";
                         return true;
                       });
}

} // namespace

bool CreateCoreModule(std::shared_ptr<Runtime::Module>* out, std::string* error) {
  auto module = std::make_shared<Runtime::Module>(kCoreModuleName, "Core stack, variable and module words");
  if (!AddBindings(*module, error)) return false;
  AddStackWords(*module);
  AddVariableWords(*module);
  AddExecutionWords(*module);
  AddModuleWords(*module);
  AddProfilingWords(*module);
  AddOutputWords(*module);
  *out = std::move(module);
  return true;
}

} // namespace Forthic::Modules
