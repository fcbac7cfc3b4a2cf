#include "word_binding.h"

#include <sstream>

namespace Forthic::Runtime {

namespace {

std::string Trim(const std::string& text) {
  const char* kSpace = " \t\r\n";
  size_t begin = text.find_first_not_of(kSpace);
  if (begin == std::string::npos) return "";
  size_t end = text.find_last_not_of(kSpace);
  return text.substr(begin, end - begin + 1);
}

} // namespace

bool ParseStackEffect(const std::string& text, StackEffect* out, std::string* error) {
  const std::string trimmed = Trim(text);
  if (trimmed.size() < 2 || trimmed.front() != '(' || trimmed.back() != ')') {
    if (error) *error = "stack effect must be wrapped in parentheses: " + text;
    return false;
  }
  const std::string inner = trimmed.substr(1, trimmed.size() - 2);
  const size_t sep = inner.find("--");
  if (sep == std::string::npos || inner.find("--", sep + 2) != std::string::npos) {
    if (error) *error = "stack effect must contain exactly one '--': " + text;
    return false;
  }

  StackEffect effect;
  std::istringstream inputs(inner.substr(0, sep));
  std::string item;
  while (inputs >> item) {
    if (item.rfind("[options", 0) == 0) {
      effect.has_options = true;
      continue;
    }
    ++effect.input_count;
  }
  *out = effect;
  return true;
}

std::shared_ptr<NativeWord> BindNativeWord(const WordBinding& binding,
                                           const std::string& module_name,
                                           std::string* error) {
  if (binding.name.empty()) {
    if (error) *error = "word binding has no name";
    return nullptr;
  }
  if (!binding.impl) {
    if (error) *error = "word binding '" + binding.name + "' has no implementation";
    return nullptr;
  }
  StackEffect effect;
  std::string effect_error;
  if (!ParseStackEffect(binding.stack_effect, &effect, &effect_error)) {
    if (error) *error = "word '" + binding.name + "': " + effect_error;
    return nullptr;
  }
  auto word = std::make_shared<NativeWord>(binding.name, module_name, effect.input_count,
                                           effect.has_options, binding.impl);
  word->SetDocumentation(binding.stack_effect, binding.description);
  return word;
}

bool MakeOptionsFromPairs(const ValueList& items, Value* out, std::string* error) {
  if (items.size() % 2 != 0) {
    if (error) *error = "options must have an even number of elements, got " +
                        std::to_string(items.size());
    return false;
  }
  FieldList fields;
  for (size_t i = 0; i < items.size(); i += 2) {
    if (items[i].kind != ValueKind::String) {
      if (error) *error = "option key at index " + std::to_string(i) + " must be a string, got " +
                          ToString(items[i].kind);
      return false;
    }
    fields.push_back(RecordField{items[i].text, items[i + 1]});
  }
  *out = MakeOptions(std::move(fields));
  return true;
}

} // namespace Forthic::Runtime
