#ifndef FORTHIC_WORD_BINDING_H
#define FORTHIC_WORD_BINDING_H

#include <memory>
#include <string>

#include "word.h"

namespace Forthic::Runtime {

struct StackEffect {
  size_t input_count = 0;
  bool has_options = false;
};

// "( a:int b:int [options:WordOptions] -- sum:int )"
bool ParseStackEffect(const std::string& text, StackEffect* out, std::string* error);

struct WordBinding {
  std::string name;
  std::string stack_effect;
  std::string description;
  NativeWordFn impl;
};

// The stack effect is parsed once here, never at dispatch.
std::shared_ptr<NativeWord> BindNativeWord(const WordBinding& binding,
                                           const std::string& module_name,
                                           std::string* error);

// Builds an Options value from alternating key/value items.
bool MakeOptionsFromPairs(const ValueList& items, Value* out, std::string* error);

} // namespace Forthic::Runtime

#endif // FORTHIC_WORD_BINDING_H
