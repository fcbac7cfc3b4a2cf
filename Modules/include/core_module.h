#ifndef FORTHIC_CORE_MODULE_H
#define FORTHIC_CORE_MODULE_H

#include <memory>
#include <string>

#include "module.h"

namespace Forthic::Modules {

inline constexpr const char* kCoreModuleName = "core";

// Stack words, variables, module import/export, options, profiling,
// interpolation, printing and TRY.
bool CreateCoreModule(std::shared_ptr<Runtime::Module>* out, std::string* error);

} // namespace Forthic::Modules

#endif // FORTHIC_CORE_MODULE_H
