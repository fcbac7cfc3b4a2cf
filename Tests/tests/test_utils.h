#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "errors.h"
#include "interpreter.h"
#include "module.h"
#include "value.h"

namespace Forthic::Tests {

struct TestCase {
  const char* name;
  bool (*fn)();
};

struct TestSection {
  const char* name;
  const TestCase* tests;
  size_t count;
};

struct TestResult {
  size_t total = 0;
  size_t failed = 0;
};

void SetEnvVar(const std::string& name, const std::string& value);
void UnsetEnvVar(const std::string& name);
std::string TempPath(const std::string& name);
bool WriteFileText(const std::string& path, const std::string& text);

// Registry holding only the core module.
std::shared_ptr<Runtime::ModuleRegistry> MakeCoreRegistry();

bool ExpectInt(const Runtime::Value& value, int64_t expected);
bool ExpectString(const Runtime::Value& value, const std::string& expected);
// Compares the whole stack, bottom first, by JSON rendering.
bool ExpectStackJson(const Runtime::Interpreter& interp, const std::vector<std::string>& expected);

// Runs src on a fresh interpreter with core imported.
bool RunExpectStack(const std::string& src, const std::vector<std::string>& expected);
bool RunExpectError(const std::string& src, Runtime::ErrorKind expected);

TestResult RunSection(const TestSection& section);
TestResult RunAllSections(const TestSection* sections, size_t count);

} // namespace Forthic::Tests
