#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "bridge_server.h"
#include "errors.h"
#include "interpreter.h"
#include "module_loader.h"
#include "remote_module.h"

namespace {

bool ReadFileText(const std::string& path, std::string* out, std::string* error) {
  if (!out) return false;
  std::ifstream in(path);
  if (!in) {
    if (error) *error = "failed to open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return true;
}

std::string BaseName(const char* argv0) {
  if (!argv0 || !*argv0) return "forthic";
  std::string name = argv0;
  const size_t slash = name.find_last_of("/\\");
  if (slash != std::string::npos) name = name.substr(slash + 1);
  if (name.empty()) return "forthic";
  return name;
}

void PrintError(const std::string& message) {
  std::cerr << "error: " << message << "\n";
}

void PrintUsage(const std::string& tool_name) {
  std::cerr << "usage:\n"
            << "  " << tool_name
            << " run <file.forthic> [--modules-config <file>] [--timezone <zone>]\n"
            << "  " << tool_name
            << " serve [--host <host>] [--port <port>] [--modules-config <file>]\n"
            << "  " << tool_name << " modules [--modules-config <file>]\n";
}

struct CliOptions {
  std::string path;
  std::string host = "0.0.0.0";
  int port = 50051;
  std::string modules_config;
  std::string timezone;
};

bool ParsePort(const std::string& text, int* out) {
  if (text.empty()) return false;
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (*end != '\0' || value < 0 || value > 65535) return false;
  *out = static_cast<int>(value);
  return true;
}

bool ParseArgs(int argc, char** argv, CliOptions* out, std::string* error) {
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--host" || arg == "--port" || arg == "--modules-config" || arg == "--timezone") {
      if (!has_value) {
        if (error) *error = arg + " expects a value";
        return false;
      }
      const std::string value = argv[++i];
      if (arg == "--host") {
        out->host = value;
      } else if (arg == "--port") {
        if (!ParsePort(value, &out->port)) {
          if (error) *error = "invalid port: " + value;
          return false;
        }
      } else if (arg == "--timezone") {
        out->timezone = value;
      } else {
        out->modules_config = value;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      if (error) *error = "unknown option: " + arg;
      return false;
    } else if (out->path.empty()) {
      out->path = arg;
    } else {
      if (error) *error = "unexpected argument: " + arg;
      return false;
    }
  }
  if (out->modules_config.empty()) {
    if (const char* env = std::getenv(Forthic::Modules::kModulesConfigEnv)) {
      out->modules_config = env;
    }
  }
  return true;
}

bool BuildRegistry(const CliOptions& options,
                   std::shared_ptr<Forthic::Runtime::ModuleRegistry>* out) {
  Forthic::Modules::ModuleFactoryRegistry factories = Forthic::Modules::BuiltinFactories();
  Forthic::Bridge::AddRemoteFactories(&factories);
  std::string error;
  if (!Forthic::Modules::BuildRegistry(options.modules_config, factories, out, &error)) {
    PrintError(error);
    return false;
  }
  return true;
}

int RunFile(const CliOptions& options) {
  std::string source;
  std::string error;
  if (!ReadFileText(options.path, &source, &error)) {
    PrintError(error);
    return 1;
  }
  std::shared_ptr<Forthic::Runtime::ModuleRegistry> registry;
  if (!BuildRegistry(options, &registry)) return 1;

  Forthic::Runtime::Interpreter interp(registry);
  if (!options.timezone.empty()) interp.SetTimezone(options.timezone);
  if (!interp.UseAllRegisteredModules()) {
    std::cerr << Forthic::Runtime::FormatError(interp.Error()) << "\n";
    return 1;
  }
  Forthic::Lang::CodeLocation reference;
  reference.source = options.path;
  if (!interp.Run(source, reference)) {
    std::cerr << Forthic::Runtime::FormatError(interp.Error()) << "\n";
    return 1;
  }
  const Forthic::Runtime::ValueList& stack = interp.Stack();
  for (size_t i = 0; i < stack.size(); ++i) {
    std::cout << "[" << i << "] " << Forthic::Runtime::ToJson(stack[i]) << "\n";
  }
  return 0;
}

int ListModules(const CliOptions& options) {
  std::shared_ptr<Forthic::Runtime::ModuleRegistry> registry;
  if (!BuildRegistry(options, &registry)) return 1;
  for (const auto& module : registry->Modules()) {
    std::cout << module->Name() << " (" << module->WordCount() << " words)";
    if (!module->Description().empty()) std::cout << ": " << module->Description();
    std::cout << "\n";
  }
  return 0;
}

int Serve(const CliOptions& options) {
  std::shared_ptr<Forthic::Runtime::ModuleRegistry> registry;
  if (!BuildRegistry(options, &registry)) return 1;
  Forthic::Bridge::ServerOptions server;
  server.host = options.host;
  server.port = options.port;
  return Forthic::Bridge::RunServer(server, registry);
}

} // namespace

int main(int argc, char** argv) {
  const std::string tool_name = BaseName(argv[0]);
  if (argc < 2) {
    PrintUsage(tool_name);
    return 1;
  }

  const std::string cmd = argv[1];
  CliOptions options;
  std::string error;
  if (!ParseArgs(argc, argv, &options, &error)) {
    PrintError(error);
    return 1;
  }

  if (cmd == "run") {
    if (options.path.empty()) {
      PrintError("missing input file");
      return 1;
    }
    return RunFile(options);
  }
  if (cmd == "serve") return Serve(options);
  if (cmd == "modules") return ListModules(options);

  PrintUsage(tool_name);
  return 1;
}
