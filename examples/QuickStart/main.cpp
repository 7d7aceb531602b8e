#include <Neha/Catchers/Catchers.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <iostream>

namespace Demo {
  class DatabaseFault : public Neha::Catchers::DeriveException<DatabaseFault> {
  public:
    static constexpr std::string_view DeclaredName = "DatabaseFault";
    using DeriveException::DeriveException;
  };

  class QueryTimeout : public Neha::Catchers::DeriveException<QueryTimeout, DatabaseFault> {
  public:
    static constexpr std::string_view DeclaredName = "QueryTimeout";
    using DeriveException::DeriveException;
  };
}

int main() {
  using namespace Neha::Catchers;

  // SPDLOG_LEVEL=debug shows registration and dispatch traces.
  spdlog::cfg::load_env_levels();

  std::cout << "Library: " << LibraryName() << "\n";

  auto &catchers = GetCatcherRegistry();
  ProcessRuntime runtime;
  RuntimeBridge bridge{catchers, runtime, std::cout};
  if (auto installed = bridge.RegisterGlobalHandlers(); !installed) {
    std::cerr << "install failed: " << installed.error().message << "\n";
    return 1;
  }

  // Target inferred from the parameter type.
  auto registered = catchers.Register([](const Demo::DatabaseFault &e) {
    std::cout << "Error with the db: " << e.Message() << "\n";
  });
  if (!registered) {
    std::cerr << "register failed: " << registered.error().message << "\n";
    return 1;
  }

  if (auto handled = catchers.Handle(Demo::QueryTimeout{"query took longer than 30s"}); !handled) {
    std::cerr << "dispatch failed: " << handled.error().message << "\n";
  }

  // Raised runtime errors arrive as RuntimeError; the default catcher prints them.
  runtime.TriggerError(Severity::Warning, "configuration file missing, using defaults");

  // Uncaught exceptions reach the same registry.
  runtime.ReportUncaught(Exception{"shutting down"});

  bridge.Restore();
  std::cout << "Catchers after restore: " << catchers.Size() << "\n";
  return 0;
}
