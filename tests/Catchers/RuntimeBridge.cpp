// RuntimeBridge.cpp - tests for installing the registry as the host's interceptor

#include <catch2/catch_test_macros.hpp>

#include <Neha/Catchers/Catchers.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace BridgeDemo
{
  using namespace Neha::Catchers;

  // Records hook stacks; the bottom entries stand in for hooks the host had before.
  class FakeRuntime final : public HostRuntime
  {
  public:
    void PushErrorHook(ErrorHook hook) override { errorHooks.push_back(std::move(hook)); }
    void PopErrorHook() override { errorHooks.pop_back(); }
    void PushExceptionHook(ExceptionHook hook) override { exceptionHooks.push_back(std::move(hook)); }
    void PopExceptionHook() override { exceptionHooks.pop_back(); }
    SeverityMask ReportingMask() const override { return mask; }

    bool RaiseError(Severity severity, std::string_view message, std::string_view file, NGIN::UInt32 line)
    {
      return errorHooks.back()(severity, message, file, line);
    }
    void RaiseUncaught(const Exception &e) { exceptionHooks.back()(e); }

    std::vector<ErrorHook> errorHooks;
    std::vector<ExceptionHook> exceptionHooks;
    SeverityMask mask{MaskOf(Severity::All)};
  };

  class QuotaFault : public DeriveException<QuotaFault>
  {
  public:
    static constexpr std::string_view DeclaredName = "QuotaFault";
    using DeriveException::DeriveException;
  };
} // namespace BridgeDemo

TEST_CASE("RegisterGlobalHandlersInstallsHooksAndDefaultCatcher", "[catchers][RuntimeBridge]")
{
  using namespace Neha::Catchers;
  using BridgeDemo::FakeRuntime;

  CatcherRegistry registry;
  FakeRuntime host;
  std::ostringstream out;
  RuntimeBridge bridge{registry, host, out};

  REQUIRE(bridge.RegisterGlobalHandlers().has_value());
  CHECK(bridge.IsInstalled());
  CHECK(host.errorHooks.size() == 1);
  CHECK(host.exceptionHooks.size() == 1);
  CHECK(registry.Contains(RootExceptionName));

  host.RaiseUncaught(BridgeDemo::QuotaFault{"over quota", std::nullopt, SourceSite{"quota.x", 9}});
  CHECK(out.str() == "Uncaught exception QuotaFault: \"over quota\" [File quota.x | Line 9]\n");
}

TEST_CASE("ReportedErrorsArriveAsRuntimeError", "[catchers][RuntimeBridge]")
{
  using namespace Neha::Catchers;
  using BridgeDemo::FakeRuntime;

  CatcherRegistry registry;
  FakeRuntime host;
  std::ostringstream out;
  RuntimeBridge bridge{registry, host, out};
  REQUIRE(bridge.RegisterGlobalHandlers().has_value());

  std::string message;
  std::string file;
  NGIN::UInt32 line = 0;
  Severity severity = Severity::All;
  REQUIRE(registry.Register([&](const RuntimeError &e) {
    message = std::string{e.Message()};
    file = std::string{e.File()};
    line = e.Line();
    severity = e.GetSeverity();
  }));

  CHECK(host.RaiseError(Severity::Warning, "division by zero", "calc.x", 12));
  CHECK(message == "division by zero");
  CHECK(file == "calc.x");
  CHECK(line == 12);
  CHECK(severity == Severity::Warning);
  CHECK(out.str().empty());
}

TEST_CASE("ErrorsOutsideReportingMaskAreDropped", "[catchers][RuntimeBridge]")
{
  using namespace Neha::Catchers;
  using BridgeDemo::FakeRuntime;

  CatcherRegistry registry;
  FakeRuntime host;
  host.mask = MaskOf(Severity::Fatal) | MaskOf(Severity::Warning);
  std::ostringstream out;
  RuntimeBridge bridge{registry, host, out};
  REQUIRE(bridge.RegisterGlobalHandlers().has_value());

  int calls = 0;
  REQUIRE(registry.Register("RuntimeError", [&] { ++calls; }));

  CHECK_FALSE(host.RaiseError(Severity::Notice, "ignored", "a.x", 1));
  CHECK(calls == 0);
  CHECK(host.RaiseError(Severity::Fatal, "reported", "a.x", 2));
  CHECK(calls == 1);
}

TEST_CASE("RestoreUninstallsHooksAndClearsRegistry", "[catchers][RuntimeBridge]")
{
  using namespace Neha::Catchers;
  using BridgeDemo::FakeRuntime;

  CatcherRegistry registry;
  FakeRuntime host;
  int previousErrors = 0;
  host.PushErrorHook([&](Severity, std::string_view, std::string_view, NGIN::UInt32) {
    ++previousErrors;
    return false;
  });
  host.PushExceptionHook([](const Exception &) {});

  std::ostringstream out;
  RuntimeBridge bridge{registry, host, out};
  REQUIRE(bridge.RegisterGlobalHandlers().has_value());
  REQUIRE(registry.Register("QuotaFault", [] {}));
  CHECK(host.errorHooks.size() == 2);

  bridge.Restore();
  CHECK_FALSE(bridge.IsInstalled());
  CHECK(registry.Empty());
  CHECK(host.errorHooks.size() == 1);
  CHECK(host.exceptionHooks.size() == 1);

  auto out2 = registry.Handle(BridgeDemo::QuotaFault{"over quota"});
  REQUIRE_FALSE(out2.has_value());
  CHECK(out2.error().code == ErrorCode::NotFound);

  // The host's previous hook is active again.
  CHECK_FALSE(host.RaiseError(Severity::Warning, "w", "a.x", 1));
  CHECK(previousErrors == 1);
  CHECK(out.str().empty());
}

TEST_CASE("SecondInstallIsRejected", "[catchers][RuntimeBridge]")
{
  using namespace Neha::Catchers;
  using BridgeDemo::FakeRuntime;

  CatcherRegistry registry;
  FakeRuntime host;
  std::ostringstream out;
  RuntimeBridge bridge{registry, host, out};
  REQUIRE(bridge.RegisterGlobalHandlers().has_value());

  auto again = bridge.RegisterGlobalHandlers();
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error().code == ErrorCode::AlreadyInstalled);
  CHECK(host.errorHooks.size() == 1);
}

TEST_CASE("DefaultCatcherCanBeReplaced", "[catchers][RuntimeBridge]")
{
  using namespace Neha::Catchers;
  using BridgeDemo::FakeRuntime;

  CatcherRegistry registry;
  FakeRuntime host;
  std::ostringstream out;
  RuntimeBridge bridge{registry, host, out};
  REQUIRE(bridge.RegisterGlobalHandlers().has_value());

  std::string custom;
  REQUIRE(registry.Register([&](const Exception &e) { custom = std::string{e.Message()}; }));
  CHECK(registry.Size() == 1);

  host.RaiseUncaught(Exception{"custom presentation"});
  CHECK(custom == "custom presentation");
  CHECK(out.str().empty());
}

TEST_CASE("DestructorRestoresHooks", "[catchers][RuntimeBridge]")
{
  using namespace Neha::Catchers;
  using BridgeDemo::FakeRuntime;

  CatcherRegistry registry;
  FakeRuntime host;
  {
    std::ostringstream out;
    RuntimeBridge bridge{registry, host, out};
    REQUIRE(bridge.RegisterGlobalHandlers().has_value());
  }
  CHECK(host.errorHooks.empty());
  CHECK(host.exceptionHooks.empty());
  CHECK(registry.Empty());
}
