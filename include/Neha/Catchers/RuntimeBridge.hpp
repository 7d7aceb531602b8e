// RuntimeBridge.hpp
// Installs a CatcherRegistry as the host runtime's global error and uncaught-exception interceptor
#pragma once

#include <NGIN/Primitives.hpp>

#include <Neha/Catchers/Export.hpp>
#include <Neha/Catchers/CatcherRegistry.hpp>
#include <Neha/Catchers/Exception.hpp>
#include <Neha/Catchers/Types.hpp>

#include <functional>
#include <iostream>
#include <ostream>
#include <string_view>

namespace Neha::Catchers
{

  /**
   * Hook services of the runtime hosting the registry. Hooks form stacks: the
   * most recently pushed hook is active and popping it reactivates the previous
   * one.
   */
  class NEHA_CATCHERS_API HostRuntime
  {
  public:
    // Returns true when the error was handled and the host's default reporting
    // should be skipped.
    using ErrorHook = std::function<bool(Severity, std::string_view message, std::string_view file, NGIN::UInt32 line)>;
    using ExceptionHook = std::function<void(const Exception &)>;

    virtual ~HostRuntime() = default;

    virtual void PushErrorHook(ErrorHook hook) = 0;
    virtual void PopErrorHook() = 0;
    virtual void PushExceptionHook(ExceptionHook hook) = 0;
    virtual void PopExceptionHook() = 0;

    // Severities currently reported; errors outside the mask are ignored.
    [[nodiscard]] virtual SeverityMask ReportingMask() const = 0;
  };

  class NEHA_CATCHERS_API RuntimeBridge
  {
  public:
    RuntimeBridge(CatcherRegistry &registry, HostRuntime &host, std::ostream &out = std::cerr);
    ~RuntimeBridge();

    RuntimeBridge(const RuntimeBridge &) = delete;
    RuntimeBridge &operator=(const RuntimeBridge &) = delete;

    // Pushes the error and exception hooks and registers the default catch-all,
    // which writes Format(e) to the output stream. It can be overridden by
    // registering another catcher for RootExceptionName.
    [[nodiscard]] ExpectedVoid RegisterGlobalHandlers();

    // Pops both hooks and empties the registry.
    void Restore();

    [[nodiscard]] bool IsInstalled() const noexcept { return m_installed; }

    // Hook bodies. Errors outside the host's reporting mask are dropped and
    // reported as not handled.
    bool InterceptError(Severity severity, std::string_view message, std::string_view file, NGIN::UInt32 line);
    void InterceptException(const Exception &exception);

  private:
    CatcherRegistry &m_registry;
    HostRuntime &m_host;
    std::ostream &m_out;
    bool m_installed{false};
  };

} // namespace Neha::Catchers
