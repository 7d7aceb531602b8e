// ProcessRuntime.hpp
// HostRuntime for a native process: raised errors, fatal signals and std::terminate
#pragma once

#include <NGIN/Primitives.hpp>

#include <Neha/Catchers/Export.hpp>
#include <Neha/Catchers/Exception.hpp>
#include <Neha/Catchers/RuntimeBridge.hpp>

#include <exception>
#include <source_location>
#include <string>
#include <vector>

namespace Neha::Catchers
{

  /**
   * Error hooks receive errors raised with TriggerError() and, when signal
   * hooking is enabled, SIGSEGV/SIGFPE/SIGILL/SIGABRT/SIGBUS reported as
   * Severity::Fatal. After a signal has been reported the default disposition
   * is restored and the signal raised again.
   *
   * Exception hooks receive exceptions passed to ReportUncaught() and, when
   * terminate hooking is enabled, the exception that caused std::terminate.
   * The previously installed terminate handler runs afterwards.
   *
   * Only one instance at a time owns the process hooks; setting the
   * NEHA_NOSIGHOOK environment variable disables signal hooking.
   */
  class NEHA_CATCHERS_API ProcessRuntime final : public HostRuntime
  {
  public:
    struct Options
    {
      SeverityMask reportingMask{MaskOf(Severity::All)};
      bool hookSignals{true};
      bool hookTerminate{true};
    };

    ProcessRuntime();
    explicit ProcessRuntime(Options options);
    ~ProcessRuntime() override;

    ProcessRuntime(const ProcessRuntime &) = delete;
    ProcessRuntime &operator=(const ProcessRuntime &) = delete;

    void PushErrorHook(ErrorHook hook) override;
    void PopErrorHook() override;
    void PushExceptionHook(ExceptionHook hook) override;
    void PopExceptionHook() override;

    [[nodiscard]] SeverityMask ReportingMask() const override { return m_options.reportingMask; }
    void SetReportingMask(SeverityMask mask) noexcept { m_options.reportingMask = mask; }

    // Raises an application error. Returns true when an error hook handled it;
    // otherwise the error is logged.
    bool TriggerError(Severity severity, std::string message, SourceSite where = std::source_location::current());

    void ReportUncaught(const Exception &exception);

    [[nodiscard]] NGIN::UIntSize ErrorHookDepth() const noexcept { return m_errorHooks.size(); }
    [[nodiscard]] NGIN::UIntSize ExceptionHookDepth() const noexcept { return m_exceptionHooks.size(); }
    [[nodiscard]] bool OwnsProcessHooks() const noexcept { return m_ownsProcessHooks; }

  private:
    static void OnFatalSignal(int signo);
    [[noreturn]] static void OnTerminate();

    void InstallProcessHooks();
    void UninstallProcessHooks();

    Options m_options;
    std::vector<ErrorHook> m_errorHooks;
    std::vector<ExceptionHook> m_exceptionHooks;
    std::terminate_handler m_previousTerminate{nullptr};
    bool m_ownsProcessHooks{false};
  };

} // namespace Neha::Catchers
