#include <Neha/Catchers/ProcessRuntime.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace Neha::Catchers
{

  namespace
  {
    using SignalHandler = void (*)(int);

    constexpr std::array kFatalSignals{
        SIGSEGV,
        SIGFPE,
        SIGILL,
        SIGABRT,
#ifdef SIGBUS
        SIGBUS,
#endif
    };

    ProcessRuntime *g_active = nullptr;
    bool g_signalsHooked = false;
    std::array<SignalHandler, kFatalSignals.size()> g_previousSignals{};

    const char *SignalName(int signo)
    {
#ifdef __linux__
      return strsignal(signo);
#else
      if (signo == SIGSEGV) return "SIGSEGV";
      if (signo == SIGFPE) return "SIGFPE";
      if (signo == SIGILL) return "SIGILL";
      if (signo == SIGABRT) return "SIGABRT";
      return "SIG-unknown";
#endif
    }
  } // namespace

  ProcessRuntime::ProcessRuntime() : ProcessRuntime(Options{}) {}

  ProcessRuntime::ProcessRuntime(Options options) : m_options(options)
  {
    InstallProcessHooks();
  }

  ProcessRuntime::~ProcessRuntime()
  {
    UninstallProcessHooks();
  }

  void ProcessRuntime::PushErrorHook(ErrorHook hook)
  {
    m_errorHooks.push_back(std::move(hook));
  }

  void ProcessRuntime::PopErrorHook()
  {
    if (m_errorHooks.empty())
    {
      spdlog::warn("PopErrorHook called with no error hook installed");
      return;
    }
    m_errorHooks.pop_back();
  }

  void ProcessRuntime::PushExceptionHook(ExceptionHook hook)
  {
    m_exceptionHooks.push_back(std::move(hook));
  }

  void ProcessRuntime::PopExceptionHook()
  {
    if (m_exceptionHooks.empty())
    {
      spdlog::warn("PopExceptionHook called with no exception hook installed");
      return;
    }
    m_exceptionHooks.pop_back();
  }

  bool ProcessRuntime::TriggerError(Severity severity, std::string message, SourceSite where)
  {
    if (!m_errorHooks.empty())
    {
      // Copied: the hook may push or pop hooks.
      const auto hook = m_errorHooks.back();
      if (hook(severity, message, where.file, where.line))
        return true;
    }
    spdlog::warn("{}: {} in {} on line {}", SeverityName(severity), message, where.file, where.line);
    return false;
  }

  void ProcessRuntime::ReportUncaught(const Exception &exception)
  {
    if (m_exceptionHooks.empty())
    {
      spdlog::error("uncaught {}: {} in {} on line {}", exception.TypeName(), exception.Message(), exception.File(),
                    exception.Line());
      return;
    }
    const auto hook = m_exceptionHooks.back();
    hook(exception);
  }

  void ProcessRuntime::InstallProcessHooks()
  {
    if (!m_options.hookSignals && !m_options.hookTerminate)
      return;
    if (g_active)
    {
      spdlog::warn("process hooks are owned by another ProcessRuntime; not installing");
      return;
    }
    g_active = this;
    m_ownsProcessHooks = true;

    if (m_options.hookTerminate)
      m_previousTerminate = std::set_terminate(&ProcessRuntime::OnTerminate);

    if (m_options.hookSignals)
    {
      if (std::getenv("NEHA_NOSIGHOOK"))
      {
        spdlog::info("NEHA_NOSIGHOOK set; fatal signals are not hooked");
      }
      else
      {
        for (std::size_t i = 0; i < kFatalSignals.size(); ++i)
          g_previousSignals[i] = std::signal(kFatalSignals[i], &ProcessRuntime::OnFatalSignal);
        g_signalsHooked = true;
      }
    }
  }

  void ProcessRuntime::UninstallProcessHooks()
  {
    if (!m_ownsProcessHooks)
      return;
    if (g_signalsHooked)
    {
      for (std::size_t i = 0; i < kFatalSignals.size(); ++i)
        std::signal(kFatalSignals[i], g_previousSignals[i] == SIG_ERR ? SIG_DFL : g_previousSignals[i]);
      g_signalsHooked = false;
    }
    if (m_options.hookTerminate)
      std::set_terminate(m_previousTerminate);
    g_active = nullptr;
    m_ownsProcessHooks = false;
  }

  void ProcessRuntime::OnFatalSignal(int signo)
  {
    if (g_active)
      g_active->TriggerError(Severity::Fatal, SignalName(signo), SourceSite{"<signal>", 0});
    else
      spdlog::error("received signal {}: {}", signo, SignalName(signo));
    std::signal(signo, SIG_DFL);
    std::raise(signo);
  }

  void ProcessRuntime::OnTerminate()
  {
    static bool reporting = false;
    std::terminate_handler next = nullptr;
    if (g_active && !reporting)
    {
      reporting = true;
      next = g_active->m_previousTerminate;
      // std::abort below must not be reported a second time as a fatal signal.
      std::signal(SIGABRT, SIG_DFL);
      if (auto pending = std::current_exception())
      {
        try
        {
          std::rethrow_exception(pending);
        }
        catch (const Exception &e)
        {
          g_active->ReportUncaught(e);
        }
        catch (const std::exception &e)
        {
          g_active->ReportUncaught(NativeException{e.what()});
        }
        catch (...)
        {
          g_active->ReportUncaught(NativeException{"exception of unknown type"});
        }
      }
    }
    if (next)
      next();
    std::abort();
  }

} // namespace Neha::Catchers
