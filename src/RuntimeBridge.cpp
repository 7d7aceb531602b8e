#include <Neha/Catchers/RuntimeBridge.hpp>
#include <Neha/Catchers/Formatter.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace Neha::Catchers
{

  RuntimeBridge::RuntimeBridge(CatcherRegistry &registry, HostRuntime &host, std::ostream &out)
      : m_registry(registry), m_host(host), m_out(out)
  {
  }

  RuntimeBridge::~RuntimeBridge()
  {
    if (m_installed)
      Restore();
  }

  ExpectedVoid RuntimeBridge::RegisterGlobalHandlers()
  {
    if (m_installed)
      return std::unexpected(Error{ErrorCode::AlreadyInstalled, "runtime hooks already installed"});

    auto registered = m_registry.Register(RootExceptionName, [this](const Exception &exception) {
      m_out << Format(exception) << '\n';
    });
    if (!registered)
      return std::unexpected(registered.error());

    m_host.PushErrorHook([this](Severity severity, std::string_view message, std::string_view file, NGIN::UInt32 line) {
      return InterceptError(severity, message, file, line);
    });
    m_host.PushExceptionHook([this](const Exception &exception) { InterceptException(exception); });
    m_installed = true;
    spdlog::debug("runtime hooks installed");
    return {};
  }

  void RuntimeBridge::Restore()
  {
    if (!m_installed)
      return;
    m_host.PopErrorHook();
    m_host.PopExceptionHook();
    m_registry.Clear();
    m_installed = false;
    spdlog::debug("runtime hooks restored");
  }

  bool RuntimeBridge::InterceptError(Severity severity, std::string_view message, std::string_view file, NGIN::UInt32 line)
  {
    if ((m_host.ReportingMask() & MaskOf(severity)) == 0)
      return false;

    const RuntimeError error{std::string{message}, severity, SourceSite{std::string{file}, line}};
    auto result = m_registry.Handle(error);
    if (!result)
      spdlog::debug("{} error not dispatched: {}", SeverityName(severity), result.error().message);
    return true;
  }

  void RuntimeBridge::InterceptException(const Exception &exception)
  {
    auto result = m_registry.Handle(exception);
    if (!result)
      spdlog::debug("uncaught {} not dispatched: {}", exception.TypeName(), result.error().message);
  }

} // namespace Neha::Catchers
