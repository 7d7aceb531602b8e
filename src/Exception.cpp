#include <Neha/Catchers/Exception.hpp>

namespace Neha::Catchers
{

  TypeChain::TypeChain(std::initializer_list<std::string_view> ids)
  {
    m_ids.Reserve(ids.size() + 1);
    for (auto id : ids)
      Append(id);
  }

  TypeChain &TypeChain::Append(std::string_view id)
  {
    if (id.empty() || Contains(id))
      return *this;
    m_ids.PushBack(std::string{id});
    return *this;
  }

  bool TypeChain::Contains(std::string_view id) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_ids.Size(); ++i)
    {
      if (m_ids[i] == id)
        return true;
    }
    return false;
  }

  std::string_view TypeChain::At(NGIN::UIntSize i) const noexcept
  {
    if (i >= m_ids.Size())
      return {};
    return m_ids[i];
  }

  Exception::Exception(std::string message, std::optional<std::int64_t> code, SourceSite where)
      : Exception(TypeChain{}, std::move(message), code, std::move(where))
  {
  }

  Exception::Exception(TypeChain chain, std::string message, std::optional<std::int64_t> code, SourceSite where)
      : m_chain(std::move(chain.Append(RootExceptionName))),
        m_message(std::move(message)),
        m_code(code),
        m_where(std::move(where))
  {
  }

  std::string_view SeverityName(Severity s) noexcept
  {
    switch (s)
    {
      case Severity::Fatal: return "fatal";
      case Severity::Warning: return "warning";
      case Severity::Notice: return "notice";
      case Severity::Deprecated: return "deprecated";
      case Severity::User: return "user";
      case Severity::All: return "all";
    }
    return "unknown";
  }

  RuntimeError::RuntimeError(std::string message, Severity severity, SourceSite where)
      : Exception(TypeChain{DeclaredName}, std::move(message), static_cast<std::int64_t>(severity), std::move(where)),
        m_severity(severity)
  {
  }

} // namespace Neha::Catchers
