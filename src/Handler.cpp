#include <Neha/Catchers/Handler.hpp>

namespace Neha::Catchers
{

  ExpectedAny Handler::operator()(const Exception &exception) const
  {
    if (!m_invoker)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "handler must be a valid callback"});
    return m_invoker(exception);
  }

  std::string_view InferTargetType(const Handler &handler) noexcept
  {
    const auto declared = handler.DeclaredTarget();
    return declared.empty() ? RootExceptionName : declared;
  }

} // namespace Neha::Catchers
