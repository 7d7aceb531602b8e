// Types.hpp
// Public-facing error codes, result aliases and identifiers shared by the registry and bridge
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <string_view>
#include <expected>

namespace Neha::Catchers
{

  using Any = NGIN::Utilities::Any<>;
  using NameId = NGIN::UInt32;

  // Identifier of the root exception type; a catcher registered for it matches everything.
  inline constexpr std::string_view RootExceptionName = "Exception";

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    AlreadyInstalled = 3,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
  };

  using ExpectedVoid = std::expected<void, Error>;
  using ExpectedAny = std::expected<Any, Error>;

} // namespace Neha::Catchers
