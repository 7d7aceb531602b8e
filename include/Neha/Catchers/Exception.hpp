// Exception.hpp
// Root exception value carrying a declared type ancestry, plus helpers to derive typed exceptions
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <Neha/Catchers/Export.hpp>
#include <Neha/Catchers/Types.hpp>

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace Neha::Catchers
{

  // Type identifiers of an exception, most specific first. Once an exception is
  // constructed the last element is always RootExceptionName.
  class NEHA_CATCHERS_API TypeChain
  {
  public:
    TypeChain() = default;
    TypeChain(std::initializer_list<std::string_view> ids);

    // Appends an identifier unless it is empty or already present.
    TypeChain &Append(std::string_view id);

    [[nodiscard]] bool Contains(std::string_view id) const noexcept;
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_ids.Size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_ids.Size() == 0; }
    [[nodiscard]] std::string_view At(NGIN::UIntSize i) const noexcept;
    [[nodiscard]] std::string_view MostSpecific() const noexcept { return At(0); }

  private:
    NGIN::Containers::Vector<std::string> m_ids;
  };

  struct SourceSite
  {
    std::string file{};
    NGIN::UInt32 line{0};

    SourceSite() = default;
    SourceSite(std::string f, NGIN::UInt32 l) : file(std::move(f)), line(l) {}
    SourceSite(const std::source_location &loc)
        : file(loc.file_name()), line(static_cast<NGIN::UInt32>(loc.line()))
    {
    }
  };

  class NEHA_CATCHERS_API Exception : public std::exception
  {
  public:
    static constexpr std::string_view DeclaredName = RootExceptionName;

    explicit Exception(std::string message,
                       std::optional<std::int64_t> code = std::nullopt,
                       SourceSite where = std::source_location::current());

    // For exception types that only exist at runtime: the chain is taken as given
    // and completed with the root identifier.
    Exception(TypeChain chain,
              std::string message,
              std::optional<std::int64_t> code = std::nullopt,
              SourceSite where = std::source_location::current());

    Exception(const Exception &) = default;
    Exception(Exception &&) = default;
    Exception &operator=(const Exception &) = delete;
    Exception &operator=(Exception &&) = delete;
    ~Exception() override = default;

    [[nodiscard]] const char *what() const noexcept override { return m_message.c_str(); }

    [[nodiscard]] std::string_view TypeName() const noexcept { return m_chain.MostSpecific(); }
    [[nodiscard]] const TypeChain &Ancestry() const noexcept { return m_chain; }
    [[nodiscard]] bool IsA(std::string_view target) const noexcept { return m_chain.Contains(target); }

    [[nodiscard]] std::string_view Message() const noexcept { return m_message; }
    [[nodiscard]] std::string_view File() const noexcept { return m_where.file; }
    [[nodiscard]] NGIN::UInt32 Line() const noexcept { return m_where.line; }
    [[nodiscard]] std::optional<std::int64_t> Code() const noexcept { return m_code; }

  private:
    TypeChain m_chain;
    std::string m_message;
    std::optional<std::int64_t> m_code;
    SourceSite m_where;
  };

  namespace detail
  {
    template <class T>
    concept HasParentException = requires { typename T::ParentException; };
  } // namespace detail

  // Identifier of a C++ exception type. A type names itself through a
  // `static constexpr std::string_view DeclaredName` member; otherwise its
  // qualified C++ name is used.
  template <class T>
  constexpr std::string_view ExceptionTypeNameOf() noexcept
  {
    using U = std::remove_cvref_t<T>;
    static_assert(std::is_base_of_v<Exception, U>, "exception types must derive from Neha::Catchers::Exception");
    if constexpr (std::is_same_v<U, Exception>)
    {
      return RootExceptionName;
    }
    else if constexpr (detail::HasParentException<U>)
    {
      // An inherited DeclaredName belongs to the parent, not to U.
      if (U::DeclaredName != U::ParentException::DeclaredName)
        return U::DeclaredName;
      return NGIN::Meta::TypeName<U>::qualifiedName;
    }
    else
    {
      return U::DeclaredName;
    }
  }

  /**
   * Base for typed exceptions. Each level of the hierarchy adds its own identifier
   * to the type chain, so the chain mirrors the C++ inheritance:
   *
   *   class IoFault : public DeriveException<IoFault> { using DeriveException::DeriveException; };
   *   class DiskFull : public DeriveException<DiskFull, IoFault> { using DeriveException::DeriveException; };
   *
   * A DiskFull carries the chain [DiskFull, IoFault, Exception].
   */
  template <class Self, class Parent = Exception>
  class DeriveException : public Parent
  {
  public:
    using ParentException = Parent;

    explicit DeriveException(std::string message,
                             std::optional<std::int64_t> code = std::nullopt,
                             SourceSite where = std::source_location::current())
        : DeriveException(TypeChain{}, std::move(message), code, std::move(where))
    {
    }

  protected:
    DeriveException(TypeChain chain,
                    std::string message,
                    std::optional<std::int64_t> code,
                    SourceSite where)
        : Parent(std::move(chain.Append(ExceptionTypeNameOf<Self>())), std::move(message), code, std::move(where))
    {
    }
  };

  enum class Severity : NGIN::UInt32
  {
    Fatal = 1u << 0,
    Warning = 1u << 1,
    Notice = 1u << 2,
    Deprecated = 1u << 3,
    User = 1u << 4,
    All = (1u << 5) - 1u,
  };

  using SeverityMask = NGIN::UInt32;

  constexpr SeverityMask MaskOf(Severity s) noexcept { return static_cast<SeverityMask>(s); }

  [[nodiscard]] NEHA_CATCHERS_API std::string_view SeverityName(Severity s) noexcept;

  // Uniform representation of a raw runtime error (severity, message, location).
  class NEHA_CATCHERS_API RuntimeError final : public Exception
  {
  public:
    static constexpr std::string_view DeclaredName = "RuntimeError";
    using ParentException = Exception;

    RuntimeError(std::string message, Severity severity, SourceSite where = std::source_location::current());

    [[nodiscard]] Severity GetSeverity() const noexcept { return m_severity; }

  private:
    Severity m_severity;
  };

  // A std::exception (or unknown object) recovered from an uncaught throw.
  class NEHA_CATCHERS_API NativeException final : public DeriveException<NativeException>
  {
  public:
    static constexpr std::string_view DeclaredName = "NativeException";
    using DeriveException::DeriveException;
  };

} // namespace Neha::Catchers
