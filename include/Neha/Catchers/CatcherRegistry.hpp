// CatcherRegistry.hpp
// Ordered registry of catchers and dispatch of exceptions by type ancestry
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <Neha/Catchers/Export.hpp>
#include <Neha/Catchers/Exception.hpp>
#include <Neha/Catchers/Handler.hpp>
#include <Neha/Catchers/Types.hpp>

#include <string_view>
#include <type_traits>
#include <utility>

namespace Neha::Catchers
{

  /**
   * Maps exception type identifiers to handlers, keeping the order in which
   * each identifier was first registered. Handle() walks that order backwards
   * and runs the first handler whose target is in the exception's type chain,
   * so among matching catchers the most recently inserted one wins regardless
   * of how close its type is to the exception's.
   *
   * Not synchronized. Use one registry per thread or lock around it.
   */
  class NEHA_CATCHERS_API CatcherRegistry
  {
  public:
    CatcherRegistry() = default;
    CatcherRegistry(const CatcherRegistry &) = delete;
    CatcherRegistry &operator=(const CatcherRegistry &) = delete;

    // Registers `handler` for `target`. An existing entry for `target` gets the
    // new handler but keeps its place in dispatch order.
    [[nodiscard]] ExpectedVoid Register(std::string_view target, Handler handler);

    // Registers `handler` for the type it declares, or for RootExceptionName.
    [[nodiscard]] ExpectedVoid Register(Handler handler);

    template <class F>
      requires(!std::is_convertible_v<F, std::string_view> && !std::is_same_v<std::remove_cvref_t<F>, Handler>)
    [[nodiscard]] ExpectedVoid Register(F &&fn)
    {
      return Register(Handler::From(std::forward<F>(fn)));
    }

    template <class F>
      requires(!std::is_same_v<std::remove_cvref_t<F>, Handler>)
    [[nodiscard]] ExpectedVoid Register(std::string_view target, F &&fn)
    {
      return Register(target, Handler::From(std::forward<F>(fn)));
    }

    // Dispatches to the matching catcher and returns its result (an empty Any
    // for handlers that return nothing). NotFound when no catcher matches.
    // Exceptions thrown by the handler propagate to the caller.
    [[nodiscard]] ExpectedAny Handle(const Exception &exception) const;

    [[nodiscard]] bool Contains(std::string_view target) const noexcept;
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_entries.Size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_entries.Size() == 0; }

    // Targets in dispatch order (most recently inserted first).
    [[nodiscard]] NGIN::Containers::Vector<std::string_view> Targets() const;

    // Drops every catcher. Interned target names are kept, so a target
    // registered again after Clear() reuses its id.
    void Clear();

  private:
    struct Entry
    {
      std::string_view target{};
      Handler handler{};
    };

    using StringInterner = NGIN::Utilities::StringInterner<>;

    NGIN::Containers::Vector<Entry> m_entries;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> m_index;
    StringInterner m_names;
  };

  // Process-wide registry used by applications that do not manage their own.
  [[nodiscard]] NEHA_CATCHERS_API CatcherRegistry &GetCatcherRegistry() noexcept;

} // namespace Neha::Catchers
