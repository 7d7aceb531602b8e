#include <Neha/Catchers/CatcherRegistry.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace Neha::Catchers
{

  namespace
  {
    constexpr std::string_view kMissingTarget = "target must name an exception type";
    constexpr std::string_view kNotCallable = "handler must be a valid callback";
    constexpr std::string_view kNoCatcher = "no catcher matches the exception type";
  } // namespace

  ExpectedVoid CatcherRegistry::Register(std::string_view target, Handler handler)
  {
    if (target.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kMissingTarget});
    if (!handler.IsCallable())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kNotCallable});

    const auto id = m_names.InsertOrGet(target);
    if (id == StringInterner::INVALID_ID)
      return std::unexpected(Error{ErrorCode::InvalidArgument, kMissingTarget});
    const auto nameId = static_cast<NameId>(id);

    if (auto *existing = m_index.GetPtr(nameId))
    {
      m_entries[*existing].handler = std::move(handler);
      spdlog::debug("replaced catcher for '{}' at position {}", target, *existing);
      return {};
    }

    Entry entry{};
    entry.target = m_names.View(id);
    entry.handler = std::move(handler);
    const auto idx = static_cast<NGIN::UInt32>(m_entries.Size());
    m_entries.PushBack(std::move(entry));
    m_index.Insert(nameId, idx);
    spdlog::debug("registered catcher for '{}' at position {}", target, idx);
    return {};
  }

  ExpectedVoid CatcherRegistry::Register(Handler handler)
  {
    if (!handler.IsCallable())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kNotCallable});
    // Owned copy: the view points into the handler, which is moved below.
    const std::string target{InferTargetType(handler)};
    return Register(target, std::move(handler));
  }

  ExpectedAny CatcherRegistry::Handle(const Exception &exception) const
  {
    for (auto i = m_entries.Size(); i > 0; --i)
    {
      const auto &entry = m_entries[i - 1];
      if (!exception.IsA(entry.target))
        continue;
      spdlog::trace("dispatching {} to catcher for '{}'", exception.TypeName(), entry.target);
      // The handler may register or clear catchers while it runs.
      const Handler handler = entry.handler;
      return handler(exception);
    }
    spdlog::warn("{} \"{}\" was not claimed by any catcher", exception.TypeName(), exception.Message());
    return std::unexpected(Error{ErrorCode::NotFound, kNoCatcher});
  }

  bool CatcherRegistry::Contains(std::string_view target) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_entries.Size(); ++i)
    {
      if (m_entries[i].target == target)
        return true;
    }
    return false;
  }

  NGIN::Containers::Vector<std::string_view> CatcherRegistry::Targets() const
  {
    NGIN::Containers::Vector<std::string_view> out;
    out.Reserve(m_entries.Size());
    for (auto i = m_entries.Size(); i > 0; --i)
      out.PushBack(m_entries[i - 1].target);
    return out;
  }

  void CatcherRegistry::Clear()
  {
    m_entries = NGIN::Containers::Vector<Entry>{};
    m_index = NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32>{};
    spdlog::debug("catcher registry cleared");
  }

  static CatcherRegistry g_catchers{};

  CatcherRegistry &GetCatcherRegistry() noexcept { return g_catchers; }

} // namespace Neha::Catchers
