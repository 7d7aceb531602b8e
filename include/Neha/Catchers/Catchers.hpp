#pragma once

#include <string_view>

#include <Neha/Catchers/Export.hpp>
#include <Neha/Catchers/Types.hpp>
#include <Neha/Catchers/Exception.hpp>
#include <Neha/Catchers/Handler.hpp>
#include <Neha/Catchers/CatcherRegistry.hpp>
#include <Neha/Catchers/Formatter.hpp>
#include <Neha/Catchers/RuntimeBridge.hpp>
#include <Neha/Catchers/ProcessRuntime.hpp>

namespace Neha::Catchers
{

    // For quick sanity checks / examples.
    [[nodiscard]] NEHA_CATCHERS_API constexpr std::string_view LibraryName() noexcept { return "Neha.Catchers"; }

} // namespace Neha::Catchers
