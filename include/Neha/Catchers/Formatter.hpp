// Formatter.hpp
// Diagnostic text for an exception, used by the default catch-all catcher
#pragma once

#include <Neha/Catchers/Export.hpp>
#include <Neha/Catchers/Exception.hpp>

#include <string>

namespace Neha::Catchers
{

  // Uncaught exception <TypeName>: "<Message>" [File <File> | Line <Line>]
  [[nodiscard]] NEHA_CATCHERS_API std::string Format(const Exception &exception);

} // namespace Neha::Catchers
