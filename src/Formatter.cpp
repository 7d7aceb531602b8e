#include <Neha/Catchers/Formatter.hpp>

#include <fmt/format.h>

namespace Neha::Catchers
{

  std::string Format(const Exception &exception)
  {
    return fmt::format("Uncaught exception {}: \"{}\" [File {} | Line {}]",
                       exception.TypeName(), exception.Message(), exception.File(), exception.Line());
  }

} // namespace Neha::Catchers
