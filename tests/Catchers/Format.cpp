// Format.cpp - tests for the diagnostic text of the default catcher

#include <catch2/catch_test_macros.hpp>

#include <Neha/Catchers/Catchers.hpp>

#include <string>

namespace FormatDemo
{
  class RuntimeFault : public Neha::Catchers::DeriveException<RuntimeFault>
  {
  public:
    static constexpr std::string_view DeclaredName = "RuntimeFault";
    using DeriveException::DeriveException;
  };
} // namespace FormatDemo

TEST_CASE("FormatUsesFixedTemplate", "[catchers][Format]")
{
  using namespace Neha::Catchers;

  const FormatDemo::RuntimeFault fault{"disk full", std::nullopt, SourceSite{"io.x", 42}};
  CHECK(Format(fault) == std::string{"Uncaught exception RuntimeFault: \"disk full\" [File io.x | Line 42]"});
}

TEST_CASE("FormatReportsRuntimeErrors", "[catchers][Format]")
{
  using namespace Neha::Catchers;

  const RuntimeError error{"undefined index", Severity::Notice, SourceSite{"page.x", 7}};
  CHECK(Format(error) == std::string{"Uncaught exception RuntimeError: \"undefined index\" [File page.x | Line 7]"});
}
