/// @file BasicTests.cpp
/// @brief Basic smoke tests for Neha.Catchers.

#include <catch2/catch_test_macros.hpp>
#include <Neha/Catchers/Catchers.hpp>

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[catchers][Basics]") {
  CHECK(Neha::Catchers::LibraryName() == std::string_view{"Neha.Catchers"});
}

TEST_CASE("ProcessRegistryIsASingleInstance", "[catchers][Basics]") {
  auto &a = Neha::Catchers::GetCatcherRegistry();
  auto &b = Neha::Catchers::GetCatcherRegistry();
  CHECK(&a == &b);
}
