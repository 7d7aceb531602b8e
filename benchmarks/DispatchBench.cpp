#include <iostream>
#include <string>
#include <NGIN/Benchmark.hpp>
#include <Neha/Catchers/Catchers.hpp>
#include <spdlog/spdlog.h>

using namespace NGIN;

namespace DispatchBench
{
  class Level1 : public Neha::Catchers::DeriveException<Level1>
  {
  public:
    static constexpr std::string_view DeclaredName = "Level1";
    using DeriveException::DeriveException;
  };

  class Level2 : public Neha::Catchers::DeriveException<Level2, Level1>
  {
  public:
    static constexpr std::string_view DeclaredName = "Level2";
    using DeriveException::DeriveException;
  };

  class Level3 : public Neha::Catchers::DeriveException<Level3, Level2>
  {
  public:
    static constexpr std::string_view DeclaredName = "Level3";
    using DeriveException::DeriveException;
  };
}

int main()
{
  using namespace Neha::Catchers;
  using DispatchBench::Level3;

  // Unmatched dispatches log at warn level.
  spdlog::set_level(spdlog::level::err);

  CatcherRegistry registry;
  int hits = 0;
  // The matching catcher sits behind 32 unrelated ones in dispatch order.
  (void)registry.Register("Level1", [&] { ++hits; });
  for (int i = 0; i < 32; ++i)
    (void)registry.Register("Unrelated" + std::to_string(i), [] {});

  const Level3 fault{"deep"};
  const Exception plain{"plain"};

  constexpr int N = 10000;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                        {
                          (void)registry.Handle(fault);
                        }
                        ctx.doNotOptimize(hits);
                        ctx.stop(); }, "Handle 10k behind 32 catchers");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int misses = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          auto r = registry.Handle(plain);
                          misses += r.has_value() ? 0 : 1;
                        }
                        ctx.doNotOptimize(misses);
                        ctx.stop(); }, "Handle 10k unmatched");

  auto results = NGIN::Benchmark::RunAll<Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
