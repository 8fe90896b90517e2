#include <iostream>
#include <NGIN/Benchmark.hpp>
#include <NGIN/AbiDump/AbiDumpMerger.hpp>

#include <string>
#include <vector>

using namespace NGIN;

namespace
{
  // One class per package, `members` functions each; every fourth member exists only on `target`.
  std::string MakeDump(std::string_view target, int classes, int members)
  {
    std::string out;
    for (int c = 0; c < classes; ++c)
    {
      out += "final class bench.pkg" + std::to_string(c) + "/Type" + std::to_string(c) + " {\n";
      for (int m = 0; m < members; ++m)
      {
        if (m % 4 == 3)
          out += "    final fun only_" + std::string{target} + "_" + std::to_string(m) + "(): kotlin/Unit\n";
        else
          out += "    final fun member" + std::to_string(m) + "(): kotlin/Int\n";
      }
      out += "}\n";
    }
    return out;
  }
} // namespace

int main()
{
  using namespace NGIN::AbiDump;

  const std::vector<std::string> targets{"linuxX64", "linuxArm64", "mingwX64", "macosArm64", "iosArm64", "iosX64"};
  std::vector<std::string> dumps;
  dumps.reserve(targets.size());
  for (const auto &t : targets)
    dumps.push_back(MakeDump(t, 200, 40));

  auto mergeAll = [&](AbiDumpMerger &merger) {
    for (std::size_t i = 0; i < targets.size(); ++i)
      if (!merger.AddIndividualDump(Target{targets[i]}, dumps[i]))
        std::cerr << "merge failed for " << targets[i] << "\n";
  };

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        AbiDumpMerger merger;
                        mergeAll(merger);
                        auto count = merger.DeclarationCount();
                        ctx.doNotOptimize(count);
                        ctx.stop(); }, "AbiDump: merge 6 targets x 8k declarations");

  AbiDumpMerger merged;
  mergeAll(merged);

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        auto text = merged.DumpToString(DumpFormat{.includeTargets = true, .useGroupAliases = true});
                        ctx.doNotOptimize(text);
                        ctx.stop(); }, "AbiDump: render with group aliases");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        AbiDumpMerger merger;
                        mergeAll(merger);
                        ctx.start();
                        merger.RetainCommonAbi();
                        auto count = merger.DeclarationCount();
                        ctx.doNotOptimize(count);
                        ctx.stop(); }, "AbiDump: retain common ABI");

  auto rendered = merged.DumpToString();
  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        AbiDumpMerger merger;
                        bool loaded = rendered && merger.LoadMergedDump(*rendered).has_value();
                        ctx.doNotOptimize(loaded);
                        ctx.stop(); }, "AbiDump: load merged dump");

  auto results = Benchmark::RunAll<Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
