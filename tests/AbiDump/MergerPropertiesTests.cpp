#include <catch2/catch_test_macros.hpp>

#include <NGIN/AbiDump/AbiDumpMerger.hpp>
#include <NGIN/AbiDump/TargetHierarchy.hpp>

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace NGIN::AbiDump;

namespace
{
  const std::vector<std::pair<std::string, std::string>> &SampleDumps()
  {
    static const std::vector<std::pair<std::string, std::string>> dumps{
        {"linuxX64", "final class com.example/Foo {\n"
                     "    final fun bar(): kotlin/Unit\n"
                     "    final fun linuxOnly(): kotlin/Int\n"
                     "}\n"
                     "final fun com.example/top(): kotlin/Unit\n"},
        {"linuxArm64", "final fun com.example/top(): kotlin/Unit\n"
                       "final class com.example/Foo {\n"
                       "    final fun linuxOnly(): kotlin/Int\n"
                       "    final fun bar(): kotlin/Unit\n"
                       "}\n"},
        {"mingwX64", "final class com.example/Foo {\n"
                     "    final fun bar(): kotlin/Unit\n"
                     "    final class Nested {\n"
                     "        constructor <init>()\n"
                     "    }\n"
                     "}\n"
                     "final val com.example/windowsOnly: kotlin/Int\n"},
    };
    return dumps;
  }

  // Declaration path ("Foo { / bar()") -> targets.
  std::map<std::string, TargetSet> Declarations(const AbiDumpMerger &merger)
  {
    std::map<std::string, TargetSet> out;
    std::vector<std::string> stack;
    merger.ForEachDeclaration([&](const DeclarationView &decl) {
      stack.resize(decl.depth);
      std::string path;
      for (const auto &segment : stack)
        path.append(segment).append(" / ");
      path.append(decl.signature);
      stack.emplace_back(decl.signature);
      out.emplace(std::move(path), *decl.targets);
    });
    return out;
  }

  std::set<std::string> Paths(const AbiDumpMerger &merger)
  {
    std::set<std::string> out;
    for (const auto &[path, targets] : Declarations(merger))
      out.insert(path);
    return out;
  }

  AbiDumpMerger MergeAll()
  {
    AbiDumpMerger merger;
    for (const auto &[target, text] : SampleDumps())
      REQUIRE(merger.AddIndividualDump(Target{target}, text));
    return merger;
  }
} // namespace

TEST_CASE("AdditionOrderDoesNotChangeDeclarations", "[abidump][Properties]")
{
  const auto &dumps = SampleDumps();

  AbiDumpMerger forward;
  for (const auto &[target, text] : dumps)
    REQUIRE(forward.AddIndividualDump(Target{target}, text));

  AbiDumpMerger backward;
  for (auto it = dumps.rbegin(); it != dumps.rend(); ++it)
    REQUIRE(backward.AddIndividualDump(Target{it->first}, it->second));

  CHECK(forward.HasSameDeclarations(backward));
  CHECK(backward.HasSameDeclarations(forward));
  CHECK(Declarations(forward) == Declarations(backward));

  AbiDumpMerger partial;
  REQUIRE(partial.AddIndividualDump(Target{dumps[0].first}, dumps[0].second));
  CHECK_FALSE(partial.HasSameDeclarations(forward));
}

TEST_CASE("RenderedDumpLoadsBackToEveryIndividualDump", "[abidump][Properties]")
{
  auto merged = MergeAll();

  for (const bool aliases : {false, true})
  {
    auto rendered = merged.DumpToString(DumpFormat{.includeTargets = true, .useGroupAliases = aliases});
    REQUIRE(rendered.has_value());

    for (const auto &[target, text] : SampleDumps())
    {
      AbiDumpMerger loaded;
      REQUIRE(loaded.LoadMergedDump(*rendered));
      loaded.RemoveTargets(loaded.Targets().Difference(TargetSet{target}));

      AbiDumpMerger individual;
      REQUIRE(individual.AddIndividualDump(Target{target}, text));
      CHECK(loaded.HasSameDeclarations(individual));
    }

    AbiDumpMerger reloaded;
    REQUIRE(reloaded.LoadMergedDump(*rendered));
    CHECK(reloaded.HasSameDeclarations(merged));
    auto again = reloaded.DumpToString(DumpFormat{.includeTargets = true, .useGroupAliases = aliases});
    REQUIRE(again.has_value());
    CHECK(*again == *rendered);
  }
}

TEST_CASE("ProjectionOfFirstTargetReproducesItsDumpText", "[abidump][Properties]")
{
  auto merged = MergeAll();
  auto rendered = merged.DumpToString();
  REQUIRE(rendered.has_value());

  AbiDumpMerger loaded;
  REQUIRE(loaded.LoadMergedDump(*rendered));
  loaded.RemoveTargets(TargetSet{"linuxArm64", "mingwX64"});
  auto text = loaded.DumpToString(DumpFormat{.includeTargets = false});
  REQUIRE(text.has_value());
  CHECK(*text == SampleDumps()[0].second);
}

TEST_CASE("GroupAliasesExpandToTheirGroups", "[abidump][Properties]")
{
  const auto everything = TargetHierarchy::Targets(TargetHierarchy::Root());

  for (const auto &node : TargetHierarchy::Nodes())
  {
    if (!TargetHierarchy::IsGroup(node.name))
      continue;
    const auto group = TargetHierarchy::Targets(node.name);

    std::string source = "// Targets: " + everything.ToString() + "\n";
    source += "fun everywhere()\n";
    source += "fun grouped() // Targets: " + group.ToString() + "\n";

    AbiDumpMerger merger;
    REQUIRE(merger.LoadMergedDump(source));
    auto rendered = merger.DumpToString(DumpFormat{.includeTargets = true, .useGroupAliases = true});
    REQUIRE(rendered.has_value());
    CHECK(rendered->find("fun grouped() // Targets: [" + std::string{node.name} + "]\n") != std::string::npos);

    AbiDumpMerger reloaded;
    REQUIRE(reloaded.LoadMergedDump(*rendered));
    const auto *targets = reloaded.FindTargets({"fun grouped()"});
    REQUIRE(targets != nullptr);
    CHECK(*targets == group);
  }
}

TEST_CASE("CommonAndSpecificPartsPartitionTheDocument", "[abidump][Properties]")
{
  const auto full = Declarations(MergeAll());

  auto common = MergeAll();
  common.RetainCommonAbi();
  const auto commonPaths = Paths(common);

  std::map<std::string, TargetSet> rebuilt;
  for (const auto &path : commonPaths)
    rebuilt.emplace(path, full.at(path));

  for (const auto &[target, text] : SampleDumps())
  {
    auto specific = MergeAll();
    specific.RetainTargetSpecificAbi(Target{target});
    for (const auto &path : Paths(specific))
    {
      if (commonPaths.contains(path))
        continue;
      REQUIRE(full.contains(path));
      CHECK(full.at(path).Contains(target));
      rebuilt[path].Insert(target);
    }
  }

  // No omission, no duplication, identical attribution.
  CHECK(rebuilt == full);
}

TEST_CASE("ScenarioCommonAbiOfThreeTargets", "[abidump][Properties]")
{
  AbiDumpMerger merger;
  REQUIRE(merger.AddIndividualDump(Target{"linuxX64"}, "final class Foo {\n    final fun bar()\n}\n"));
  REQUIRE(merger.AddIndividualDump(Target{"linuxArm64"}, "final class Foo {\n    final fun bar()\n}\n"));
  REQUIRE(merger.AddIndividualDump(Target{"mingwX64"}, "final class Foo {\n    final fun bar()\n    final fun baz()\n}\n"));

  AbiDumpMerger specific;
  REQUIRE(specific.AddIndividualDump(Target{"linuxX64"}, "final class Foo {\n    final fun bar()\n}\n"));
  REQUIRE(specific.AddIndividualDump(Target{"linuxArm64"}, "final class Foo {\n    final fun bar()\n}\n"));
  REQUIRE(specific.AddIndividualDump(Target{"mingwX64"}, "final class Foo {\n    final fun bar()\n    final fun baz()\n}\n"));

  merger.RetainCommonAbi();
  CHECK(Paths(merger) == std::set<std::string>{"final class Foo {", "final class Foo { / final fun bar()"});

  specific.RetainTargetSpecificAbi(Target{"mingwX64"});
  const auto declarations = Declarations(specific);
  CHECK(declarations.size() == 2);
  CHECK(declarations.at("final class Foo { / final fun baz()") == TargetSet{"mingwX64"});
  CHECK_FALSE(declarations.contains("final class Foo { / final fun bar()"));
}
