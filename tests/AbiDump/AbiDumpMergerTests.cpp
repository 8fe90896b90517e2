#include <catch2/catch_test_macros.hpp>

#include <NGIN/AbiDump/AbiDumpMerger.hpp>

#include <sstream>
#include <string>
#include <string_view>
#include <utility>

using namespace NGIN::AbiDump;

namespace
{
  constexpr std::string_view kFooBar = "final class com.example/Foo {\n"
                                       "    final fun bar(): kotlin/Unit\n"
                                       "}\n";

  constexpr std::string_view kFooBarBaz = "final class com.example/Foo {\n"
                                          "    final fun bar(): kotlin/Unit\n"
                                          "    final fun baz(): kotlin/Unit\n"
                                          "}\n";

  constexpr std::string_view kFoo = "final class com.example/Foo {";
  constexpr std::string_view kBar = "final fun bar(): kotlin/Unit";
  constexpr std::string_view kBaz = "final fun baz(): kotlin/Unit";

  AbiDumpMerger MakeScenario()
  {
    AbiDumpMerger merger;
    REQUIRE(merger.AddIndividualDump(Target{"linuxX64"}, kFooBar));
    REQUIRE(merger.AddIndividualDump(Target{"linuxArm64"}, kFooBar));
    REQUIRE(merger.AddIndividualDump(Target{"mingwX64"}, kFooBarBaz));
    return merger;
  }
} // namespace

TEST_CASE("MergesIndividualDumpsIntoTargetSets", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();

  CHECK(merger.GetState() == MergerState::Populated);
  CHECK(merger.Targets() == TargetSet{"linuxArm64", "linuxX64", "mingwX64"});
  CHECK(merger.DeclarationCount() == 3);

  const auto *foo = merger.FindTargets({kFoo});
  REQUIRE(foo != nullptr);
  CHECK(*foo == merger.Targets());
  const auto *baz = merger.FindTargets({kFoo, kBaz});
  REQUIRE(baz != nullptr);
  CHECK(*baz == TargetSet{"mingwX64"});
  CHECK(merger.FindTargets({kBaz}) == nullptr);
}

TEST_CASE("RendersLiteralTargetLists", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  auto text = merger.DumpToString();
  REQUIRE(text.has_value());
  CHECK(*text == "// Klib ABI Dump\n"
                 "// Targets: [linuxArm64, linuxX64, mingwX64]\n"
                 "\n"
                 "final class com.example/Foo { // Targets: [linuxArm64, linuxX64, mingwX64]\n"
                 "    final fun bar(): kotlin/Unit // Targets: [linuxArm64, linuxX64, mingwX64]\n"
                 "    final fun baz(): kotlin/Unit // Targets: [mingwX64]\n"
                 "}\n");
}

TEST_CASE("RendersGroupAliases", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger merger;
  REQUIRE(merger.AddIndividualDump(Target{"linuxX64"}, kFooBarBaz));
  REQUIRE(merger.AddIndividualDump(Target{"linuxArm64"}, kFooBarBaz));
  REQUIRE(merger.AddIndividualDump(Target{"mingwX64"}, kFooBar));

  auto text = merger.DumpToString(DumpFormat{.includeTargets = true, .useGroupAliases = true});
  REQUIRE(text.has_value());
  CHECK(*text == "// Klib ABI Dump\n"
                 "// Targets: [linuxArm64, linuxX64, mingwX64]\n"
                 "// Alias: linux => [linuxArm64, linuxX64]\n"
                 "// Alias: native => [linuxArm64, linuxX64, mingwX64]\n"
                 "\n"
                 "final class com.example/Foo { // Targets: [native]\n"
                 "    final fun bar(): kotlin/Unit // Targets: [native]\n"
                 "    final fun baz(): kotlin/Unit // Targets: [linux]\n"
                 "}\n");
}

TEST_CASE("DumpWritesToStream", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger merger;
  REQUIRE(merger.AddIndividualDump(Target{"js"}, kFooBar));
  std::ostringstream out;
  REQUIRE(merger.Dump(out, DumpFormat{.includeTargets = false}));
  CHECK(out.str() == kFooBar);
}

TEST_CASE("SiblingsRenderInInsertionOrder", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger merger;
  REQUIRE(merger.AddIndividualDump(Target{"a"}, "fun z()\nfun m()\n"));
  REQUIRE(merger.AddIndividualDump(Target{"b"}, "fun a()\nfun z()\n"));
  merger.RemoveTargets(TargetSet{"a"});

  auto text = merger.DumpToString(DumpFormat{.includeTargets = false});
  REQUIRE(text.has_value());
  CHECK(*text == "fun z()\nfun a()\n");
}

TEST_CASE("RetainCommonAbiKeepsSharedDeclarations", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  merger.RetainCommonAbi();

  CHECK(merger.GetState() == MergerState::Projected);
  CHECK(merger.DeclarationCount() == 2);
  CHECK(merger.FindTargets({kFoo, kBar}) != nullptr);
  CHECK(merger.FindTargets({kFoo, kBaz}) == nullptr);
  CHECK(merger.Targets() == TargetSet{"linuxArm64", "linuxX64", "mingwX64"});
}

TEST_CASE("RetainCommonAbiIsIdempotent", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  merger.RetainCommonAbi();
  auto once = merger.DumpToString();
  merger.RetainCommonAbi();
  auto twice = merger.DumpToString();
  REQUIRE(once.has_value());
  REQUIRE(twice.has_value());
  CHECK(*once == *twice);
}

TEST_CASE("RetainTargetSpecificAbiKeepsMingwOnlyDeclarations", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  merger.RetainTargetSpecificAbi(Target{"mingwX64"});

  CHECK(merger.Targets() == TargetSet{"mingwX64"});
  CHECK(merger.FindTargets({kFoo, kBar}) == nullptr);
  const auto *baz = merger.FindTargets({kFoo, kBaz});
  REQUIRE(baz != nullptr);
  CHECK(*baz == TargetSet{"mingwX64"});

  auto text = merger.DumpToString(DumpFormat{.includeTargets = false});
  REQUIRE(text.has_value());
  CHECK(*text == "final class com.example/Foo {\n"
                 "    final fun baz(): kotlin/Unit\n"
                 "}\n");
}

TEST_CASE("RetainTargetSpecificAbiForAbsentTargetPrunesEverything", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  merger.RetainTargetSpecificAbi(Target{"iosX64"});
  CHECK(merger.DeclarationCount() == 0);
  CHECK(merger.Targets() == TargetSet{"iosX64"});
  auto text = merger.DumpToString(DumpFormat{.includeTargets = false});
  REQUIRE(text.has_value());
  CHECK(text->empty());
}

TEST_CASE("BlockOpenerKeepsItsCloserWhenChildrenArePruned", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger merger;
  REQUIRE(merger.AddIndividualDump(Target{"linuxX64"}, "class A {\n    fun onlyHere()\n}\n"));
  REQUIRE(merger.AddIndividualDump(Target{"mingwX64"}, "class A {\n}\n"));
  merger.RetainCommonAbi();
  auto text = merger.DumpToString();
  REQUIRE(text.has_value());
  CHECK(*text == "// Klib ABI Dump\n"
                 "// Targets: [linuxX64, mingwX64]\n"
                 "\n"
                 "class A { // Targets: [linuxX64, mingwX64]\n"
                 "}\n");
}

TEST_CASE("AddIndividualDumpRejectsDuplicateSiblings", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger merger;
  REQUIRE(merger.AddIndividualDump(Target{"linuxX64"}, kFooBar));

  auto result = merger.AddIndividualDump(Target{"mingwX64"}, "fun a()\nclass B {\n    fun b()\n    fun b()\n}\n");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::Conflict);
  CHECK(result.error().line == 4);

  // The failed call left the document untouched.
  CHECK(merger.Targets() == TargetSet{"linuxX64"});
  CHECK(merger.DeclarationCount() == 2);
}

TEST_CASE("AddIndividualDumpRejectsMalformedText", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger merger;
  auto result = merger.AddIndividualDump(Target{"linuxX64"}, "class A {\n    fun a()\n");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::Parse);
  CHECK(merger.IsEmpty());
}

TEST_CASE("AddIndividualDumpRejectsRepeatedTarget", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger merger;
  REQUIRE(merger.AddIndividualDump(Target{"linuxX64"}, kFooBar));
  auto result = merger.AddIndividualDump(Target{"linuxX64"}, kFooBarBaz);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::InvalidArgument);

  auto unnamed = merger.AddIndividualDump(Target{""}, kFooBar);
  REQUIRE_FALSE(unnamed.has_value());
  CHECK(unnamed.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("AddIndividualDumpRejectedAfterProjection", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  merger.RetainCommonAbi();
  auto result = merger.AddIndividualDump(Target{"iosX64"}, kFooBar);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("DumpRejectsEmptyAndLossyRenders", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger empty;
  auto nothing = empty.DumpToString();
  REQUIRE_FALSE(nothing.has_value());
  CHECK(nothing.error().code == ErrorCode::Render);

  auto merger = MakeScenario();
  auto lossy = merger.DumpToString(DumpFormat{.includeTargets = false});
  REQUIRE_FALSE(lossy.has_value());
  CHECK(lossy.error().code == ErrorCode::Render);
}

TEST_CASE("OverrideTargetsRelabelsEveryDeclaration", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  REQUIRE(merger.OverrideTargets(TargetSet{"linuxArm32"}));
  CHECK(merger.Targets() == TargetSet{"linuxArm32"});
  NGIN::UIntSize visited = 0;
  merger.ForEachDeclaration([&](const DeclarationView &decl) {
    ++visited;
    REQUIRE(decl.targets != nullptr);
    CHECK(*decl.targets == TargetSet{"linuxArm32"});
  });
  CHECK(visited == 3);

  auto empty = merger.OverrideTargets(TargetSet{});
  REQUIRE_FALSE(empty.has_value());
  CHECK(empty.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("MergeTargetSpecificSplicesDeclarations", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger common;
  REQUIRE(common.AddIndividualDump(Target{"linuxX64"}, kFooBar));
  REQUIRE(common.AddIndividualDump(Target{"linuxArm64"}, kFooBar));
  common.RetainCommonAbi();

  AbiDumpMerger specific;
  REQUIRE(specific.AddIndividualDump(Target{"linuxArm32"}, kFooBarBaz));
  REQUIRE(specific.AddIndividualDump(Target{"linuxX64"}, kFooBar));
  specific.RetainTargetSpecificAbi(Target{"linuxArm32"});

  REQUIRE(common.MergeTargetSpecific(specific));
  CHECK(common.Targets() == TargetSet{"linuxArm32", "linuxArm64", "linuxX64"});
  const auto *baz = common.FindTargets({kFoo, kBaz});
  REQUIRE(baz != nullptr);
  CHECK(*baz == TargetSet{"linuxArm32"});
  const auto *foo = common.FindTargets({kFoo});
  REQUIRE(foo != nullptr);
  CHECK(*foo == TargetSet{"linuxArm32", "linuxArm64", "linuxX64"});
}

TEST_CASE("MergeTargetSpecificRequiresSingleTarget", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  auto other = MakeScenario();
  auto result = merger.MergeTargetSpecific(other);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::InvalidArgument);

  auto self = merger.MergeTargetSpecific(merger);
  REQUIRE_FALSE(self.has_value());
}

TEST_CASE("RemoveTargetsPrunesOrphanedDeclarations", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  merger.RemoveTargets(TargetSet{"mingwX64"});
  CHECK(merger.Targets() == TargetSet{"linuxArm64", "linuxX64"});
  CHECK(merger.DeclarationCount() == 2);
  CHECK(merger.FindTargets({kFoo, kBaz}) == nullptr);

  merger.RemoveTargets(TargetSet{"linuxArm64", "linuxX64"});
  CHECK(merger.IsEmpty());
  CHECK(merger.DeclarationCount() == 0);
}

TEST_CASE("LoadMergedDumpExpandsAliasesAndGroups", "[abidump][AbiDumpMerger]")
{
  constexpr std::string_view source = "// Klib ABI Dump\n"
                                      "// Targets: [linuxArm64, linuxX64, mingwX64]\n"
                                      "// Alias: lin => [linuxArm64, linuxX64]\n"
                                      "\n"
                                      "final class com.example/Foo { // Targets: [native]\n"
                                      "    final fun bar(): kotlin/Unit // Targets: [lin]\n"
                                      "    final fun baz(): kotlin/Unit\n"
                                      "}\n"
                                      "final fun top() // Targets: [linux, mingwX64]\n";

  AbiDumpMerger merger;
  REQUIRE(merger.LoadMergedDump(source));
  CHECK(merger.HadTargetAnnotations());
  CHECK(merger.Targets() == TargetSet{"linuxArm64", "linuxX64", "mingwX64"});
  CHECK(*merger.FindTargets({kFoo}) == merger.Targets());
  CHECK(*merger.FindTargets({kFoo, kBar}) == TargetSet{"linuxArm64", "linuxX64"});
  // Unannotated lines inherit their parent's targets.
  CHECK(*merger.FindTargets({kFoo, kBaz}) == merger.Targets());
  CHECK(*merger.FindTargets({"final fun top()"}) == merger.Targets());
}

TEST_CASE("LoadMergedDumpRejectsInvalidInput", "[abidump][AbiDumpMerger]")
{
  struct Case
  {
    std::string_view source;
    ErrorCode code;
  };
  const Case cases[] = {
      {"fun a()\n", ErrorCode::Parse}, // no targets header
      {"// Targets: [a]\nfun a() // Targets: [b]\n", ErrorCode::Parse},
      {"// Targets: [linuxX64]\nfun a() // Targets: [mingw]\n", ErrorCode::Parse},
      {"// Targets: [a, b]\nclass A { // Targets: [a]\n    fun a() // Targets: [a, b]\n}\n", ErrorCode::Parse},
      {"// Targets: [a, b]\n// Alias: g => [a, c]\nfun a() // Targets: [g]\n", ErrorCode::Parse},
      {"// Targets: []\n", ErrorCode::Parse},
      {"// Targets: [a]\nfun a() // Targets: [a]\nfun a() // Targets: [a]\n", ErrorCode::Conflict},
  };
  for (const auto &c : cases)
  {
    AbiDumpMerger merger;
    auto result = merger.LoadMergedDump(c.source);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == c.code);
    CHECK(merger.IsEmpty());
  }
}

TEST_CASE("LoadMergedDumpRequiresEmptyMerger", "[abidump][AbiDumpMerger]")
{
  auto merger = MakeScenario();
  auto rendered = merger.DumpToString();
  REQUIRE(rendered.has_value());
  auto result = merger.LoadMergedDump(*rendered);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("LoadedDumpRejectsIndividualDumps", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger merger;
  REQUIRE(merger.LoadMergedDump("// Targets: [linuxX64]\nfun a()\n"));
  CHECK_FALSE(merger.HadTargetAnnotations());
  auto result = merger.AddIndividualDump(Target{"mingwX64"}, "fun a()\n");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("HeaderIsRenderedAfterTargetsAndReloaded", "[abidump][AbiDumpMerger]")
{
  const std::string header = "// Library unique name: <org.example:demo>\n";
  AbiDumpMerger merger;
  REQUIRE(merger.AddIndividualDump(Target{"linuxX64"}, header + std::string{kFooBar}));
  REQUIRE(merger.AddIndividualDump(Target{"mingwX64"}, header + std::string{kFooBarBaz}));

  auto rendered = merger.DumpToString();
  REQUIRE(rendered.has_value());
  CHECK(*rendered == "// Klib ABI Dump\n"
                     "// Targets: [linuxX64, mingwX64]\n"
                     "// Library unique name: <org.example:demo>\n"
                     "\n"
                     "final class com.example/Foo { // Targets: [linuxX64, mingwX64]\n"
                     "    final fun bar(): kotlin/Unit // Targets: [linuxX64, mingwX64]\n"
                     "    final fun baz(): kotlin/Unit // Targets: [mingwX64]\n"
                     "}\n");

  AbiDumpMerger loaded;
  REQUIRE(loaded.LoadMergedDump(*rendered));
  loaded.RetainTargetSpecificAbi(Target{"mingwX64"});
  auto single = loaded.DumpToString(DumpFormat{.includeTargets = false});
  REQUIRE(single.has_value());
  CHECK(*single == "// Library unique name: <org.example:demo>\n"
                   "final class com.example/Foo {\n"
                   "    final fun baz(): kotlin/Unit\n"
                   "}\n");
}

TEST_CASE("AddIndividualDumpRejectsDifferentHeader", "[abidump][AbiDumpMerger]")
{
  AbiDumpMerger merger;
  REQUIRE(merger.AddIndividualDump(Target{"linuxX64"}, "// Library unique name: <a>\n" + std::string{kFooBar}));

  auto other = merger.AddIndividualDump(Target{"mingwX64"}, "// Library unique name: <b>\n" + std::string{kFooBar});
  REQUIRE_FALSE(other.has_value());
  CHECK(other.error().code == ErrorCode::Conflict);

  auto bare = merger.AddIndividualDump(Target{"mingwX64"}, kFooBar);
  REQUIRE_FALSE(bare.has_value());
  CHECK(bare.error().code == ErrorCode::Conflict);

  CHECK(merger.Targets() == TargetSet{"linuxX64"});
  CHECK(merger.DeclarationCount() == 2);
}

TEST_CASE("MovedFromMergerIsEmpty", "[abidump][AbiDumpMerger]")
{
  auto source = MakeScenario();
  AbiDumpMerger moved{std::move(source)};
  CHECK(moved.Targets().Size() == 3);

  CHECK(source.IsEmpty());
  CHECK(source.Targets().IsEmpty());
  CHECK(source.DeclarationCount() == 0);
  CHECK_FALSE(source.DumpToString().has_value());
  REQUIRE(source.AddIndividualDump(Target{"linuxX64"}, kFooBar));

  AbiDumpMerger assigned;
  assigned = std::move(moved);
  CHECK(assigned.Targets().Size() == 3);
  CHECK(moved.IsEmpty());
  CHECK(moved.GetState() == MergerState::Empty);
  REQUIRE(moved.LoadMergedDump("// Targets: [linuxX64]\nfun a()\n"));
}
