// DumpText.hpp
// Line-level reader and writer helpers for single- and multi-target dump text
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/AbiDump/Export.hpp>
#include <NGIN/AbiDump/Types.hpp>

#include <expected>
#include <string_view>

namespace NGIN::AbiDump::detail
{

  inline constexpr std::string_view kDumpTitle = "// Klib ABI Dump";
  inline constexpr std::string_view kTargetsHeader = "// Targets: ";
  inline constexpr std::string_view kAliasHeader = "// Alias: ";
  inline constexpr std::string_view kAliasArrow = " => ";
  inline constexpr std::string_view kTargetsSuffix = " // Targets: ";
  inline constexpr std::string_view kBlockClose = "}";
  inline constexpr NGIN::UInt32 kIndentWidth = 4;
  inline constexpr NGIN::UInt32 kNoParent = static_cast<NGIN::UInt32>(-1);

  enum class DumpKind : NGIN::UInt8
  {
    SingleTarget = 0, // no target annotations
    Merged = 1,       // "// Targets:" header and per-line target suffixes
  };

  // Views point into the parsed source text.
  struct ParsedDeclaration
  {
    std::string_view text;
    NGIN::UInt32 parent{kNoParent};
    NGIN::UInt32 line{0};
    bool annotated{false};
    NGIN::Containers::Vector<std::string_view> targetNames;
    NGIN::Containers::Vector<NGIN::UInt32> children;
  };

  struct ParsedAlias
  {
    std::string_view name;
    NGIN::Containers::Vector<std::string_view> targets;
    NGIN::UInt32 line{0};
  };

  struct ParsedDump
  {
    NGIN::Containers::Vector<ParsedDeclaration> declarations;
    NGIN::Containers::Vector<NGIN::UInt32> roots;
    bool hasTargetsHeader{false};
    NGIN::Containers::Vector<std::string_view> headerTargets;
    NGIN::Containers::Vector<ParsedAlias> aliases;
    // Comment lines before the first declaration, other than the title, targets and alias lines.
    // Blank lines between them are kept as empty views.
    NGIN::Containers::Vector<std::string_view> header;
    bool anyAnnotated{false};
  };

  /**
   * Splits dump text into a declaration tree. Nesting is four spaces per
   * level; a declaration whose code part ends with '{' opens a block that
   * must be closed by a '}' line at the same indentation. Sibling
   * uniqueness is not checked here.
   */
  [[nodiscard]] NGIN_ABIDUMP_API std::expected<ParsedDump, Error> ParseDump(std::string_view source, DumpKind kind);

  // True when the text before the first " // " ends with '{'.
  [[nodiscard]] NGIN_ABIDUMP_API bool OpensBlock(std::string_view text) noexcept;

  // Parses "[a, b]" into its names; "[]" yields an empty list.
  [[nodiscard]] NGIN_ABIDUMP_API std::expected<NGIN::Containers::Vector<std::string_view>, Error>
  ParseNameList(std::string_view list, NGIN::UInt32 line);

} // namespace NGIN::AbiDump::detail
