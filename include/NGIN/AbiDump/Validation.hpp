// Validation.hpp
// Merging individual dumps, preparing reference dumps and diffing them
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/AbiDump/Export.hpp>
#include <NGIN/AbiDump/Target.hpp>
#include <NGIN/AbiDump/Types.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace NGIN::AbiDump
{

  struct MergeRequest
  {
    // (target, single-target dump) pairs, added in order.
    std::vector<std::pair<Target, std::string>> dumps;
    // Render hierarchy group aliases when no target name clashes with a group name.
    bool groupTargetNames{true};
  };

  struct MergeResult
  {
    std::string dump;
    TargetSet targets;
    bool usedGroupAliases{false};
    Diagnostics diagnostics;
  };

  [[nodiscard]] NGIN_ABIDUMP_API std::expected<MergeResult, Error> MergeIndividualDumps(const MergeRequest &request);

  struct ValidationOptions
  {
    // Fail instead of dropping targets the host cannot build.
    bool strictValidation{false};
    bool groupTargetNames{true};
  };

  struct PreparedReference
  {
    std::string dump;
    TargetSet removedTargets;
    Diagnostics diagnostics;
  };

  /**
   * Loads a committed merged dump and restricts it to `supportedTargets` so
   * it can be compared with what this host generates.
   */
  [[nodiscard]] NGIN_ABIDUMP_API std::expected<PreparedReference, Error> PrepareReferenceDump(
      std::string_view reference, const TargetSet &supportedTargets, const ValidationOptions &options = {});

  enum class DiffKind : NGIN::UInt8
  {
    Removed = 0, // only in the expected dump
    Added = 1,   // only in the actual dump
  };

  struct DiffLine
  {
    DiffKind kind{DiffKind::Added};
    std::string text;
  };

  struct NGIN_ABIDUMP_API DumpComparison
  {
    bool equal{true};
    std::vector<DiffLine> lines;

    // "-removed\n+added\n"
    [[nodiscard]] std::string ToString() const;
  };

  // Line diff ignoring line-ending differences.
  [[nodiscard]] NGIN_ABIDUMP_API DumpComparison CompareDumps(std::string_view expected, std::string_view actual);

} // namespace NGIN::AbiDump
