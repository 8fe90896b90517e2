// GroupAliasCompressor.hpp
// Replaces target subsets with hierarchy group names for compact rendering
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/AbiDump/Export.hpp>
#include <NGIN/AbiDump/Target.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace NGIN::AbiDump
{

  // A hierarchy group restricted to the targets present in one document.
  struct GroupAlias
  {
    std::string name;
    TargetSet targets;
    NGIN::UInt32 depth{0};
  };

  /**
   * Built once per rendered document. Candidate aliases are the hierarchy
   * groups covering at least two of the document's targets; when several
   * groups cover the same targets only the deepest one is kept ("linux"
   * rather than "native" or "all"). Compression is greedy: larger
   * candidates first, deeper ones first among equal sizes, and a candidate
   * is used only when all of its targets are still unmatched.
   */
  class NGIN_ABIDUMP_API GroupAliasCompressor
  {
  public:
    explicit GroupAliasCompressor(const TargetSet &documentTargets);

    // Document targets whose names are also hierarchy group names.
    [[nodiscard]] static TargetSet ClashingTargets(const TargetSet &documentTargets);
    [[nodiscard]] static bool CanUseAliases(const TargetSet &documentTargets);

    // Sorted names (aliases and leftover targets) that expand back to exactly `targets`.
    [[nodiscard]] std::vector<std::string> Compress(const TargetSet &targets) const;

    [[nodiscard]] const std::vector<GroupAlias> &Candidates() const noexcept { return m_candidates; }
    [[nodiscard]] const GroupAlias *FindAlias(std::string_view name) const noexcept;

  private:
    std::vector<GroupAlias> m_candidates;
  };

} // namespace NGIN::AbiDump
