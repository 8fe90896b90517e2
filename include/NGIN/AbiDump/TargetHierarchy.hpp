// TargetHierarchy.hpp
// Static tree grouping compilation targets by platform family
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/AbiDump/Export.hpp>
#include <NGIN/AbiDump/Target.hpp>

#include <optional>
#include <span>
#include <string_view>

namespace NGIN::AbiDump::TargetHierarchy
{

  // One row of the fixed hierarchy table. The root has an empty parent.
  struct HierarchyNode
  {
    std::string_view name;
    std::string_view parent;
  };

  // Name of the hierarchy root ("all").
  [[nodiscard]] NGIN_ABIDUMP_API std::string_view Root() noexcept;

  // All rows, parents listed before their children.
  [[nodiscard]] NGIN_ABIDUMP_API std::span<const HierarchyNode> Nodes() noexcept;

  [[nodiscard]] NGIN_ABIDUMP_API bool Contains(std::string_view name);
  [[nodiscard]] NGIN_ABIDUMP_API bool IsGroup(std::string_view name);

  /**
   * Transitive leaf membership. A leaf yields itself, a group yields every
   * leaf below it, an unknown name yields an empty set.
   */
  [[nodiscard]] NGIN_ABIDUMP_API TargetSet Targets(std::string_view name);

  /**
   * Immediate ancestor group. Unknown names are treated as hypothetical
   * leaves and resolved through a fixed name-prefix table ("linuxArm32"
   * -> "linux"). Returns nullopt at the root or when nothing matches.
   */
  [[nodiscard]] NGIN_ABIDUMP_API std::optional<std::string_view> Parent(std::string_view name);

  // Distance from the root (root = 0); nullopt for unknown names.
  [[nodiscard]] NGIN_ABIDUMP_API std::optional<NGIN::UInt32> Depth(std::string_view name);

  // Every group name, the root included.
  [[nodiscard]] NGIN_ABIDUMP_API const TargetSet &NonLeafTargets();

} // namespace NGIN::AbiDump::TargetHierarchy
