#include <NGIN/AbiDump/GroupAliasCompressor.hpp>
#include <NGIN/AbiDump/TargetHierarchy.hpp>

#include <algorithm>

namespace NGIN::AbiDump
{

  GroupAliasCompressor::GroupAliasCompressor(const TargetSet &documentTargets)
  {
    for (const auto &node : TargetHierarchy::Nodes())
    {
      if (!TargetHierarchy::IsGroup(node.name))
        continue;
      auto covered = TargetHierarchy::Targets(node.name).Intersect(documentTargets);
      if (covered.Size() < 2)
        continue;
      const auto depth = TargetHierarchy::Depth(node.name).value_or(0);

      auto same = std::find_if(m_candidates.begin(), m_candidates.end(),
                               [&](const GroupAlias &a) { return a.targets == covered; });
      if (same != m_candidates.end())
      {
        if (depth > same->depth)
        {
          same->name = std::string{node.name};
          same->depth = depth;
        }
        continue;
      }
      m_candidates.push_back(GroupAlias{std::string{node.name}, std::move(covered), depth});
    }

    std::sort(m_candidates.begin(), m_candidates.end(), [](const GroupAlias &a, const GroupAlias &b) {
      if (a.targets.Size() != b.targets.Size())
        return a.targets.Size() > b.targets.Size();
      if (a.depth != b.depth)
        return a.depth > b.depth;
      return a.name < b.name;
    });
  }

  TargetSet GroupAliasCompressor::ClashingTargets(const TargetSet &documentTargets)
  {
    return documentTargets.Intersect(TargetHierarchy::NonLeafTargets());
  }

  bool GroupAliasCompressor::CanUseAliases(const TargetSet &documentTargets)
  {
    return !documentTargets.Intersects(TargetHierarchy::NonLeafTargets());
  }

  std::vector<std::string> GroupAliasCompressor::Compress(const TargetSet &targets) const
  {
    std::vector<std::string> out;
    TargetSet remaining = targets;
    for (const auto &alias : m_candidates)
    {
      if (remaining.Size() < alias.targets.Size())
        continue;
      if (!alias.targets.IsSubsetOf(remaining))
        continue;
      remaining.EraseAll(alias.targets);
      out.push_back(alias.name);
    }
    for (auto name : remaining)
      out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
  }

  const GroupAlias *GroupAliasCompressor::FindAlias(std::string_view name) const noexcept
  {
    for (const auto &alias : m_candidates)
      if (alias.name == name)
        return &alias;
    return nullptr;
  }

} // namespace NGIN::AbiDump
