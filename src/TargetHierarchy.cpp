#include <NGIN/AbiDump/TargetHierarchy.hpp>

#include <array>
#include <string>
#include <unordered_map>

namespace NGIN::AbiDump::TargetHierarchy
{
  namespace
  {
    constexpr std::array kNodes{
        HierarchyNode{"all", ""},
        HierarchyNode{"js", "all"},
        HierarchyNode{"wasm", "all"},
        HierarchyNode{"wasmJs", "wasm"},
        HierarchyNode{"wasmWasi", "wasm"},
        HierarchyNode{"native", "all"},
        HierarchyNode{"mingw", "native"},
        HierarchyNode{"mingwX64", "mingw"},
        HierarchyNode{"mingwX86", "mingw"},
        HierarchyNode{"linux", "native"},
        HierarchyNode{"linuxArm64", "linux"},
        HierarchyNode{"linuxArm32Hfp", "linux"},
        HierarchyNode{"linuxX64", "linux"},
        HierarchyNode{"linuxMips32", "linux"},
        HierarchyNode{"linuxMipsel32", "linux"},
        HierarchyNode{"androidNative", "native"},
        HierarchyNode{"androidNativeArm32", "androidNative"},
        HierarchyNode{"androidNativeArm64", "androidNative"},
        HierarchyNode{"androidNativeX64", "androidNative"},
        HierarchyNode{"androidNativeX86", "androidNative"},
        HierarchyNode{"apple", "native"},
        HierarchyNode{"macos", "apple"},
        HierarchyNode{"macosArm64", "macos"},
        HierarchyNode{"macosX64", "macos"},
        HierarchyNode{"ios", "apple"},
        HierarchyNode{"iosArm32", "ios"},
        HierarchyNode{"iosArm64", "ios"},
        HierarchyNode{"iosSimulatorArm64", "ios"},
        HierarchyNode{"iosX64", "ios"},
        HierarchyNode{"tvos", "apple"},
        HierarchyNode{"tvosArm64", "tvos"},
        HierarchyNode{"tvosSimulatorArm64", "tvos"},
        HierarchyNode{"tvosX64", "tvos"},
        HierarchyNode{"watchos", "apple"},
        HierarchyNode{"watchosArm32", "watchos"},
        HierarchyNode{"watchosArm64", "watchos"},
        HierarchyNode{"watchosDeviceArm64", "watchos"},
        HierarchyNode{"watchosSimulatorArm64", "watchos"},
        HierarchyNode{"watchosX64", "watchos"},
        HierarchyNode{"watchosX86", "watchos"},
    };

    // Ancestors for names missing from the tree, matched by prefix (longest prefixes first).
    constexpr std::array kPrefixParents{
        HierarchyNode{"androidNative", "androidNative"},
        HierarchyNode{"watchos", "watchos"},
        HierarchyNode{"linux", "linux"},
        HierarchyNode{"mingw", "mingw"},
        HierarchyNode{"macos", "macos"},
        HierarchyNode{"tvos", "tvos"},
        HierarchyNode{"wasm", "wasm"},
        HierarchyNode{"ios", "ios"},
    };

    struct NodeClosure
    {
      std::string_view parent;
      NGIN::UInt32 depth{0};
      bool group{false};
      TargetSet leaves;
    };

    struct HierarchyIndex
    {
      std::unordered_map<std::string_view, NodeClosure> nodes;
      TargetSet groups;
    };

    HierarchyIndex BuildIndex()
    {
      HierarchyIndex index;
      for (const auto &node : kNodes)
      {
        NodeClosure closure{};
        closure.parent = node.parent;
        if (!node.parent.empty())
        {
          auto &parent = index.nodes.at(node.parent);
          parent.group = true;
          closure.depth = parent.depth + 1;
        }
        index.nodes.emplace(node.name, std::move(closure));
      }
      for (const auto &node : kNodes)
      {
        if (index.nodes.at(node.name).group)
        {
          index.groups.Insert(node.name);
          continue;
        }
        // Propagate the leaf to itself and every ancestor.
        std::string_view current = node.name;
        while (!current.empty())
        {
          auto &closure = index.nodes.at(current);
          closure.leaves.Insert(node.name);
          current = closure.parent;
        }
      }
      return index;
    }

    const HierarchyIndex &Index()
    {
      static const HierarchyIndex index = BuildIndex();
      return index;
    }

    const NodeClosure *Find(std::string_view name)
    {
      const auto &nodes = Index().nodes;
      auto it = nodes.find(name);
      return it == nodes.end() ? nullptr : &it->second;
    }
  } // namespace

  std::string_view Root() noexcept
  {
    return kNodes[0].name;
  }

  std::span<const HierarchyNode> Nodes() noexcept
  {
    return kNodes;
  }

  bool Contains(std::string_view name)
  {
    return Find(name) != nullptr;
  }

  bool IsGroup(std::string_view name)
  {
    const auto *node = Find(name);
    return node && node->group;
  }

  TargetSet Targets(std::string_view name)
  {
    const auto *node = Find(name);
    if (!node)
      return {};
    return node->leaves;
  }

  std::optional<std::string_view> Parent(std::string_view name)
  {
    if (const auto *node = Find(name))
    {
      if (node->parent.empty())
        return std::nullopt;
      return node->parent;
    }
    for (const auto &entry : kPrefixParents)
    {
      if (name.size() > entry.name.size() && name.starts_with(entry.name))
        return entry.parent;
    }
    return std::nullopt;
  }

  std::optional<NGIN::UInt32> Depth(std::string_view name)
  {
    if (const auto *node = Find(name))
      return node->depth;
    return std::nullopt;
  }

  const TargetSet &NonLeafTargets()
  {
    return Index().groups;
  }

} // namespace NGIN::AbiDump::TargetHierarchy
