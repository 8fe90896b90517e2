// Target.hpp
// Compilation target identifiers and sorted target sets
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/AbiDump/Export.hpp>

#include <compare>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace NGIN::AbiDump
{

  // One compilation target ("linuxX64", "iosArm64", "js", ...). Compared by exact, case-sensitive name.
  struct Target
  {
    std::string name;

    Target() = default;
    explicit Target(std::string_view n) : name(n) {}

    [[nodiscard]] std::string_view Name() const noexcept { return name; }

    bool operator==(const Target &) const = default;
    auto operator<=>(const Target &) const = default;
  };

  /**
   * Set of target names kept sorted lexicographically, so iteration and
   * rendering order never depend on insertion order.
   */
  class NGIN_ABIDUMP_API TargetSet
  {
  public:
    using const_iterator = std::vector<std::string>::const_iterator;

    TargetSet() = default;
    TargetSet(std::initializer_list<std::string_view> names);

    [[nodiscard]] static TargetSet Of(const Target &target);

    bool Insert(std::string_view name);
    bool Insert(const Target &target) { return Insert(target.Name()); }
    bool Erase(std::string_view name);

    void UnionWith(const TargetSet &other);
    void EraseAll(const TargetSet &other);

    [[nodiscard]] bool Contains(std::string_view name) const noexcept;
    [[nodiscard]] bool Contains(const Target &target) const noexcept { return Contains(target.Name()); }
    [[nodiscard]] bool IsSubsetOf(const TargetSet &other) const noexcept;
    [[nodiscard]] bool Intersects(const TargetSet &other) const noexcept;
    [[nodiscard]] TargetSet Intersect(const TargetSet &other) const;
    [[nodiscard]] TargetSet Difference(const TargetSet &other) const;

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return static_cast<NGIN::UIntSize>(m_names.size()); }
    [[nodiscard]] bool IsEmpty() const noexcept { return m_names.empty(); }
    [[nodiscard]] std::string_view operator[](NGIN::UIntSize i) const noexcept { return m_names[i]; }

    [[nodiscard]] const_iterator begin() const noexcept { return m_names.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_names.end(); }

    // "[a, b, c]"
    [[nodiscard]] std::string ToString() const;

    bool operator==(const TargetSet &) const = default;
    auto operator<=>(const TargetSet &) const = default;

  private:
    std::vector<std::string> m_names;
  };

} // namespace NGIN::AbiDump
