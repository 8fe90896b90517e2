#include <NGIN/AbiDump/Target.hpp>

#include <algorithm>
#include <iterator>

namespace NGIN::AbiDump
{

  TargetSet::TargetSet(std::initializer_list<std::string_view> names)
  {
    m_names.reserve(names.size());
    for (auto name : names)
      Insert(name);
  }

  TargetSet TargetSet::Of(const Target &target)
  {
    TargetSet out;
    out.Insert(target);
    return out;
  }

  bool TargetSet::Insert(std::string_view name)
  {
    auto it = std::lower_bound(m_names.begin(), m_names.end(), name,
                               [](const std::string &a, std::string_view b) { return std::string_view{a} < b; });
    if (it != m_names.end() && *it == name)
      return false;
    m_names.emplace(it, name);
    return true;
  }

  bool TargetSet::Erase(std::string_view name)
  {
    auto it = std::lower_bound(m_names.begin(), m_names.end(), name,
                               [](const std::string &a, std::string_view b) { return std::string_view{a} < b; });
    if (it == m_names.end() || *it != name)
      return false;
    m_names.erase(it);
    return true;
  }

  void TargetSet::UnionWith(const TargetSet &other)
  {
    if (other.m_names.empty())
      return;
    std::vector<std::string> merged;
    merged.reserve(m_names.size() + other.m_names.size());
    std::set_union(m_names.begin(), m_names.end(), other.m_names.begin(), other.m_names.end(),
                   std::back_inserter(merged));
    m_names = std::move(merged);
  }

  void TargetSet::EraseAll(const TargetSet &other)
  {
    if (other.m_names.empty() || m_names.empty())
      return;
    m_names = Difference(other).m_names;
  }

  bool TargetSet::Contains(std::string_view name) const noexcept
  {
    return std::binary_search(m_names.begin(), m_names.end(), name,
                              [](std::string_view a, std::string_view b) { return a < b; });
  }

  bool TargetSet::IsSubsetOf(const TargetSet &other) const noexcept
  {
    return std::includes(other.m_names.begin(), other.m_names.end(), m_names.begin(), m_names.end());
  }

  bool TargetSet::Intersects(const TargetSet &other) const noexcept
  {
    auto a = m_names.begin();
    auto b = other.m_names.begin();
    while (a != m_names.end() && b != other.m_names.end())
    {
      if (*a == *b)
        return true;
      if (*a < *b)
        ++a;
      else
        ++b;
    }
    return false;
  }

  TargetSet TargetSet::Intersect(const TargetSet &other) const
  {
    TargetSet out;
    std::set_intersection(m_names.begin(), m_names.end(), other.m_names.begin(), other.m_names.end(),
                          std::back_inserter(out.m_names));
    return out;
  }

  TargetSet TargetSet::Difference(const TargetSet &other) const
  {
    TargetSet out;
    std::set_difference(m_names.begin(), m_names.end(), other.m_names.begin(), other.m_names.end(),
                        std::back_inserter(out.m_names));
    return out;
  }

  std::string TargetSet::ToString() const
  {
    std::string out{"["};
    for (std::size_t i = 0; i < m_names.size(); ++i)
    {
      if (i)
        out.append(", ");
      out.append(m_names[i]);
    }
    out.push_back(']');
    return out;
  }

} // namespace NGIN::AbiDump
