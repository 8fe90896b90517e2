#include <NGIN/AbiDump/Validation.hpp>
#include <NGIN/AbiDump/AbiDumpMerger.hpp>
#include <NGIN/AbiDump/GroupAliasCompressor.hpp>

#include <algorithm>

namespace NGIN::AbiDump
{
  namespace
  {
    // Cells above this fall back to a whole-block replacement.
    constexpr std::size_t kMaxDiffCells = std::size_t{1} << 24;

    bool UseGroupAliases(bool requested, const TargetSet &targets, Diagnostics &diagnostics)
    {
      if (!requested)
        return false;
      const auto clashing = GroupAliasCompressor::ClashingTargets(targets);
      if (clashing.IsEmpty())
        return true;
      diagnostics.Note("group aliases disabled: targets " + clashing.ToString() +
                       " have the same names as target groups");
      return false;
    }

    std::vector<std::string_view> SplitLines(std::string_view text)
    {
      std::vector<std::string_view> lines;
      std::size_t pos = 0;
      while (pos < text.size())
      {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos)
          end = text.size();
        auto line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r')
          line.remove_suffix(1);
        lines.push_back(line);
        pos = end + 1;
      }
      return lines;
    }
  } // namespace

  std::expected<MergeResult, Error> MergeIndividualDumps(const MergeRequest &request)
  {
    AbiDumpMerger merger;
    for (const auto &[target, text] : request.dumps)
      if (auto added = merger.AddIndividualDump(target, text); !added)
        return std::unexpected(added.error());

    MergeResult result;
    result.targets = merger.Targets();
    result.usedGroupAliases = UseGroupAliases(request.groupTargetNames, result.targets, result.diagnostics);
    auto rendered = merger.DumpToString(DumpFormat{.includeTargets = true, .useGroupAliases = result.usedGroupAliases});
    if (!rendered)
      return std::unexpected(rendered.error());
    result.dump = std::move(*rendered);
    return result;
  }

  std::expected<PreparedReference, Error> PrepareReferenceDump(std::string_view reference, const TargetSet &supportedTargets,
                                                               const ValidationOptions &options)
  {
    AbiDumpMerger merger;
    if (auto loaded = merger.LoadMergedDump(reference); !loaded)
      return std::unexpected(loaded.error());

    PreparedReference result;
    result.removedTargets = merger.Targets().Difference(supportedTargets);
    if (!result.removedTargets.IsEmpty())
    {
      if (options.strictValidation)
        return std::unexpected(Error{ErrorCode::UnsupportedTarget,
                                     "Validation could not be performed as targets " + result.removedTargets.ToString() +
                                         " are not supported by the host compiler and the strict validation mode "
                                         "was enabled."});
      merger.RemoveTargets(result.removedTargets);
      result.diagnostics.Warn("Targets " + result.removedTargets.ToString() +
                              " are not supported by the host compiler and were excluded from validation.");
    }
    if (merger.IsEmpty())
      return std::unexpected(Error{ErrorCode::UnsupportedTarget,
                                   "none of the reference dump's targets are supported by the host compiler"});

    const bool aliases = UseGroupAliases(options.groupTargetNames, merger.Targets(), result.diagnostics);
    auto rendered = merger.DumpToString(DumpFormat{.includeTargets = true, .useGroupAliases = aliases});
    if (!rendered)
      return std::unexpected(rendered.error());
    result.dump = std::move(*rendered);
    return result;
  }

  std::string DumpComparison::ToString() const
  {
    std::string out;
    for (const auto &line : lines)
    {
      out.push_back(line.kind == DiffKind::Removed ? '-' : '+');
      out.append(line.text);
      out.push_back('\n');
    }
    return out;
  }

  DumpComparison CompareDumps(std::string_view expected, std::string_view actual)
  {
    const auto a = SplitLines(expected);
    const auto b = SplitLines(actual);

    std::size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix])
      ++prefix;
    std::size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix])
      ++suffix;

    const std::size_t n = a.size() - prefix - suffix;
    const std::size_t m = b.size() - prefix - suffix;

    DumpComparison result;
    result.equal = n == 0 && m == 0;
    if (result.equal)
      return result;

    auto removed = [&](std::size_t i) { result.lines.push_back(DiffLine{DiffKind::Removed, std::string{a[prefix + i]}}); };
    auto added = [&](std::size_t j) { result.lines.push_back(DiffLine{DiffKind::Added, std::string{b[prefix + j]}}); };

    if (n == 0 || m == 0 || (n + 1) * (m + 1) > kMaxDiffCells)
    {
      for (std::size_t i = 0; i < n; ++i)
        removed(i);
      for (std::size_t j = 0; j < m; ++j)
        added(j);
      return result;
    }

    // lcs[i][j]: longest common subsequence of a[i..n) and b[j..m).
    const std::size_t width = m + 1;
    std::vector<NGIN::UInt32> lcs((n + 1) * width, 0);
    for (std::size_t i = n; i-- > 0;)
      for (std::size_t j = m; j-- > 0;)
        lcs[i * width + j] = a[prefix + i] == b[prefix + j]
                                 ? lcs[(i + 1) * width + j + 1] + 1
                                 : std::max(lcs[(i + 1) * width + j], lcs[i * width + j + 1]);

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < n && j < m)
    {
      if (a[prefix + i] == b[prefix + j])
      {
        ++i;
        ++j;
      }
      else if (lcs[(i + 1) * width + j] >= lcs[i * width + j + 1])
        removed(i++);
      else
        added(j++);
    }
    for (; i < n; ++i)
      removed(i);
    for (; j < m; ++j)
      added(j);
    return result;
  }

} // namespace NGIN::AbiDump
