#include <NGIN/AbiDump/Inference.hpp>
#include <NGIN/AbiDump/AbiDumpMerger.hpp>
#include <NGIN/AbiDump/TargetHierarchy.hpp>

namespace NGIN::AbiDump
{
  namespace
  {
    std::string JoinNames(const TargetSet &targets)
    {
      std::string out{"["};
      bool first = true;
      for (const auto &name : targets)
      {
        if (!first)
          out.push_back(',');
        out.append(name);
        first = false;
      }
      out.push_back(']');
      return out;
    }
  } // namespace

  std::expected<TargetSet, Error> FindMatchingTargets(std::string_view unsupportedTarget, const TargetSet &supportedTargets)
  {
    std::optional<std::string_view> group = unsupportedTarget;
    while (group)
    {
      auto matching = TargetHierarchy::Targets(*group).Intersect(supportedTargets);
      if (!matching.IsEmpty())
        return matching;
      group = TargetHierarchy::Parent(*group);
    }
    const std::string name{unsupportedTarget};
    return std::unexpected(Error{ErrorCode::Inference, "The target " + name +
                                                           " is not supported by the host compiler and there are no "
                                                           "targets similar to " +
                                                           name + " to infer a dump from it."});
  }

  std::expected<InferenceResult, Error> InferAbiForUnsupportedTarget(const InferenceRequest &request)
  {
    const auto &target = request.unsupportedTarget;
    if (target.name.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "unsupported target name is empty"});
    if (!request.dumps)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "no dump provider was supplied"});

    auto matching = FindMatchingTargets(target.Name(), request.supportedTargets);
    if (!matching)
      return std::unexpected(matching.error());

    InferenceResult result;
    result.donorTargets = std::move(*matching);

    AbiDumpMerger common;
    for (const auto &name : result.donorTargets)
    {
      const Target donor{name};
      auto text = request.dumps(donor);
      if (!text)
        return std::unexpected(text.error());
      if (auto added = common.AddIndividualDump(donor, *text); !added)
        return std::unexpected(added.error());
    }
    common.RetainCommonAbi();

    if (request.image)
    {
      if (!request.image->empty())
      {
        AbiDumpMerger image;
        if (auto loaded = image.LoadMergedDump(*request.image); !loaded)
          return std::unexpected(loaded.error());
        image.RetainTargetSpecificAbi(target);
        if (auto merged = common.MergeTargetSpecific(image); !merged)
          return std::unexpected(merged.error());
      }
      else
      {
        result.diagnostics.Warn("Project's ABI file exists, but empty. The file will be ignored during ABI dump "
                                "inference for the unsupported target " +
                                target.name);
      }
    }

    if (auto overridden = common.OverrideTargets(TargetSet::Of(target)); !overridden)
      return std::unexpected(overridden.error());

    auto rendered = common.DumpToString(DumpFormat{.includeTargets = false});
    if (!rendered)
      return std::unexpected(rendered.error());
    result.dump = std::move(*rendered);

    result.diagnostics.Warn("An ABI dump for target " + target.name + " was inferred from the ABI generated for target " +
                            JoinNames(result.donorTargets) +
                            " as the former target is not supported by the host compiler. Inferred dump may not "
                            "reflect actual ABI for the target " +
                            target.name +
                            ". It is recommended to regenerate the dump on the host supporting all required "
                            "compilation target.");
    return result;
  }

} // namespace NGIN::AbiDump
