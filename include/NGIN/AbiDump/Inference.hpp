// Inference.hpp
// Reconstructs a plausible ABI dump for a target the host cannot build
#pragma once

#include <NGIN/AbiDump/Export.hpp>
#include <NGIN/AbiDump/Target.hpp>
#include <NGIN/AbiDump/Types.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace NGIN::AbiDump
{

  // Returns the single-target dump generated for a supported target.
  using DumpProvider = std::function<ExpectedText(const Target &)>;

  struct InferenceRequest
  {
    Target unsupportedTarget;
    TargetSet supportedTargets;
    DumpProvider dumps;
    // Previously committed merged dump. nullopt when there is none; "" for an empty file.
    std::optional<std::string> image;
  };

  struct InferenceResult
  {
    std::string dump; // single-target text, no target annotations
    TargetSet donorTargets;
    Diagnostics diagnostics;
  };

  /**
   * Walks up the hierarchy from `unsupportedTarget` and returns the supported
   * targets of the first group that has any. Fails with ErrorCode::Inference
   * once the root is passed without a match.
   */
  [[nodiscard]] NGIN_ABIDUMP_API std::expected<TargetSet, Error> FindMatchingTargets(std::string_view unsupportedTarget,
                                                                                     const TargetSet &supportedTargets);

  [[nodiscard]] NGIN_ABIDUMP_API std::expected<InferenceResult, Error> InferAbiForUnsupportedTarget(
      const InferenceRequest &request);

} // namespace NGIN::AbiDump
