#pragma once

#include <string_view>

#include <NGIN/AbiDump/Export.hpp>
#include <NGIN/AbiDump/Types.hpp>
#include <NGIN/AbiDump/Target.hpp>
#include <NGIN/AbiDump/TargetHierarchy.hpp>
#include <NGIN/AbiDump/GroupAliasCompressor.hpp>
#include <NGIN/AbiDump/AbiDumpMerger.hpp>
#include <NGIN/AbiDump/DumpFilters.hpp>
#include <NGIN/AbiDump/Inference.hpp>
#include <NGIN/AbiDump/Validation.hpp>
#include <NGIN/AbiDump/DumpFiles.hpp>

namespace NGIN::AbiDump
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.AbiDump"; }

} // namespace NGIN::AbiDump
