// DumpFiles.hpp
// File-system boundary for dump files
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/AbiDump/Export.hpp>
#include <NGIN/AbiDump/Types.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace NGIN::AbiDump
{

  enum class DumpFileState : NGIN::UInt8
  {
    Missing = 0,
    Empty = 1,
    Present = 2,
  };

  [[nodiscard]] NGIN_ABIDUMP_API DumpFileState ProbeDumpFile(const std::filesystem::path &path);

  [[nodiscard]] NGIN_ABIDUMP_API ExpectedText ReadDumpFile(const std::filesystem::path &path);

  // Prior image for inference: nullopt when the file does not exist.
  [[nodiscard]] NGIN_ABIDUMP_API std::expected<std::optional<std::string>, Error> ReadImage(
      const std::filesystem::path &path);

  // Creates missing parent directories.
  NGIN_ABIDUMP_API ExpectedVoid WriteDumpFile(const std::filesystem::path &path, std::string_view text);

} // namespace NGIN::AbiDump
