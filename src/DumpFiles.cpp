#include <NGIN/AbiDump/DumpFiles.hpp>

#include <fstream>
#include <iterator>
#include <system_error>

namespace NGIN::AbiDump
{

  DumpFileState ProbeDumpFile(const std::filesystem::path &path)
  {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
      return DumpFileState::Missing;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0)
      return DumpFileState::Empty;
    return DumpFileState::Present;
  }

  ExpectedText ReadDumpFile(const std::filesystem::path &path)
  {
    std::ifstream in(path, std::ios::binary);
    if (!in)
      return std::unexpected(Error{ErrorCode::Io, "cannot open '" + path.string() + "' for reading"});
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
      return std::unexpected(Error{ErrorCode::Io, "failed to read '" + path.string() + "'"});
    return text;
  }

  std::expected<std::optional<std::string>, Error> ReadImage(const std::filesystem::path &path)
  {
    switch (ProbeDumpFile(path))
    {
    case DumpFileState::Missing:
      return std::optional<std::string>{};
    case DumpFileState::Empty:
      return std::optional<std::string>{std::string{}};
    case DumpFileState::Present:
      break;
    }
    auto text = ReadDumpFile(path);
    if (!text)
      return std::unexpected(text.error());
    return std::optional<std::string>{std::move(*text)};
  }

  ExpectedVoid WriteDumpFile(const std::filesystem::path &path, std::string_view text)
  {
    std::error_code ec;
    if (path.has_parent_path())
    {
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec)
        return std::unexpected(Error{ErrorCode::Io, "cannot create '" + path.parent_path().string() + "': " + ec.message()});
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
      return std::unexpected(Error{ErrorCode::Io, "cannot open '" + path.string() + "' for writing"});
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out)
      return std::unexpected(Error{ErrorCode::Io, "failed to write '" + path.string() + "'"});
    return {};
  }

} // namespace NGIN::AbiDump
