// Types.hpp
// Public-facing error codes and diagnostic records of the ABI dump engine
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/AbiDump/Export.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace NGIN::AbiDump
{

  enum class ErrorCode : unsigned
  {
    Parse = 1,
    Conflict = 2,
    Render = 3,
    Inference = 4,
    InvalidArgument = 5,
    UnsupportedTarget = 6,
    UnsupportedSignatureVersion = 7,
    Io = 8,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};
    NGIN::UInt32 line{0}; // 1-based source line for text errors, 0 otherwise

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
    Error(ErrorCode c, std::string m, NGIN::UInt32 l) : code(c), message(std::move(m)), line(l) {}
  };

  [[nodiscard]] NGIN_ABIDUMP_API std::string_view ToString(ErrorCode code) noexcept;

  // "parse error (line 3): unclosed block"
  [[nodiscard]] NGIN_ABIDUMP_API std::string Describe(const Error &error);

  enum class Severity : unsigned char
  {
    Note = 0,
    Warning = 1,
  };

  struct Diagnostic
  {
    Severity severity{Severity::Warning};
    std::string message{};
  };

  // Non-fatal findings reported back to the caller; the engine itself never prints.
  struct Diagnostics
  {
    NGIN::Containers::Vector<Diagnostic> entries;

    void Note(std::string message) { entries.PushBack(Diagnostic{Severity::Note, std::move(message)}); }
    void Warn(std::string message) { entries.PushBack(Diagnostic{Severity::Warning, std::move(message)}); }

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return entries.Size(); }
    [[nodiscard]] bool HasWarnings() const noexcept
    {
      for (NGIN::UIntSize i = 0; i < entries.Size(); ++i)
        if (entries[i].severity == Severity::Warning)
          return true;
      return false;
    }
  };

  using ExpectedVoid = std::expected<void, Error>;
  using ExpectedText = std::expected<std::string, Error>;

} // namespace NGIN::AbiDump
