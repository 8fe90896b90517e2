#include <NGIN/AbiDump/Types.hpp>

namespace NGIN::AbiDump
{

  std::string_view ToString(ErrorCode code) noexcept
  {
    switch (code)
    {
      case ErrorCode::Parse: return "parse error";
      case ErrorCode::Conflict: return "conflict";
      case ErrorCode::Render: return "render error";
      case ErrorCode::Inference: return "inference error";
      case ErrorCode::InvalidArgument: return "invalid argument";
      case ErrorCode::UnsupportedTarget: return "unsupported target";
      case ErrorCode::UnsupportedSignatureVersion: return "unsupported signature version";
      case ErrorCode::Io: return "i/o error";
    }
    return "error";
  }

  std::string Describe(const Error &error)
  {
    std::string out{ToString(error.code)};
    if (error.line != 0)
    {
      out.append(" (line ");
      out.append(std::to_string(error.line));
      out.push_back(')');
    }
    out.append(": ");
    out.append(error.message);
    return out;
  }

} // namespace NGIN::AbiDump
