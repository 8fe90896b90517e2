#include <NGIN/AbiDump/DumpText.hpp>

#include <string>
#include <vector>

namespace NGIN::AbiDump::detail
{
  namespace
  {
    std::string_view TrimRight(std::string_view s) noexcept
    {
      while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
      return s;
    }

    std::string_view Trim(std::string_view s) noexcept
    {
      s = TrimRight(s);
      while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
      return s;
    }

    Error ParseError(std::string message, NGIN::UInt32 line)
    {
      return Error{ErrorCode::Parse, std::move(message), line};
    }

    bool IsComment(std::string_view trimmed) noexcept
    {
      return trimmed.starts_with("//");
    }

    std::expected<ParsedAlias, Error> ParseAliasLine(std::string_view body, NGIN::UInt32 line)
    {
      const auto arrow = body.find(kAliasArrow);
      if (arrow == std::string_view::npos)
        return std::unexpected(ParseError("malformed alias header", line));
      ParsedAlias alias{};
      alias.name = Trim(body.substr(0, arrow));
      alias.line = line;
      if (alias.name.empty())
        return std::unexpected(ParseError("alias without a name", line));
      auto names = ParseNameList(Trim(body.substr(arrow + kAliasArrow.size())), line);
      if (!names)
        return std::unexpected(names.error());
      if (names->Size() == 0)
        return std::unexpected(ParseError("alias '" + std::string{alias.name} + "' lists no targets", line));
      alias.targets = std::move(*names);
      return alias;
    }
  } // namespace

  bool OpensBlock(std::string_view text) noexcept
  {
    const auto comment = text.find(" // ");
    auto code = TrimRight(comment == std::string_view::npos ? text : text.substr(0, comment));
    return !code.empty() && code.back() == '{';
  }

  std::expected<NGIN::Containers::Vector<std::string_view>, Error> ParseNameList(std::string_view list, NGIN::UInt32 line)
  {
    list = Trim(list);
    if (list.size() < 2 || list.front() != '[' || list.back() != ']')
      return std::unexpected(ParseError("expected a bracketed target list", line));
    list = Trim(list.substr(1, list.size() - 2));

    NGIN::Containers::Vector<std::string_view> names;
    if (list.empty())
      return names;
    while (true)
    {
      const auto comma = list.find(',');
      auto name = Trim(comma == std::string_view::npos ? list : list.substr(0, comma));
      if (name.empty())
        return std::unexpected(ParseError("empty name in target list", line));
      names.PushBack(name);
      if (comma == std::string_view::npos)
        break;
      list.remove_prefix(comma + 1);
    }
    return names;
  }

  std::expected<ParsedDump, Error> ParseDump(std::string_view source, DumpKind kind)
  {
    ParsedDump out{};
    std::vector<NGIN::UInt32> open; // indices of declarations whose block is still open
    bool seenDeclaration = false;
    NGIN::UInt32 pendingBlanks = 0; // blank lines inside the header, written once another header line follows
    NGIN::UInt32 lineNo = 0;

    while (!source.empty())
    {
      const auto eol = source.find('\n');
      auto raw = eol == std::string_view::npos ? source : source.substr(0, eol);
      source.remove_prefix(eol == std::string_view::npos ? source.size() : eol + 1);
      ++lineNo;

      raw = TrimRight(raw);
      const auto trimmed = Trim(raw);
      if (trimmed.empty())
      {
        if (!seenDeclaration && out.header.Size() != 0)
          ++pendingBlanks;
        continue;
      }

      if (IsComment(trimmed))
      {
        if (seenDeclaration)
          continue;
        if (kind == DumpKind::Merged && trimmed == kDumpTitle)
          continue;
        if (kind == DumpKind::Merged && trimmed.starts_with(kTargetsHeader))
        {
          if (out.hasTargetsHeader)
            return std::unexpected(ParseError("duplicate targets header", lineNo));
          auto names = ParseNameList(trimmed.substr(kTargetsHeader.size()), lineNo);
          if (!names)
            return std::unexpected(names.error());
          out.hasTargetsHeader = true;
          out.headerTargets = std::move(*names);
        }
        else if (kind == DumpKind::Merged && trimmed.starts_with(kAliasHeader))
        {
          auto alias = ParseAliasLine(trimmed.substr(kAliasHeader.size()), lineNo);
          if (!alias)
            return std::unexpected(alias.error());
          out.aliases.PushBack(std::move(*alias));
        }
        else
        {
          for (; pendingBlanks > 0; --pendingBlanks)
            out.header.PushBack(std::string_view{});
          out.header.PushBack(trimmed);
        }
        continue;
      }

      NGIN::UInt32 spaces = 0;
      while (spaces < raw.size() && (raw[spaces] == ' ' || raw[spaces] == '\t'))
      {
        if (raw[spaces] == '\t')
          return std::unexpected(ParseError("tab in indentation", lineNo));
        ++spaces;
      }
      if (spaces % kIndentWidth != 0)
        return std::unexpected(ParseError("indentation is not a multiple of four spaces", lineNo));
      const auto depth = static_cast<NGIN::UInt32>(spaces / kIndentWidth);

      if (trimmed == kBlockClose)
      {
        if (open.empty() || depth + 1 != open.size())
          return std::unexpected(ParseError("unbalanced '}'", lineNo));
        open.pop_back();
        continue;
      }

      if (depth > open.size())
        return std::unexpected(ParseError("declaration is nested deeper than its enclosing block", lineNo));
      if (depth < open.size())
        return std::unexpected(ParseError("block opened at line " +
                                              std::to_string(out.declarations[open.back()].line) +
                                              " is not closed",
                                          lineNo));

      ParsedDeclaration decl{};
      decl.text = trimmed;
      decl.line = lineNo;
      decl.parent = open.empty() ? kNoParent : open.back();

      const auto suffix = trimmed.rfind(kTargetsSuffix);
      if (suffix != std::string_view::npos && trimmed.back() == ']')
      {
        if (kind == DumpKind::SingleTarget)
          return std::unexpected(ParseError("target annotation in a single-target dump", lineNo));
        auto names = ParseNameList(trimmed.substr(suffix + kTargetsSuffix.size()), lineNo);
        if (!names)
          return std::unexpected(names.error());
        if (names->Size() == 0)
          return std::unexpected(ParseError("declaration annotated with no targets", lineNo));
        decl.text = TrimRight(trimmed.substr(0, suffix));
        decl.annotated = true;
        decl.targetNames = std::move(*names);
        out.anyAnnotated = true;
      }
      if (decl.text.empty())
        return std::unexpected(ParseError("declaration without a signature", lineNo));

      const auto index = static_cast<NGIN::UInt32>(out.declarations.Size());
      const bool opens = OpensBlock(decl.text);
      if (decl.parent == kNoParent)
        out.roots.PushBack(index);
      else
        out.declarations[decl.parent].children.PushBack(index);
      out.declarations.PushBack(std::move(decl));
      if (opens)
        open.push_back(index);
      seenDeclaration = true;
    }

    if (!open.empty())
      return std::unexpected(ParseError("block opened at line " +
                                            std::to_string(out.declarations[open.back()].line) +
                                            " is not closed",
                                        lineNo));
    return out;
  }

} // namespace NGIN::AbiDump::detail
