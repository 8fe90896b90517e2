#include <NGIN/AbiDump/DumpFilters.hpp>

#include <algorithm>
#include <sstream>

namespace NGIN::AbiDump
{
  namespace
  {
    std::string ClassNameToCompound(std::string_view name)
    {
      if (name.empty())
        return {};

      std::vector<std::string> segments;
      std::string segment;
      for (std::size_t i = 0; i < name.size(); ++i)
      {
        const char c = name[i];
        if (c != '$' || segment.empty() || i == name.size() - 1)
        {
          segment.push_back(c);
          continue;
        }
        // "Outer$$Inner": the second '$' stays with the segment it follows.
        if (segment.back() == '$')
        {
          segment.push_back(c);
          continue;
        }
        segments.push_back(std::move(segment));
        segment.clear();
      }
      if (!segment.empty())
        segments.push_back(std::move(segment));

      std::string out;
      for (std::size_t i = 0; i < segments.size(); ++i)
      {
        if (i)
          out.push_back('.');
        out.append(segments[i]);
      }
      return out;
    }

    bool IsBlank(std::string_view s) noexcept
    {
      return std::all_of(s.begin(), s.end(), [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; });
    }

    template<typename Set>
    std::vector<QualifiedName> ToQualifiedNames(const Set &names)
    {
      std::vector<QualifiedName> out;
      for (const auto &name : names)
        if (auto q = ToQualifiedName(name))
          out.push_back(std::move(*q));
      return out;
    }

    bool InPackage(std::string_view package, std::string_view excluded) noexcept
    {
      if (package.size() < excluded.size() || package.substr(0, excluded.size()) != excluded)
        return false;
      return package.size() == excluded.size() || package[excluded.size()] == '.';
    }

    struct RuleMatcher
    {
      const AbiDeclaration &decl;

      bool operator()(const ExcludedClasses &rule) const
      {
        if (decl.kind != DeclarationKind::Class)
          return false;
        return std::find(rule.names.begin(), rule.names.end(), decl.qualifiedName) != rule.names.end();
      }

      bool operator()(const NonPublicMarkers &rule) const
      {
        for (const auto &annotation : decl.annotations)
          if (std::find(rule.names.begin(), rule.names.end(), annotation) != rule.names.end())
            return true;
        return false;
      }

      bool operator()(const ExcludedPackages &rule) const
      {
        for (const auto &package : rule.packages)
          if (InPackage(decl.qualifiedName.packageName, package))
            return true;
        return false;
      }
    };

    void RenderDeclaration(std::ostringstream &out, const AbiDeclaration &decl, NGIN::UInt32 version,
                           std::span<const ExclusionRule> rules, NGIN::UInt32 depth)
    {
      if (IsExcluded(decl, rules))
        return;
      const std::string indent(depth * 4, ' ');
      const auto signature = decl.signatures.find(version);
      const bool isClass = decl.kind == DeclarationKind::Class;

      out << indent << decl.text;
      if (isClass)
        out << " {";
      if (signature != decl.signatures.end() && !signature->second.empty())
        out << " // " << signature->second;
      out << '\n';

      for (const auto &member : decl.members)
        RenderDeclaration(out, member, version, rules, depth + 1);
      if (isClass)
        out << indent << "}\n";
    }
  } // namespace

  std::string QualifiedName::ToString() const
  {
    return packageName + "/" + className;
  }

  std::optional<QualifiedName> ToQualifiedName(std::string_view binaryName)
  {
    if (IsBlank(binaryName) || binaryName.find('/') != std::string_view::npos)
      return std::nullopt;
    const auto dot = binaryName.rfind('.');
    if (dot == std::string_view::npos)
      return QualifiedName{std::string{}, ClassNameToCompound(binaryName)};
    return QualifiedName{std::string{binaryName.substr(0, dot)}, ClassNameToCompound(binaryName.substr(dot + 1))};
  }

  DumpFilters::Builder &DumpFilters::Builder::IgnorePackage(std::string_view packageName)
  {
    m_packages.emplace(packageName);
    return *this;
  }

  DumpFilters::Builder &DumpFilters::Builder::IgnoreClass(std::string_view binaryName)
  {
    m_classes.emplace(binaryName);
    return *this;
  }

  DumpFilters::Builder &DumpFilters::Builder::AddNonPublicMarker(std::string_view binaryName)
  {
    m_markers.emplace(binaryName);
    return *this;
  }

  DumpFilters::Builder &DumpFilters::Builder::WithSignatureVersion(SignatureVersion version) noexcept
  {
    m_version = version;
    return *this;
  }

  DumpFilters DumpFilters::Builder::Build() const
  {
    DumpFilters filters;
    filters.m_packages = m_packages;
    filters.m_classes = m_classes;
    filters.m_markers = m_markers;
    filters.m_version = m_version;
    return filters;
  }

  const DumpFilters &DumpFilters::Default()
  {
    static const DumpFilters filters = Builder{}.Build();
    return filters;
  }

  std::vector<ExclusionRule> DumpFilters::Rules() const
  {
    std::vector<ExclusionRule> rules;
    if (auto classes = ToQualifiedNames(m_classes); !classes.empty())
      rules.emplace_back(ExcludedClasses{std::move(classes)});
    if (auto markers = ToQualifiedNames(m_markers); !markers.empty())
      rules.emplace_back(NonPublicMarkers{std::move(markers)});
    if (!m_packages.empty())
      rules.emplace_back(ExcludedPackages{std::vector<std::string>(m_packages.begin(), m_packages.end())});
    return rules;
  }

  bool IsExcluded(const AbiDeclaration &declaration, std::span<const ExclusionRule> rules)
  {
    for (const auto &rule : rules)
      if (std::visit(RuleMatcher{declaration}, rule))
        return true;
    return false;
  }

  std::expected<NGIN::UInt32, Error> SelectSignatureVersion(const LibraryAbi &library, SignatureVersion requested)
  {
    std::vector<NGIN::UInt32> supported;
    for (const auto &v : library.signatureVersions)
      if (v.supportedByReader)
        supported.push_back(v.number);
    std::sort(supported.begin(), supported.end());
    supported.erase(std::unique(supported.begin(), supported.end()), supported.end());

    if (requested.IsLatest())
    {
      if (supported.empty())
        return std::unexpected(Error{ErrorCode::UnsupportedSignatureVersion, "Can't choose signatureVersion"});
      return supported.back();
    }
    if (std::binary_search(supported.begin(), supported.end(), requested.Number()))
      return requested.Number();

    std::string list{"["};
    for (std::size_t i = 0; i < supported.size(); ++i)
    {
      if (i)
        list.append(", ");
      list.append(std::to_string(supported[i]));
    }
    list.push_back(']');
    return std::unexpected(Error{ErrorCode::UnsupportedSignatureVersion,
                                 "Unsupported KLib signature version '" + std::to_string(requested.Number()) +
                                     "'. Supported versions are: " + list});
  }

  ExpectedText RenderLibraryAbi(const LibraryAbi &library, const DumpFilters &filters)
  {
    auto version = SelectSignatureVersion(library, filters.Version());
    if (!version)
      return std::unexpected(version.error());
    const auto rules = filters.Rules();

    std::ostringstream out;
    out << "// Rendering settings:\n";
    out << "// - Signature version: " << *version << '\n';
    out << "// - Show manifest properties: true\n";
    out << "// - Show declarations: true\n";
    out << '\n';
    out << "// Library unique name: <" << library.uniqueName << ">\n";
    for (const auto &decl : library.declarations)
      RenderDeclaration(out, decl, *version, rules, 0);
    return out.str();
  }

  ExpectedText DumpLibrary(const AbiReader &reader, const std::filesystem::path &library, const DumpFilters &filters)
  {
    std::error_code ec;
    if (!std::filesystem::exists(library, ec))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   "File does not exist: " + std::filesystem::absolute(library, ec).string()});
    const auto rules = filters.Rules();
    auto abi = reader.Read(library, rules);
    if (!abi)
      return std::unexpected(abi.error());
    return RenderLibraryAbi(*abi, filters);
  }

} // namespace NGIN::AbiDump
