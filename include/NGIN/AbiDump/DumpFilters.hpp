// DumpFilters.hpp
// Declaration filters and single-target rendering of a library's ABI
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/AbiDump/Export.hpp>
#include <NGIN/AbiDump/Types.hpp>

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace NGIN::AbiDump
{

  // Package plus dotted class path ("com.example", "Outer.Inner").
  struct NGIN_ABIDUMP_API QualifiedName
  {
    std::string packageName;
    std::string className;

    // "com.example/Outer.Inner"
    [[nodiscard]] std::string ToString() const;

    bool operator==(const QualifiedName &) const = default;
  };

  /**
   * Parses a binary-form name ("com.example.Outer$Inner"). The package is
   * everything before the last '.'; '$' separates nested classes unless it
   * starts a segment, ends the name or follows another '$'. Blank names and
   * names containing '/' yield nullopt.
   */
  [[nodiscard]] NGIN_ABIDUMP_API std::optional<QualifiedName> ToQualifiedName(std::string_view binaryName);

  class SignatureVersion
  {
  public:
    // Highest version both present in the library and readable.
    [[nodiscard]] static constexpr SignatureVersion Latest() noexcept { return SignatureVersion{}; }
    [[nodiscard]] static constexpr SignatureVersion Of(NGIN::UInt32 number) noexcept
    {
      SignatureVersion v;
      v.m_number = number;
      return v;
    }

    [[nodiscard]] constexpr bool IsLatest() const noexcept { return !m_number.has_value(); }
    [[nodiscard]] constexpr NGIN::UInt32 Number() const noexcept { return m_number.value_or(0); }

    constexpr bool operator==(const SignatureVersion &) const = default;

  private:
    constexpr SignatureVersion() = default;
    std::optional<NGIN::UInt32> m_number;
  };

  struct ExcludedClasses
  {
    std::vector<QualifiedName> names;
  };

  struct NonPublicMarkers
  {
    std::vector<QualifiedName> names;
  };

  // Each entry also excludes its sub-packages.
  struct ExcludedPackages
  {
    std::vector<std::string> packages;
  };

  // Evaluated in alternative order.
  using ExclusionRule = std::variant<ExcludedClasses, NonPublicMarkers, ExcludedPackages>;

  class NGIN_ABIDUMP_API DumpFilters
  {
  public:
    class NGIN_ABIDUMP_API Builder
    {
    public:
      Builder &IgnorePackage(std::string_view packageName);
      Builder &IgnoreClass(std::string_view binaryName);
      Builder &AddNonPublicMarker(std::string_view binaryName);
      Builder &WithSignatureVersion(SignatureVersion version) noexcept;

      [[nodiscard]] DumpFilters Build() const;

    private:
      std::set<std::string> m_packages;
      std::set<std::string> m_classes;
      std::set<std::string> m_markers;
      SignatureVersion m_version{SignatureVersion::Latest()};
    };

    // No exclusions, latest signature version.
    [[nodiscard]] static const DumpFilters &Default();

    [[nodiscard]] const std::set<std::string> &IgnoredPackages() const noexcept { return m_packages; }
    [[nodiscard]] const std::set<std::string> &IgnoredClasses() const noexcept { return m_classes; }
    [[nodiscard]] const std::set<std::string> &NonPublicMarkerNames() const noexcept { return m_markers; }
    [[nodiscard]] SignatureVersion Version() const noexcept { return m_version; }

    // Names that do not parse as qualified names are dropped; empty rules are omitted.
    [[nodiscard]] std::vector<ExclusionRule> Rules() const;

  private:
    DumpFilters() = default;

    std::set<std::string> m_packages;
    std::set<std::string> m_classes;
    std::set<std::string> m_markers;
    SignatureVersion m_version{SignatureVersion::Latest()};
  };

  struct SignatureVersionInfo
  {
    NGIN::UInt32 number{0};
    bool supportedByReader{true};
  };

  enum class DeclarationKind : NGIN::UInt8
  {
    Class = 0,
    Function = 1,
    Property = 2,
    EnumEntry = 3,
  };

  struct AbiDeclaration
  {
    DeclarationKind kind{DeclarationKind::Function};
    QualifiedName qualifiedName;
    std::string text; // rendered declaration without its signature
    std::vector<QualifiedName> annotations;
    std::map<NGIN::UInt32, std::string> signatures; // by signature version
    std::vector<AbiDeclaration> members;
  };

  // What an ABI reader extracts from one compiled library.
  struct LibraryAbi
  {
    std::string uniqueName;
    std::vector<SignatureVersionInfo> signatureVersions;
    std::vector<AbiDeclaration> declarations;
  };

  /**
   * Boundary to the component that decodes compiled libraries. Readers may
   * apply the rules themselves; rendering applies them again.
   */
  class NGIN_ABIDUMP_API AbiReader
  {
  public:
    virtual ~AbiReader() = default;
    [[nodiscard]] virtual std::expected<LibraryAbi, Error> Read(const std::filesystem::path &library,
                                                                std::span<const ExclusionRule> rules) const = 0;
  };

  [[nodiscard]] NGIN_ABIDUMP_API bool IsExcluded(const AbiDeclaration &declaration, std::span<const ExclusionRule> rules);

  [[nodiscard]] NGIN_ABIDUMP_API std::expected<NGIN::UInt32, Error> SelectSignatureVersion(const LibraryAbi &library,
                                                                                           SignatureVersion requested);

  // Renders a single-target dump of the declarations surviving `filters`.
  [[nodiscard]] NGIN_ABIDUMP_API ExpectedText RenderLibraryAbi(const LibraryAbi &library, const DumpFilters &filters);

  // Reads `library` through `reader` and renders it. The file must exist.
  [[nodiscard]] NGIN_ABIDUMP_API ExpectedText DumpLibrary(const AbiReader &reader, const std::filesystem::path &library,
                                                          const DumpFilters &filters = DumpFilters::Default());

} // namespace NGIN::AbiDump
