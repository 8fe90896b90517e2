// AbiDumpMerger.hpp
// Multi-target ABI dump document: merge, projection and rendering
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/AbiDump/Export.hpp>
#include <NGIN/AbiDump/Target.hpp>
#include <NGIN/AbiDump/Types.hpp>

#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace NGIN::AbiDump
{

  struct DumpFormat
  {
    // false is only valid for a document with exactly one target.
    bool includeTargets{true};
    // Print hierarchy group names instead of target lists where they match exactly.
    bool useGroupAliases{false};
  };

  enum class MergerState : NGIN::UInt8
  {
    Empty = 0,
    Populated = 1,
    Projected = 2,
  };

  struct DeclarationView
  {
    std::string_view signature;
    NGIN::UInt32 depth{0};
    const TargetSet *targets{nullptr};
  };

  /**
   * Owns one ABI document: a tree of declarations, each annotated with the
   * targets it exists for, plus the set of every target contributed so far.
   *
   * Declarations are stored in an arena and addressed by index; a
   * declaration's identity is its interned signature text together with its
   * parent. Projections prune the arena and compact it.
   *
   * Not internally synchronized. Independent mergers may live on different
   * threads.
   */
  class NGIN_ABIDUMP_API AbiDumpMerger
  {
  public:
    AbiDumpMerger();
    ~AbiDumpMerger();
    // The source is left as a fresh, empty merger.
    AbiDumpMerger(AbiDumpMerger &&other);
    AbiDumpMerger &operator=(AbiDumpMerger &&other);
    AbiDumpMerger(const AbiDumpMerger &) = delete;
    AbiDumpMerger &operator=(const AbiDumpMerger &) = delete;

    // Merge one single-target dump. Leading comment lines form the header, which every dump
    // must share. The document is left untouched on failure.
    ExpectedVoid AddIndividualDump(const Target &target, std::string_view source);

    // Load a rendered multi-target dump into an empty merger, expanding group aliases.
    ExpectedVoid LoadMergedDump(std::string_view source);

    // Keep only declarations present for every target of the document.
    void RetainCommonAbi();

    // Keep declarations specific to `target` (plus their enclosing declarations), all relabeled to it.
    void RetainTargetSpecificAbi(const Target &target);

    // Splice a single-target merger's declarations into this document.
    ExpectedVoid MergeTargetSpecific(const AbiDumpMerger &other);

    // Relabel every declaration, and the document itself, with `targets`.
    ExpectedVoid OverrideTargets(const TargetSet &targets);

    // Drop targets everywhere; declarations left without targets are pruned.
    void RemoveTargets(const TargetSet &targets);

    ExpectedVoid Dump(std::ostream &sink, const DumpFormat &format = {}) const;
    [[nodiscard]] ExpectedText DumpToString(const DumpFormat &format = {}) const;

    [[nodiscard]] const TargetSet &Targets() const noexcept;
    [[nodiscard]] MergerState GetState() const noexcept { return m_state; }
    [[nodiscard]] bool IsEmpty() const noexcept { return m_state == MergerState::Empty; }
    // Whether the loaded text carried per-declaration target annotations.
    [[nodiscard]] bool HadTargetAnnotations() const noexcept { return m_hadTargetAnnotations; }
    [[nodiscard]] NGIN::UIntSize DeclarationCount() const noexcept;

    // Target set of the declaration reached by following signatures from the top level, or nullptr.
    [[nodiscard]] const TargetSet *FindTargets(std::initializer_list<std::string_view> path) const;

    // Pre-order walk in rendering order.
    void ForEachDeclaration(const std::function<void(const DeclarationView &)> &visitor) const;

    // Same targets and same declaration trees, sibling order ignored.
    [[nodiscard]] bool HasSameDeclarations(const AbiDumpMerger &other) const;

  private:
    struct Document;

    enum class Origin : NGIN::UInt8
    {
      None = 0,
      Individual = 1,
      Merged = 2,
    };

    std::unique_ptr<Document> m_document;
    MergerState m_state{MergerState::Empty};
    Origin m_origin{Origin::None};
    bool m_hadTargetAnnotations{false};
  };

} // namespace NGIN::AbiDump
