#include <NGIN/AbiDump/AbiDumpMerger.hpp>
#include <NGIN/AbiDump/DumpText.hpp>
#include <NGIN/AbiDump/GroupAliasCompressor.hpp>
#include <NGIN/AbiDump/TargetHierarchy.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <map>
#include <optional>
#include <ostream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace NGIN::AbiDump
{
  using detail::kNoParent;

  namespace
  {
    using SignatureInterner = NGIN::Utilities::StringInterner<>;
    using SignatureId = NGIN::UInt32;

    constexpr SignatureId kInvalidSignature = static_cast<SignatureId>(SignatureInterner::INVALID_ID);

    // Merge identity: (parent index, interned signature).
    constexpr NGIN::UInt64 ChildKey(NGIN::UInt32 parent, SignatureId signature) noexcept
    {
      return (static_cast<NGIN::UInt64>(parent) << 32) | static_cast<NGIN::UInt64>(signature);
    }

    ExpectedVoid CheckUniqueSiblings(const detail::ParsedDump &parsed,
                                     const NGIN::Containers::Vector<NGIN::UInt32> &siblings)
    {
      std::unordered_set<std::string_view> seen;
      for (NGIN::UIntSize i = 0; i < siblings.Size(); ++i)
      {
        const auto &decl = parsed.declarations[siblings[i]];
        if (!seen.insert(decl.text).second)
          return std::unexpected(Error{ErrorCode::Conflict,
                                       "declaration '" + std::string{decl.text} + "' appears twice in the same scope",
                                       decl.line});
        if (auto nested = CheckUniqueSiblings(parsed, decl.children); !nested)
          return nested;
      }
      return {};
    }

    std::string JoinHeader(const detail::ParsedDump &parsed)
    {
      std::string header;
      for (NGIN::UIntSize i = 0; i < parsed.header.Size(); ++i)
      {
        header.append(parsed.header[i]);
        header.push_back('\n');
      }
      return header;
    }

    void WriteIndent(std::ostream &sink, NGIN::UInt32 depth)
    {
      for (NGIN::UInt32 i = 0; i < depth * detail::kIndentWidth; ++i)
        sink.put(' ');
    }
  } // namespace

  struct AbiDumpMerger::Document
  {
    struct Node
    {
      std::string_view text; // view into `signatures`
      SignatureId signature{kInvalidSignature};
      NGIN::UInt32 parent{kNoParent};
      NGIN::UInt32 depth{0};
      NGIN::Containers::Vector<NGIN::UInt32> children;
      TargetSet targets;
    };

    SignatureInterner signatures;
    NGIN::Containers::Vector<Node> nodes;
    NGIN::Containers::Vector<NGIN::UInt32> roots;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> index;
    TargetSet targets;
    std::string header; // newline-terminated comment lines shared by every contributing dump

    [[nodiscard]] const NGIN::Containers::Vector<NGIN::UInt32> &ChildrenOf(NGIN::UInt32 parent) const
    {
      return parent == kNoParent ? roots : nodes[parent].children;
    }

    std::expected<NGIN::UInt32, Error> FindOrAdd(NGIN::UInt32 parent, std::string_view text)
    {
      const auto id = signatures.InsertOrGet(text);
      if (id == SignatureInterner::INVALID_ID)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "failed to intern signature '" + std::string{text} + "'"});
      const auto signature = static_cast<SignatureId>(id);
      if (const auto *existing = index.GetPtr(ChildKey(parent, signature)))
        return *existing;

      Node node{};
      node.signature = signature;
      node.text = signatures.View(id);
      node.parent = parent;
      node.depth = parent == kNoParent ? 0 : nodes[parent].depth + 1;

      const auto idx = static_cast<NGIN::UInt32>(nodes.Size());
      nodes.PushBack(std::move(node));
      if (parent == kNoParent)
        roots.PushBack(idx);
      else
        nodes[parent].children.PushBack(idx);
      index.Insert(ChildKey(parent, signature), idx);
      return idx;
    }

    // Rebuilds the arena from kept nodes. A node is copied only if its parent was kept.
    void Compact(const std::vector<bool> &keep)
    {
      NGIN::Containers::Vector<Node> keptNodes;
      NGIN::Containers::Vector<NGIN::UInt32> keptRoots;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> keptIndex;

      auto copy = [&](auto &self, NGIN::UInt32 old, NGIN::UInt32 newParent) -> void {
        auto &src = nodes[old];
        Node node{};
        node.text = src.text;
        node.signature = src.signature;
        node.parent = newParent;
        node.depth = src.depth;
        node.targets = std::move(src.targets);

        const auto idx = static_cast<NGIN::UInt32>(keptNodes.Size());
        keptNodes.PushBack(std::move(node));
        if (newParent == kNoParent)
          keptRoots.PushBack(idx);
        else
          keptNodes[newParent].children.PushBack(idx);
        keptIndex.Insert(ChildKey(newParent, src.signature), idx);

        for (NGIN::UIntSize i = 0; i < src.children.Size(); ++i)
          if (keep[src.children[i]])
            self(self, src.children[i], idx);
      };

      for (NGIN::UIntSize i = 0; i < roots.Size(); ++i)
        if (keep[roots[i]])
          copy(copy, roots[i], kNoParent);

      nodes = std::move(keptNodes);
      roots = std::move(keptRoots);
      index = std::move(keptIndex);
    }

    ExpectedVoid MergeParsed(const detail::ParsedDump &parsed, NGIN::UInt32 decl, NGIN::UInt32 parent,
                             const std::vector<TargetSet> &resolved)
    {
      auto node = FindOrAdd(parent, parsed.declarations[decl].text);
      if (!node)
        return std::unexpected(node.error());
      nodes[*node].targets.UnionWith(resolved[decl]);
      const auto &children = parsed.declarations[decl].children;
      for (NGIN::UIntSize i = 0; i < children.Size(); ++i)
        if (auto merged = MergeParsed(parsed, children[i], *node, resolved); !merged)
          return merged;
      return {};
    }

    ExpectedVoid MergeFrom(const Document &other, NGIN::UInt32 otherNode, NGIN::UInt32 parent)
    {
      const auto &src = other.nodes[otherNode];
      auto node = FindOrAdd(parent, src.text);
      if (!node)
        return std::unexpected(node.error());
      nodes[*node].targets.UnionWith(src.targets);
      for (NGIN::UIntSize i = 0; i < src.children.Size(); ++i)
        if (auto merged = MergeFrom(other, src.children[i], *node); !merged)
          return merged;
      return {};
    }

    void Write(std::ostream &sink, NGIN::UInt32 node, const std::vector<std::string> *suffixes) const
    {
      const auto &n = nodes[node];
      WriteIndent(sink, n.depth);
      sink << n.text;
      if (suffixes)
        sink << detail::kTargetsSuffix << (*suffixes)[node];
      sink.put('\n');
      for (NGIN::UIntSize i = 0; i < n.children.Size(); ++i)
        Write(sink, n.children[i], suffixes);
      if (detail::OpensBlock(n.text))
      {
        WriteIndent(sink, n.depth);
        sink << detail::kBlockClose << '\n';
      }
    }

    void Visit(NGIN::UInt32 node, const std::function<void(const DeclarationView &)> &visitor) const
    {
      const auto &n = nodes[node];
      visitor(DeclarationView{n.text, n.depth, &n.targets});
      for (NGIN::UIntSize i = 0; i < n.children.Size(); ++i)
        Visit(n.children[i], visitor);
    }

    static bool SameSubtrees(const Document &a, const NGIN::Containers::Vector<NGIN::UInt32> &left,
                             const Document &b, const NGIN::Containers::Vector<NGIN::UInt32> &right)
    {
      if (left.Size() != right.Size())
        return false;
      std::unordered_map<std::string_view, NGIN::UInt32> byText;
      for (NGIN::UIntSize i = 0; i < right.Size(); ++i)
        byText.emplace(b.nodes[right[i]].text, right[i]);
      for (NGIN::UIntSize i = 0; i < left.Size(); ++i)
      {
        const auto &l = a.nodes[left[i]];
        auto it = byText.find(l.text);
        if (it == byText.end())
          return false;
        const auto &r = b.nodes[it->second];
        if (l.targets != r.targets || !SameSubtrees(a, l.children, b, r.children))
          return false;
      }
      return true;
    }
  };

  AbiDumpMerger::AbiDumpMerger() : m_document(std::make_unique<Document>()) {}
  AbiDumpMerger::~AbiDumpMerger() = default;

  AbiDumpMerger::AbiDumpMerger(AbiDumpMerger &&other)
      : m_document(std::exchange(other.m_document, std::make_unique<Document>())),
        m_state(std::exchange(other.m_state, MergerState::Empty)),
        m_origin(std::exchange(other.m_origin, Origin::None)),
        m_hadTargetAnnotations(std::exchange(other.m_hadTargetAnnotations, false))
  {
  }

  AbiDumpMerger &AbiDumpMerger::operator=(AbiDumpMerger &&other)
  {
    if (this == &other)
      return *this;
    m_document = std::exchange(other.m_document, std::make_unique<Document>());
    m_state = std::exchange(other.m_state, MergerState::Empty);
    m_origin = std::exchange(other.m_origin, Origin::None);
    m_hadTargetAnnotations = std::exchange(other.m_hadTargetAnnotations, false);
    return *this;
  }

  ExpectedVoid AbiDumpMerger::AddIndividualDump(const Target &target, std::string_view source)
  {
    if (m_origin == Origin::Merged || m_state == MergerState::Projected)
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   "individual dumps can only be added before the document is loaded or projected"});
    if (target.name.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "target name is empty"});
    if (m_document->targets.Contains(target))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "a dump for target '" + target.name + "' was already added"});

    auto parsed = detail::ParseDump(source, detail::DumpKind::SingleTarget);
    if (!parsed)
      return std::unexpected(parsed.error());
    if (auto unique = CheckUniqueSiblings(*parsed, parsed->roots); !unique)
      return unique;
    auto header = JoinHeader(*parsed);
    if (!m_document->targets.IsEmpty() && header != m_document->header)
      return std::unexpected(Error{ErrorCode::Conflict, "the header of the dump for target '" + target.name +
                                                            "' differs from the header of the dumps already added"});

    const std::vector<TargetSet> resolved(parsed->declarations.Size(), TargetSet::Of(target));
    for (NGIN::UIntSize i = 0; i < parsed->roots.Size(); ++i)
      if (auto merged = m_document->MergeParsed(*parsed, parsed->roots[i], kNoParent, resolved); !merged)
        return merged;

    m_document->targets.Insert(target);
    m_document->header = std::move(header);
    m_state = MergerState::Populated;
    m_origin = Origin::Individual;
    return {};
  }

  ExpectedVoid AbiDumpMerger::LoadMergedDump(std::string_view source)
  {
    if (m_state != MergerState::Empty)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "a merged dump can only be loaded into an empty merger"});

    auto parsed = detail::ParseDump(source, detail::DumpKind::Merged);
    if (!parsed)
      return std::unexpected(parsed.error());
    if (!parsed->hasTargetsHeader)
      return std::unexpected(Error{ErrorCode::Parse, "missing '// Targets:' header", 1});

    TargetSet documentTargets;
    for (NGIN::UIntSize i = 0; i < parsed->headerTargets.Size(); ++i)
      if (!documentTargets.Insert(parsed->headerTargets[i]))
        return std::unexpected(Error{ErrorCode::Parse, "target '" + std::string{parsed->headerTargets[i]} +
                                                           "' is listed twice in the header"});
    if (documentTargets.IsEmpty())
      return std::unexpected(Error{ErrorCode::Parse, "the targets header lists no targets"});

    std::unordered_map<std::string_view, TargetSet> aliases;
    for (NGIN::UIntSize a = 0; a < parsed->aliases.Size(); ++a)
    {
      const auto &alias = parsed->aliases[a];
      if (documentTargets.Contains(alias.name))
        return std::unexpected(Error{ErrorCode::Parse, "alias '" + std::string{alias.name} + "' shadows a target", alias.line});
      TargetSet expansion;
      for (NGIN::UIntSize t = 0; t < alias.targets.Size(); ++t)
      {
        const auto name = alias.targets[t];
        if (!documentTargets.Contains(name))
          return std::unexpected(Error{ErrorCode::Parse,
                                       "alias '" + std::string{alias.name} + "' refers to unknown target '" +
                                           std::string{name} + "'",
                                       alias.line});
        expansion.Insert(name);
      }
      if (!aliases.emplace(alias.name, std::move(expansion)).second)
        return std::unexpected(Error{ErrorCode::Parse, "alias '" + std::string{alias.name} + "' is defined twice", alias.line});
    }

    auto resolveName = [&](std::string_view name, NGIN::UInt32 line) -> std::expected<TargetSet, Error> {
      if (documentTargets.Contains(name))
        return TargetSet{name};
      if (auto it = aliases.find(name); it != aliases.end())
        return it->second;
      if (TargetHierarchy::IsGroup(name))
      {
        auto expansion = TargetHierarchy::Targets(name).Intersect(documentTargets);
        if (!expansion.IsEmpty())
          return expansion;
      }
      return std::unexpected(Error{ErrorCode::Parse, "unknown target or alias '" + std::string{name} + "'", line});
    };

    // Parents always precede their children in the parsed arena.
    std::vector<TargetSet> resolved(parsed->declarations.Size());
    for (NGIN::UIntSize i = 0; i < parsed->declarations.Size(); ++i)
    {
      const auto &decl = parsed->declarations[i];
      const auto &enclosing = decl.parent == kNoParent ? documentTargets : resolved[decl.parent];
      if (!decl.annotated)
      {
        resolved[i] = enclosing;
        continue;
      }
      for (NGIN::UIntSize t = 0; t < decl.targetNames.Size(); ++t)
      {
        auto expansion = resolveName(decl.targetNames[t], decl.line);
        if (!expansion)
          return std::unexpected(expansion.error());
        resolved[i].UnionWith(*expansion);
      }
      if (!resolved[i].IsSubsetOf(enclosing))
        return std::unexpected(Error{ErrorCode::Parse,
                                     "targets " + resolved[i].ToString() +
                                         " are not a subset of the enclosing declaration's targets " +
                                         enclosing.ToString(),
                                     decl.line});
    }
    if (auto unique = CheckUniqueSiblings(*parsed, parsed->roots); !unique)
      return unique;

    auto document = std::make_unique<Document>();
    for (NGIN::UIntSize i = 0; i < parsed->roots.Size(); ++i)
      if (auto merged = document->MergeParsed(*parsed, parsed->roots[i], kNoParent, resolved); !merged)
        return merged;
    document->targets = std::move(documentTargets);
    document->header = JoinHeader(*parsed);

    m_document = std::move(document);
    m_state = MergerState::Populated;
    m_origin = Origin::Merged;
    m_hadTargetAnnotations = parsed->anyAnnotated;
    return {};
  }

  void AbiDumpMerger::RetainCommonAbi()
  {
    if (m_state == MergerState::Empty)
      return;
    auto &doc = *m_document;
    // A child's targets never exceed its parent's, so a common child always has a common parent.
    std::vector<bool> keep(doc.nodes.Size(), false);
    for (NGIN::UIntSize i = 0; i < doc.nodes.Size(); ++i)
      keep[i] = doc.nodes[i].targets == doc.targets;
    doc.Compact(keep);
    m_state = MergerState::Projected;
  }

  void AbiDumpMerger::RetainTargetSpecificAbi(const Target &target)
  {
    if (m_state == MergerState::Empty)
      return;
    auto &doc = *m_document;
    std::vector<bool> keep(doc.nodes.Size(), false);
    if (doc.targets.Contains(target))
    {
      // Children are always stored after their parents, so a reverse sweep visits them first.
      std::vector<bool> keptChild(doc.nodes.Size(), false);
      for (auto i = doc.nodes.Size(); i-- > 0;)
      {
        const auto &node = doc.nodes[i];
        keep[i] = node.targets.Contains(target) && (node.targets != doc.targets || keptChild[i]);
        if (keep[i] && node.parent != kNoParent)
          keptChild[node.parent] = true;
      }
    }
    doc.Compact(keep);

    const auto single = TargetSet::Of(target);
    for (NGIN::UIntSize i = 0; i < doc.nodes.Size(); ++i)
      doc.nodes[i].targets = single;
    doc.targets = single;
    m_state = MergerState::Projected;
  }

  ExpectedVoid AbiDumpMerger::MergeTargetSpecific(const AbiDumpMerger &other)
  {
    if (&other == this)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "cannot merge a merger into itself"});
    const auto &src = *other.m_document;
    if (src.targets.Size() != 1)
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   "target-specific merge expects a single-target dump, got " + src.targets.ToString()});

    for (NGIN::UIntSize i = 0; i < src.roots.Size(); ++i)
      if (auto merged = m_document->MergeFrom(src, src.roots[i], kNoParent); !merged)
        return merged;
    if (m_document->targets.IsEmpty())
      m_document->header = src.header;
    m_document->targets.UnionWith(src.targets);
    if (m_state == MergerState::Empty)
      m_state = MergerState::Populated;
    return {};
  }

  ExpectedVoid AbiDumpMerger::OverrideTargets(const TargetSet &targets)
  {
    if (targets.IsEmpty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "cannot override targets with an empty set"});
    auto &doc = *m_document;
    for (NGIN::UIntSize i = 0; i < doc.nodes.Size(); ++i)
      doc.nodes[i].targets = targets;
    doc.targets = targets;
    if (m_state == MergerState::Empty)
      m_state = MergerState::Populated;
    return {};
  }

  void AbiDumpMerger::RemoveTargets(const TargetSet &targets)
  {
    if (m_state == MergerState::Empty || !m_document->targets.Intersects(targets))
      return;
    auto &doc = *m_document;
    std::vector<bool> keep(doc.nodes.Size(), false);
    for (NGIN::UIntSize i = 0; i < doc.nodes.Size(); ++i)
    {
      doc.nodes[i].targets.EraseAll(targets);
      keep[i] = !doc.nodes[i].targets.IsEmpty();
    }
    doc.Compact(keep);
    doc.targets.EraseAll(targets);
    if (doc.targets.IsEmpty())
      doc.header.clear();
    m_state = doc.targets.IsEmpty() ? MergerState::Empty : MergerState::Projected;
  }

  ExpectedVoid AbiDumpMerger::Dump(std::ostream &sink, const DumpFormat &format) const
  {
    if (m_state == MergerState::Empty)
      return std::unexpected(Error{ErrorCode::Render, "nothing to render: no target was added to the document"});
    const auto &doc = *m_document;

    if (!format.includeTargets)
    {
      if (doc.targets.Size() != 1)
        return std::unexpected(Error{ErrorCode::Render,
                                     "target annotations can only be omitted for a single-target document, targets are " +
                                         doc.targets.ToString()});
      sink << doc.header;
      for (NGIN::UIntSize i = 0; i < doc.roots.Size(); ++i)
        doc.Write(sink, doc.roots[i], nullptr);
    }
    else
    {
      std::optional<GroupAliasCompressor> compressor;
      if (format.useGroupAliases && GroupAliasCompressor::CanUseAliases(doc.targets))
        compressor.emplace(doc.targets);

      std::vector<std::string> suffixes(doc.nodes.Size());
      std::map<TargetSet, std::string> rendered;
      std::map<std::string, TargetSet> usedAliases;
      for (NGIN::UIntSize i = 0; i < doc.nodes.Size(); ++i)
      {
        const auto &targets = doc.nodes[i].targets;
        if (auto it = rendered.find(targets); it != rendered.end())
        {
          suffixes[i] = it->second;
          continue;
        }
        std::string list{"["};
        if (compressor)
        {
          const auto names = compressor->Compress(targets);
          for (std::size_t n = 0; n < names.size(); ++n)
          {
            if (n)
              list.append(", ");
            list.append(names[n]);
            if (const auto *alias = compressor->FindAlias(names[n]))
              usedAliases.emplace(alias->name, alias->targets);
          }
          list.push_back(']');
        }
        else
        {
          list = targets.ToString();
        }
        suffixes[i] = list;
        rendered.emplace(targets, std::move(list));
      }

      sink << detail::kDumpTitle << '\n';
      sink << detail::kTargetsHeader << doc.targets.ToString() << '\n';
      for (const auto &[name, targets] : usedAliases)
        sink << detail::kAliasHeader << name << detail::kAliasArrow << targets.ToString() << '\n';
      sink << doc.header << '\n';
      for (NGIN::UIntSize i = 0; i < doc.roots.Size(); ++i)
        doc.Write(sink, doc.roots[i], &suffixes);
    }

    if (!sink)
      return std::unexpected(Error{ErrorCode::Io, "failed to write the dump"});
    return {};
  }

  ExpectedText AbiDumpMerger::DumpToString(const DumpFormat &format) const
  {
    std::ostringstream out;
    if (auto written = Dump(out, format); !written)
      return std::unexpected(written.error());
    return out.str();
  }

  const TargetSet &AbiDumpMerger::Targets() const noexcept
  {
    return m_document->targets;
  }

  NGIN::UIntSize AbiDumpMerger::DeclarationCount() const noexcept
  {
    return m_document->nodes.Size();
  }

  const TargetSet *AbiDumpMerger::FindTargets(std::initializer_list<std::string_view> path) const
  {
    const auto &doc = *m_document;
    NGIN::UInt32 current = kNoParent;
    for (auto segment : path)
    {
      const auto &children = doc.ChildrenOf(current);
      NGIN::UInt32 next = kNoParent;
      for (NGIN::UIntSize i = 0; i < children.Size(); ++i)
      {
        if (doc.nodes[children[i]].text == segment)
        {
          next = children[i];
          break;
        }
      }
      if (next == kNoParent)
        return nullptr;
      current = next;
    }
    return current == kNoParent ? nullptr : &doc.nodes[current].targets;
  }

  void AbiDumpMerger::ForEachDeclaration(const std::function<void(const DeclarationView &)> &visitor) const
  {
    const auto &doc = *m_document;
    for (NGIN::UIntSize i = 0; i < doc.roots.Size(); ++i)
      doc.Visit(doc.roots[i], visitor);
  }

  bool AbiDumpMerger::HasSameDeclarations(const AbiDumpMerger &other) const
  {
    const auto &a = *m_document;
    const auto &b = *other.m_document;
    return a.targets == b.targets && Document::SameSubtrees(a, a.roots, b, b.roots);
  }

} // namespace NGIN::AbiDump
