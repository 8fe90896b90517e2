#include <NGIN/AbiDump/AbiDump.hpp>

#include <iostream>
#include <string>
#include <string_view>

// Usage: MergeDumps <output> <target>=<dump> [<target>=<dump> ...] [--no-aliases]
int main(int argc, char **argv)
{
  using namespace NGIN::AbiDump;

  if (argc < 3)
  {
    std::cerr << "usage: " << argv[0] << " <output> <target>=<dump>... [--no-aliases]\n";
    return 2;
  }

  MergeRequest request;
  for (int i = 2; i < argc; ++i)
  {
    const std::string_view arg{argv[i]};
    if (arg == "--no-aliases")
    {
      request.groupTargetNames = false;
      continue;
    }
    const auto eq = arg.find('=');
    if (eq == std::string_view::npos || eq == 0)
    {
      std::cerr << "error: expected <target>=<dump>, got '" << arg << "'\n";
      return 2;
    }
    auto text = ReadDumpFile(std::string{arg.substr(eq + 1)});
    if (!text)
    {
      std::cerr << "error: " << Describe(text.error()) << "\n";
      return 1;
    }
    request.dumps.emplace_back(Target{arg.substr(0, eq)}, std::move(*text));
  }

  auto merged = MergeIndividualDumps(request);
  if (!merged)
  {
    std::cerr << "error: " << Describe(merged.error()) << "\n";
    return 1;
  }
  for (NGIN::UIntSize i = 0; i < merged->diagnostics.Size(); ++i)
  {
    const auto &d = merged->diagnostics.entries[i];
    std::cerr << (d.severity == Severity::Warning ? "warning: " : "note: ") << d.message << "\n";
  }

  if (auto written = WriteDumpFile(argv[1], merged->dump); !written)
  {
    std::cerr << "error: " << Describe(written.error()) << "\n";
    return 1;
  }
  std::cout << "Merged " << merged->targets.Size() << " targets " << merged->targets.ToString() << " into " << argv[1]
            << "\n";
  return 0;
}
