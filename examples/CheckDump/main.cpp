#include <NGIN/AbiDump/AbiDump.hpp>

#include <iostream>
#include <string>

// Usage: CheckDump <reference> <generated> [--strict] <supported>...
// Exits with 1 when the generated merged dump differs from the reference.
int main(int argc, char **argv)
{
  using namespace NGIN::AbiDump;

  if (argc < 4)
  {
    std::cerr << "usage: " << argv[0] << " <reference> <generated> [--strict] <supported>...\n";
    return 2;
  }

  ValidationOptions options;
  TargetSet supported;
  for (int i = 3; i < argc; ++i)
  {
    const std::string arg{argv[i]};
    if (arg == "--strict")
      options.strictValidation = true;
    else
      supported.Insert(arg);
  }

  auto reference = ReadDumpFile(argv[1]);
  auto generated = ReadDumpFile(argv[2]);
  if (!reference || !generated)
  {
    std::cerr << "error: " << Describe(!reference ? reference.error() : generated.error()) << "\n";
    return 1;
  }

  auto prepared = PrepareReferenceDump(*reference, supported, options);
  if (!prepared)
  {
    std::cerr << "error: " << Describe(prepared.error()) << "\n";
    return 1;
  }
  for (NGIN::UIntSize i = 0; i < prepared->diagnostics.Size(); ++i)
  {
    const auto &d = prepared->diagnostics.entries[i];
    std::cerr << (d.severity == Severity::Warning ? "warning: " : "note: ") << d.message << "\n";
  }

  const auto comparison = CompareDumps(prepared->dump, *generated);
  if (comparison.equal)
  {
    std::cout << "ABI dump is up to date\n";
    return 0;
  }
  std::cout << "ABI dump differs from " << argv[1] << ":\n" << comparison.ToString();
  return 1;
}
