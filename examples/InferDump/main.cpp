#include <NGIN/AbiDump/AbiDump.hpp>

#include <filesystem>
#include <iostream>
#include <string>

// Usage: InferDump <unsupported> <dumpDir> <dumpFileName> <output> [image] <supported>...
//   Dumps for supported targets are read from <dumpDir>/<target>/<dumpFileName>.
int main(int argc, char **argv)
{
  using namespace NGIN::AbiDump;
  namespace fs = std::filesystem;

  if (argc < 7)
  {
    std::cerr << "usage: " << argv[0] << " <unsupported> <dumpDir> <dumpFileName> <output> <image|-> <supported>...\n";
    return 2;
  }

  const fs::path dumpDir{argv[2]};
  const std::string dumpFileName{argv[3]};
  const fs::path output{argv[4]};
  const std::string imageArg{argv[5]};

  InferenceRequest request;
  request.unsupportedTarget = Target{argv[1]};
  for (int i = 6; i < argc; ++i)
    request.supportedTargets.Insert(argv[i]);
  request.dumps = [&](const Target &target) { return ReadDumpFile(dumpDir / target.name / dumpFileName); };

  if (imageArg != "-")
  {
    auto image = ReadImage(imageArg);
    if (!image)
    {
      std::cerr << "error: " << Describe(image.error()) << "\n";
      return 1;
    }
    request.image = std::move(*image);
  }

  auto result = InferAbiForUnsupportedTarget(request);
  if (!result)
  {
    std::cerr << "error: " << Describe(result.error()) << "\n";
    return 1;
  }
  for (NGIN::UIntSize i = 0; i < result->diagnostics.Size(); ++i)
  {
    const auto &d = result->diagnostics.entries[i];
    std::cerr << (d.severity == Severity::Warning ? "warning: " : "note: ") << d.message << "\n";
  }

  if (auto written = WriteDumpFile(output, result->dump); !written)
  {
    std::cerr << "error: " << Describe(written.error()) << "\n";
    return 1;
  }
  std::cout << "Inferred " << request.unsupportedTarget.name << " from " << result->donorTargets.ToString() << "\n";
  return 0;
}
