#include "reader.cc"

#include <filesystem>
#include <trieste/driver.h>

int main(int argc, char** argv) {
  // Imports are resolved relative to the directory of the built file.
  // Assumes argv is on the form:
  // ./<executable> build <inputfile> <flags>
  std::filesystem::path root = std::filesystem::current_path();

  for (int i = 0; i < argc; i++) {
    std::string arg = argv[i];
    if ((arg == "build") && (i + 1 < argc)) {
      root = std::filesystem::absolute(argv[i + 1]).parent_path();
    }
  }

  auto resolver = std::make_shared<confl::FileResolver>(
    confl::ResolverConfig::from_env(root));

  return trieste::Driver(confl::reader(resolver)).run(argc, argv);
}
