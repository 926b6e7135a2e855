#include <iostream>
#include <string_view>

#include <fmt/format.h>

#include <packer/packer.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive> [bag|tar]\n";
    return 1;
  }

  packer::Error error;
  auto archiver = packer::Archiver::forFormat(argc > 2 ? argv[2] : "bag", &error);
  if (!archiver) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  auto entries = archiver->list(argv[1], &error);
  if (!entries) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Entries: " << entries->size() << "\n\n";

  for (const auto &entry : *entries) {
    std::cout << fmt::format("  {:<7} {:04o} {:>10}  {}", packer::entryKindName(entry.kind),
                             entry.mode, entry.size, entry.path);
    if (entry.kind == packer::EntryKind::Symlink) {
      std::cout << " -> " << entry.linkTarget;
    }
    std::cout << "\n";
  }

  return 0;
}
