#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <packer/packer.hpp>

namespace {

void printUsage(const char *program) {
  std::cerr << "Usage:\n"
            << "  " << program
            << " pack [--format bag|tar] [--skip-unreadable] [-v] <archive> <input>...\n"
            << "  " << program
            << " unpack [--format bag|tar] [--same-owner] [-v] <archive> <destination>\n"
            << "  " << program << " list [--format bag|tar] <archive>\n";
}

struct Options {
  std::string command;
  std::string format = "bag";
  bool verbose = false;
  bool skipUnreadable = false;
  bool sameOwner = false;
  std::vector<std::string> positional;
};

bool parseArgs(int argc, char *argv[], Options &options) {
  if (argc < 2) {
    return false;
  }
  options.command = argv[1];

  bool optionsDone = false;
  for (int i = 2; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (optionsDone || arg.empty() || arg[0] != '-') {
      options.positional.emplace_back(arg);
    } else if (arg == "--") {
      optionsDone = true;
    } else if (arg == "-f" || arg == "--format") {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " needs a value\n";
        return false;
      }
      options.format = argv[++i];
    } else if (arg.starts_with("--format=")) {
      options.format = std::string(arg.substr(9));
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--skip-unreadable") {
      options.skipUnreadable = true;
    } else if (arg == "--same-owner") {
      options.sameOwner = true;
    } else {
      std::cerr << "Error: unknown option " << arg << "\n";
      return false;
    }
  }
  return true;
}

int fail(const packer::Error &error) {
  std::cerr << "Error: " << error.describe() << "\n";
  return 1;
}

} // namespace

int main(int argc, char *argv[]) {
  Options options;
  if (!parseArgs(argc, argv, options)) {
    printUsage(argv[0]);
    return 1;
  }

  packer::Error error;
  auto archiver = packer::Archiver::forFormat(options.format, &error);
  if (!archiver) {
    return fail(error);
  }

  if (options.verbose) {
    archiver->setEntryCallback(
        [](const packer::Entry &entry) { std::cout << entry.path << "\n"; });
  }

  if (options.command == "pack") {
    if (options.positional.size() < 2) {
      printUsage(argv[0]);
      return 1;
    }
    std::filesystem::path archivePath = options.positional[0];
    std::vector<std::filesystem::path> inputs(options.positional.begin() + 1,
                                              options.positional.end());

    packer::CollectOptions collect;
    collect.skipUnreadable = options.skipUnreadable;
    collect.onSkipped = [](const packer::Error &skipped) {
      std::cerr << "Warning: skipped " << skipped.describe() << "\n";
    };

    if (!archiver->pack(inputs, archivePath, collect, &error)) {
      return fail(error);
    }
    std::cout << "Created " << packer::formatName(archiver->format()) << " archive "
              << archivePath.string() << "\n";
    return 0;
  }

  if (options.command == "unpack") {
    if (options.positional.size() != 2) {
      printUsage(argv[0]);
      return 1;
    }
    archiver->setRestoreOwnership(options.sameOwner);
    if (!archiver->unpack(options.positional[0], options.positional[1], &error)) {
      return fail(error);
    }
    std::cout << "Unpacked " << options.positional[0] << " into " << options.positional[1]
              << "\n";
    return 0;
  }

  if (options.command == "list") {
    if (options.positional.size() != 1) {
      printUsage(argv[0]);
      return 1;
    }
    auto entries = archiver->list(options.positional[0], &error);
    if (!entries) {
      return fail(error);
    }
    for (const auto &entry : *entries) {
      std::cout << entry.path;
      if (entry.kind == packer::EntryKind::Directory) {
        std::cout << "/";
      } else if (entry.kind == packer::EntryKind::Symlink) {
        std::cout << " -> " << entry.linkTarget;
      }
      std::cout << "\n";
    }
    return 0;
  }

  std::cerr << "Error: unknown command " << options.command << "\n";
  printUsage(argv[0]);
  return 1;
}
