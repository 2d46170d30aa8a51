#include "flyg/tools/command_line.hpp"

#include <unistd.h>

namespace flyg::tools {

bool ParseCommandLine(int argc, char* argv[], InfoOptions* out, std::string* error) {
  *out = InfoOptions{};
#if defined(__GLIBC__)
  // glibc переинициализирует getopt полностью только при optind == 0.
  optind = 0;
#else
  optind = 1;
#endif
  opterr = 0;

  int c;
  while ((c = getopt(argc, argv, ":hl:v")) != -1) {
    switch (c) {
      case 'h':
        out->show_help = true;
        return true;
      case 'l':
        out->log_file = optarg;
        break;
      case 'v':
        out->verbose = true;
        break;
      case ':':
        *error = std::string("Missing value for option: -") + static_cast<char>(optopt);
        return false;
      default:
        *error = std::string("Unknown option: -") + static_cast<char>(optopt);
        return false;
    }
  }

  for (int i = optind; i < argc; ++i) {
    out->files.emplace_back(argv[i]);
  }
  if (out->files.empty()) {
    *error = "No flight file given";
    return false;
  }
  return true;
}

std::string UsageText(const std::string& program) {
  return "Usage: " + program +
         " [-l <log file>] [-v] <flight file>...\n"
         "  -l <file>  Also write the log to a rolling file\n"
         "  -v         Verbose logging\n"
         "  -h         Show help\n"
         "Files with the extension .gz are read as gzip-compressed.\n";
}

}  // namespace flyg::tools
