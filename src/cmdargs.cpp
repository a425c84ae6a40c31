// cmdargs.cpp

#include "cmdargs.hpp"

#include <cassert>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <regex>

#include <getopt.h>

using namespace escan;

namespace {
struct parameter {
  inline static const auto pad = std::setw(30);

  const char *text;

  friend std::ostream &operator<<(std::ostream &os, const parameter &p) {
    os << "  " << std::left << pad << p.text;
    return os;
  }
};

bool valid_regex(const char *option, const std::string &pattern) {
  try {
    std::regex re(pattern);
    return true;
  } catch (const std::regex_error &e) {
    std::cerr << "--" << option << ": invalid regular expression '"
              << pattern << "': " << e.what() << "\n";
    return false;
  }
}

void print_usage(const char *program_name) {
  std::cout << "Usage:\n\n";
  std::cout << program_name << " <options> [--] <file>...\n\n";

  std::ios::fmtflags flags(std::cout.flags());

  std::cout << "options:\n";

  std::cout << parameter{"-h, --help"} << "print this message and exit"
            << "\n";

  std::cout << parameter{"-c, --config <file>"}
            << "(optional) read tool and targets from configuration file "
            << "<file>"
            << "\n";

  std::cout << parameter{"-o, --output <file>"}
            << "(optional) write extracted data to <file> in JSON format "
            << "(default: stdout)"
            << "\n";

  std::cout << parameter{"-q, --quiet"}
            << "suppress log messages except errors to stderr (default: off)"
            << "\n";

  std::cout << parameter{"-l, --log <file>"}
            << "(optional) write log to <file> (default: stderr)"
            << "\n";

  std::cout << parameter{"-t, --tool <program>"}
            << "(optional) ELF introspection program, overwrites config value "
            << "(default: readelf)"
            << "\n";

  std::cout << parameter{"-m, --member <path>"}
            << "(optional) path of <file> inside its package, used to "
            << "classify it; requires exactly one <file> (default: <file>)"
            << "\n";

  std::cout << parameter{"--functions <regex>"}
            << "(optional) list function symbols whose name matches <regex>"
            << "\n";

  std::cout.flush();
  std::cout.flags(flags);
}
} // namespace

optional_output_file::optional_output_file(const std::string &path) : _file() {
  if (!path.empty())
    _file.open(path);
}

optional_output_file::operator bool() const { return bool(_file); }

optional_output_file::operator std::ostream &() {
  if (_file && !_file.is_open())
    return std::cout;
  return _file;
}

optional_input_file::optional_input_file(const std::string &path) : _file() {
  if (!path.empty())
    _file.open(path);
}

optional_input_file::operator bool() const { return bool(_file); }

bool optional_input_file::present() const { return _file.is_open(); }

optional_input_file::operator std::istream &() { return _file; }

std::ostream &escan::operator<<(std::ostream &os,
                                const optional_output_file &f) {
  if (!f)
    os << "failed to open";
  else if (f._file.is_open())
    os << "file";
  else
    os << "stdout";
  return os;
}

std::ostream &escan::operator<<(std::ostream &os,
                                const optional_input_file &f) {
  if (!f)
    os << "failed to open";
  else if (f._file.is_open())
    os << "file";
  else
    os << "none";
  return os;
}

std::ostream &escan::operator<<(std::ostream &os, const arguments &args) {
  os << "output: " << args.output;
  os << ", config: " << args.config;
  os << ", tool: " << args.tool.value_or("(config)");
  os << ", files:";
  for (const auto &f : args.files)
    os << " " << f;
  return os;
}

std::optional<arguments> escan::parse_arguments(int argc,
                                                char *const argv[]) {
  int c;
  int option_index = 0;
  bool quiet = false;
  std::string output;
  std::string config;
  std::string logpath;
  std::optional<std::string> tool;
  std::optional<std::string> member;
  std::optional<std::string> functions;

  struct option long_options[] = {
      {"help", no_argument, nullptr, 'h'},
      {"config", required_argument, nullptr, 'c'},
      {"output", required_argument, nullptr, 'o'},
      {"quiet", no_argument, nullptr, 'q'},
      {"log", required_argument, nullptr, 'l'},
      {"tool", required_argument, nullptr, 't'},
      {"member", required_argument, nullptr, 'm'},
      {"functions", required_argument, nullptr, 0x100},
      {nullptr, 0, nullptr, 0}};

  while ((c = getopt_long(argc, argv, "hqc:o:l:t:m:", long_options,
                          &option_index)) != -1) {
    switch (c) {
    case 0x100:
      if (!valid_regex(long_options[option_index].name, optarg))
        return std::nullopt;
      functions = optarg;
      break;
    case 't':
      if (!*optarg) {
        std::cerr << "-t/--tool cannot be empty\n";
        return std::nullopt;
      }
      tool = optarg;
      break;
    case 'm':
      if (!*optarg) {
        std::cerr << "-m/--member cannot be empty\n";
        return std::nullopt;
      }
      member = optarg;
      break;
    case 'c':
      config = optarg;
      break;
    case 'o':
      output = optarg;
      break;
    case 'l':
      logpath = optarg;
      break;
    case 'q':
      quiet = true;
      break;
    case 'h':
    case '?':
      // getopt already printed an error message
      print_usage(argv[0]);
      return std::nullopt;
    default:
      assert(false);
    }
  }

  if (quiet && !logpath.empty()) {
    std::cerr << "both -q/--quiet and -l/--log provided\n";
    return std::nullopt;
  }

  std::vector<std::string> files(argv + optind, argv + argc);
  if (files.empty() && config.empty()) {
    std::cerr << "missing target file name\n";
    return std::nullopt;
  }
  if (member && files.size() != 1) {
    std::cerr << "-m/--member requires exactly one target file\n";
    return std::nullopt;
  }

  optional_output_file of(output);
  optional_input_file cfg(config);

  if (!of) {
    std::cerr << "error opening output file '" << output
              << "': " << strerror(errno) << "\n";
    return std::nullopt;
  }
  if (!cfg) {
    std::cerr << "error opening config file '" << config
              << "': " << strerror(errno) << "\n";
    return std::nullopt;
  }

  return arguments{std::move(cfg),
                   std::move(of),
                   log_args{quiet, std::move(logpath)},
                   std::move(tool),
                   std::move(member),
                   std::move(functions),
                   std::move(files)};
}
