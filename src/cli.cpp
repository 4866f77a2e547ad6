/**
 * csvlint - Command-line RFC 4180 validator
 *
 * Streams the input once and reports every structural defect it finds.
 * Exit status: 0 when the file is valid, 1 when it could not be read or
 * parsing had to stop, 2 when validation errors were found.
 */

#include "csvlint/csvlint.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

using namespace std;

constexpr const char* VERSION = CSVLINT_VERSION_STRING;

void printVersion() {
  cout << "csvlint version " << VERSION << '\n';
}

void printUsage(const char* prog) {
  cerr << "csvlint - Validate CSV files against RFC 4180\n\n";
  cerr << "Usage: " << prog << " [options] <csvfile>\n\n";
  cerr << "Arguments:\n";
  cerr << "  csvfile                 Path to CSV file, or '-' to read from stdin\n";
  cerr << "\nOptions:\n";
  cerr << "  -d, --delimiter <d>     Field delimiter (default: comma)\n";
  cerr << "                          Values: comma, tab, pipe, colon, semicolon\n";
  cerr << "  -l, --lazyquotes        Tolerate improperly escaped quotes\n";
  cerr << "      --rfc4180           Strict RFC 4180 mode: comma delimiter, CRLF line\n";
  cerr << "                          endings and strict quote escaping\n";
  cerr << "      --require-final-crlf\n";
  cerr << "                          In RFC 4180 mode, also require CRLF after the last record\n";
  cerr << "  -m, --max-errors <n>    Stop after n errors (default: 0, unlimited)\n";
  cerr << "  -h, --help              Show this help message\n";
  cerr << "  -v, --version           Show version information\n";
  cerr << "\nExit status:\n";
  cerr << "  0  file is valid\n";
  cerr << "  1  file could not be read, or parsing stopped on an unrecoverable error\n";
  cerr << "  2  validation errors were found\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " data.csv\n";
  cerr << "  " << prog << " --rfc4180 data.csv\n";
  cerr << "  " << prog << " -d tab data.tsv\n";
  cerr << "  " << prog << " -l -m 10 messy.csv\n";
  cerr << "  cat data.csv | " << prog << " -\n";
}

void printStrictBanner() {
  cout << "Running in strict RFC 4180 compliance mode\n";
  cout << "- Delimiter: comma (,)\n";
  cout << "- Line endings: CRLF required\n";
  cout << "- Quote escaping: strict\n";
  cout << "\n";
}

int runValidation(const char* filename, const csvlint::Dialect& dialect,
                  const csvlint::ValidationOptions& options) {
  bool from_stdin = strcmp(filename, "-") == 0;
  if (!from_stdin && access(filename, F_OK) != 0) {
    cerr << "file '" << filename << "' does not exist\n";
    return 1;
  }

  try {
    csvlint::FileSource source(filename);
    csvlint::ValidationResult result = csvlint::validate(source, dialect, options);

    csvlint::ReportOptions report_opts;
    report_opts.rfc4180 = dialect.strict_rfc4180;
    csvlint::write_report(cout, result, report_opts);
    return csvlint::exit_code(result);
  } catch (const std::runtime_error& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }
}

int main(int argc, char* argv[]) {
  // Disable buffering for stdout so output written before exit is never lost
  // when the process is run under popen().
  setvbuf(stdout, nullptr, _IONBF, 0);

  bool rfc4180 = false;
  bool require_final_crlf = false;
  bool lazy_quotes = false;
  size_t max_errors = 0;
  string delimiter_str = "comma";

  // Pre-scan long options since we're not using getopt_long. Options that take
  // a value are rewritten to their short form; the rest are consumed here.
  vector<string> storage;
  storage.reserve(static_cast<size_t>(argc) * 2);
  vector<char*> args;
  args.push_back(argv[0]);
  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];
    if (arg == "--") {
      for (; i < argc; ++i) {
        args.push_back(argv[i]);
      }
      break;
    }
    if (arg == "--rfc4180") {
      rfc4180 = true;
    } else if (arg == "--require-final-crlf") {
      require_final_crlf = true;
    } else if (arg == "--lazyquotes") {
      storage.push_back("-l");
      args.push_back(&storage.back()[0]);
    } else if (arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      printVersion();
      return 0;
    } else if (arg.compare(0, 11, "--delimiter") == 0 || arg.compare(0, 12, "--max-errors") == 0) {
      bool is_delim = arg.compare(0, 11, "--delimiter") == 0;
      string name = is_delim ? "--delimiter" : "--max-errors";
      storage.push_back(is_delim ? "-d" : "-m");
      args.push_back(&storage.back()[0]);
      if (arg.size() > name.size()) {
        if (arg[name.size()] != '=') {
          cerr << "Error: Unknown option '" << arg << "'\n";
          printUsage(argv[0]);
          return 1;
        }
        storage.push_back(arg.substr(name.size() + 1));
        args.push_back(&storage.back()[0]);
      }
    } else if (arg.compare(0, 2, "--") == 0) {
      cerr << "Error: Unknown option '" << arg << "'\n";
      printUsage(argv[0]);
      return 1;
    } else {
      args.push_back(argv[i]);
    }
  }
  args.push_back(nullptr);
  int nargs = static_cast<int>(args.size()) - 1;

  int c;
  while ((c = getopt(nargs, args.data(), "d:lm:hv")) != -1) {
    switch (c) {
    case 'd':
      delimiter_str = optarg;
      break;
    case 'l':
      lazy_quotes = true;
      break;
    case 'm': {
      char* endptr;
      long val = strtol(optarg, &endptr, 10);
      if (*optarg == '\0' || *endptr != '\0' || val < 0) {
        cerr << "Error: Invalid error limit '" << optarg << "'\n";
        return 1;
      }
      max_errors = static_cast<size_t>(val);
      break;
    }
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'v':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  if (optind >= nargs) {
    cerr << "Error: No input file given\n\n";
    printUsage(argv[0]);
    return 1;
  }
  const char* filename = args[static_cast<size_t>(optind)];

  csvlint::Dialect dialect;
  dialect.lazy_quotes = lazy_quotes;

  if (rfc4180) {
    // The delimiter is fixed in this mode, so an unknown name is not an error
    auto delimiter = csvlint::parse_delimiter(delimiter_str);
    if (!delimiter || *delimiter != ',') {
      cerr << "Warning: --rfc4180 mode requires comma delimiter, ignoring --delimiter option\n";
    }
    if (dialect.lazy_quotes) {
      cerr << "Warning: --rfc4180 mode disables lazy quotes, ignoring --lazyquotes option\n";
    }
    dialect = csvlint::Dialect::rfc4180();
    printStrictBanner();
  } else {
    auto delimiter = csvlint::parse_delimiter(delimiter_str);
    if (!delimiter) {
      cerr << "Error: Invalid delimiter '" << delimiter_str
           << "' (expected comma, tab, pipe, colon or semicolon)\n";
      return 1;
    }
    dialect.delimiter = *delimiter;

    if (require_final_crlf) {
      cerr << "Warning: --require-final-crlf only applies in --rfc4180 mode\n";
    }
    if (dialect != csvlint::Dialect::csv()) {
      cerr << "Warning: not using defaults, may not validate CSV to RFC 4180\n";
    }
  }

  csvlint::ValidationOptions options;
  options.max_errors = max_errors;
  if (require_final_crlf) {
    options.final_line_ending = csvlint::FinalLineEnding::REQUIRED;
  }

  int result = runValidation(filename, dialect, options);

  std::cout.flush();
  std::cerr.flush();
  fflush(stdout);
  fflush(stderr);
  return result;
}
