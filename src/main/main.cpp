#include "csvpipe/config.hpp"
#include "csvpipe/errors.hpp"
#include "csvpipe/log.hpp"
#include "csvpipe/stream_processor.hpp"

#include <charconv>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr const char* kVersion = "csvpipe 0.1.0";

constexpr const char* kUsage =
  "Usage: csvpipe [FILE] [-o FILE|--output=FILE] [-f LIST|--fields=LIST]\n"
  "               [--buffer-size=N] [-t N|--threads=N] [-v|--verbose] [--stats]\n"
  "               [--stats-json=FILE] [--pipelined] [--queue-depth=N]\n"
  "               [--max-record-bytes=N] [-h|--help] [-V|--version]\n"
  "\n"
  "Streams a CSV file (default: stdin) to FILE (default: stdout), optionally\n"
  "keeping only the 1-based columns in LIST (e.g. -f 3,1,1).\n";

struct Cli {
  cp::Config cfg;
  bool help = false;
  bool version = false;
};

bool parse_size(std::string_view flag, std::string_view s, std::size_t* out, cp::Error* err) {
  std::size_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
    return cp::fail(err, cp::ErrorKind::Config,
                    "invalid value '" + std::string(s) + "' for " + std::string(flag));
  *out = v;
  return true;
}

bool parse_cli(int argc, char** argv, Cli& c, cp::Error* err) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    // Value for "-x V", "--xx V" or "--xx=V"; `name` is the long form.
    auto value_of = [&](const char* shrt, const char* name, std::string* out) {
      const std::string eq = std::string(name) + "=";
      if (a.rfind(eq, 0) == 0) { *out = a.substr(eq.size()); return true; }
      if ((a == name || (shrt && a == shrt)) && i + 1 < argc) { *out = argv[++i]; return true; }
      return false;
    };

    std::string v;
    if (a == "-h" || a == "--help")    { c.help = true; continue; }
    if (a == "-V" || a == "--version") { c.version = true; continue; }
    if (a == "-v" || a == "--verbose") { c.cfg.verbose = true; continue; }
    if (a == "--stats")                { c.cfg.stats = true; continue; }
    if (a == "--pipelined")            { c.cfg.pipelined = true; continue; }
    if (value_of("-o", "--output", &v)) { c.cfg.output = v; continue; }
    if (value_of("-f", "--fields", &v)) {
      std::vector<std::size_t> fields;
      if (!cp::parse_field_list(v, fields, err)) return false;
      c.cfg.fields = std::move(fields);
      continue;
    }
    if (value_of(nullptr, "--buffer-size", &v)) {
      if (!parse_size("--buffer-size", v, &c.cfg.buffer_size, err)) return false;
      continue;
    }
    if (value_of("-t", "--threads", &v)) {
      std::size_t n = 0;
      if (!parse_size("--threads", v, &n, err)) return false;
      c.cfg.threads = n;
      continue;
    }
    if (value_of(nullptr, "--queue-depth", &v)) {
      if (!parse_size("--queue-depth", v, &c.cfg.queue_depth, err)) return false;
      continue;
    }
    if (value_of(nullptr, "--max-record-bytes", &v)) {
      if (!parse_size("--max-record-bytes", v, &c.cfg.max_record_bytes, err)) return false;
      continue;
    }
    if (value_of(nullptr, "--stats-json", &v)) { c.cfg.stats_json = v; continue; }

    if (!a.empty() && a[0] == '-' && a != "-")
      return cp::fail(err, cp::ErrorKind::Config, "unknown option '" + a + "'");
    if (c.cfg.input)
      return cp::fail(err, cp::ErrorKind::Config, "more than one input file given");
    if (a != "-") c.cfg.input = a;
  }
  return true;
}

}

int main(int argc, char** argv) {
  Cli cli;
  cp::Error err;
  if (!parse_cli(argc, argv, cli, &err)) {
    std::cerr << "Error: " << err.describe() << "\n" << kUsage;
    return 1;
  }
  if (cli.help)    { std::cout << kUsage; return 0; }
  if (cli.version) { std::cout << kVersion << "\n"; return 0; }

  cp::set_log_level(cli.cfg.verbose ? cp::LogLevel::Debug : cp::LogLevel::Warn);

  try {
    cp::StreamProcessor processor(cli.cfg);
    if (!processor.run(&err)) {
      std::cerr << "Error: " << err.describe() << "\n";
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  cp::log_at(cp::LogLevel::Info, "main", [](std::ostream& o) { o << "CSV processing completed successfully"; });
  return 0;
}
