#include "csvpipe/config.hpp"
#include "csvpipe/errors.hpp"
#include "csvpipe/stats.hpp"
#include "csvpipe/stream_processor.hpp"
#include "../support/memory_streams.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;
static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct Outcome {
  bool ok = false;
  cp::Error err;
  std::string out;
  std::uint64_t records = 0;
  std::uint64_t malformed = 0;
  int flushes = 0;
};

static Outcome run(const std::string& input, cp::Config cfg, std::size_t max_read = 0) {
  cp_test::MemorySource src(input, max_read);
  cp_test::StringSink sink;
  cp::StreamProcessor proc(cfg);
  Outcome o;
  o.ok = proc.process(src, sink, &o.err);
  o.out = sink.data;
  o.records = proc.stats().records();
  o.malformed = proc.malformed_rows();
  o.flushes = sink.flushes;
  return o;
}

static cp::Config with_fields(std::vector<std::size_t> f, bool pipelined) {
  cp::Config cfg;
  cfg.fields = std::move(f);
  cfg.pipelined = pipelined;
  return cfg;
}

static void scenarios(bool pipelined) {
  const std::string tag = pipelined ? " [pipelined]" : " [sequential]";
  cp::Config plain;
  plain.pipelined = pipelined;

  auto o = run("a,b,c\n1,2,3\n4,5,6\n", with_fields({1, 3}, pipelined));
  check(o.ok && o.out == "a,c\n1,3\n4,6\n", "select 1,3" + tag + " got '" + o.out + "'");
  check(o.records == 2, "two records counted" + tag);
  check(o.flushes >= 1, "output flushed" + tag);

  o = run("a,b,c\n1,2\n4,5,6\n", plain);
  check(o.ok && o.out == "a,b,c\n1,2\n4,5,6\n", "flexible widths pass through" + tag);

  o = run("a,b,c\n1,2,3\n4,5,6\n", with_fields({5}, pipelined));
  check(o.ok && o.out == "\n\n\n", "out-of-range field gives empty rows" + tag);

  o = run("a,b,c\n1,2,3\n", with_fields({3, 1, 1}, pipelined));
  check(o.ok && o.out == "c,a,a\n3,1,1\n", "reorder with duplicates" + tag);

  o = run("a,b,c\n1,2\n", with_fields({1, 3}, pipelined));
  check(o.ok && o.out == "a,c\n1\n", "short row shrinks under projection" + tag);

  o = run("", plain);
  check(!o.ok && o.err.kind == cp::ErrorKind::Parse, "empty input is a fatal parse error" + tag);
  check(o.out.empty(), "empty input writes nothing" + tag);

  o = run("a\xff,b\n1,2\n", plain);
  check(!o.ok && o.err.kind == cp::ErrorKind::Parse, "malformed header is fatal" + tag);

  o = run("a,b\n1,2\nbad\xfe,3\n4,5\n", plain);
  check(o.ok && o.out == "a,b\n1,2\n4,5\n", "malformed row skipped" + tag);
  check(o.records == 2 && o.malformed == 1, "only well-formed rows counted" + tag);

  o = run("a,b\n\"x\"y,1\n2,3\n", plain);
  check(o.ok && o.out == "a,b\nxy,1\n2,3\n", "text after a closing quote is kept" + tag);
  check(o.records == 2 && o.malformed == 0, "no row lost to trailing text" + tag);

  o = run("a,b\n1,2\n\"open,3\n", plain);
  check(o.ok && o.out == "a,b\n1,2\nopen,3\n", "open quote at end of input ends the last row" + tag);
  check(o.records == 2, "last row counted" + tag);

  o = run("\"h\"1,b\n1,2\n", plain);
  check(o.ok && o.out == "h1,b\n1,2\n", "header with text after its quote" + tag);

  o = run("name,note\n\"Smith, J\",\"said \"\"hi\"\"\"\n", plain);
  check(o.ok && o.out == "name,note\nSmith, J,said \"hi\"\n", "quotes removed, output unquoted" + tag);

  o = run("a,b\r\n1,2\r\n\r\n3,4", plain);
  check(o.ok && o.out == "a,b\n1,2\n3,4\n", "CRLF, blank line and missing final newline" + tag);

  // Same output regardless of read and buffer sizes.
  std::string big = "id,v,w\n";
  std::string expect = "w,id\n";
  for (int i = 0; i < 20000; ++i) {
    big += std::to_string(i) + ",v" + std::to_string(i) + ",\"w," + std::to_string(i) + "\"\n";
    expect += "w," + std::to_string(i) + "," + std::to_string(i) + "\n";
  }
  cp::Config small = with_fields({3, 1}, pipelined);
  small.buffer_size = 13;
  small.queue_depth = 2;
  o = run(big, small, 5);
  check(o.ok && o.out == expect, "large input with tiny buffers" + tag);
  check(o.records == 20000, "large record count" + tag);
}

// A stray quote swallows the rest of the input into one field; every byte
// is still parsed only once.
static void stray_quote(bool pipelined) {
  const std::string tag = pipelined ? " [pipelined]" : " [sequential]";
  const int n = 200000;
  std::string input = "a,b\n\"stray,1\n";
  std::string field = "stray,1";
  for (int i = 0; i < n; ++i) {
    input += "123456789,12345678\n";
    field += "\n123456789,12345678";
  }
  cp::Config cfg;
  cfg.pipelined = pipelined;

  const auto t0 = std::chrono::steady_clock::now();
  Outcome o = run(input, cfg);
  const std::chrono::duration<double> took = std::chrono::steady_clock::now() - t0;
  check(o.ok && o.out == "a,b\n" + field + "\n", "stray quote joins the remaining lines" + tag);
  check(o.records == 1 && o.malformed == 0, "one joined record" + tag);
  check(took.count() < 30.0, "joined row parsed in linear time, took " + std::to_string(took.count()) + "s" + tag);

  // with a smaller guard the joined row is dropped once and parsing resumes
  cfg.max_record_bytes = 64 * 1024;
  o = run(input.substr(0, 13 + 20000 * 19), cfg);
  check(o.ok && o.malformed == 1, "oversized joined row rejected once" + tag);
  check(o.records == 16551, "rows after the rejected one survive" + tag + ", got " + std::to_string(o.records));
}

static void memory_estimate() {
  cp::Config cfg;
  check(cp::StreamProcessor(cfg).estimated_memory_mb() == 0.125, "two 64 KiB buffers sequential");
  cfg.pipelined = true;
  check(cp::StreamProcessor(cfg).estimated_memory_mb() == 0.375, "plus four queued chunks pipelined");
}

static void failure_paths() {
  {
    cp_test::MemorySource src("a\n1\n");
    cp_test::StringSink sink;
    sink.fail_writes = true;
    cp::StreamProcessor proc(cp::Config{});
    cp::Error err;
    check(!proc.process(src, sink, &err) && err.kind == cp::ErrorKind::Io, "write failure is an I/O error");
  }
  for (bool pipelined : {false, true}) {
    cp_test::MemorySource src("a,b\n1,2\n3,4\n5,6\n", 4, 10);
    cp_test::StringSink sink;
    cp::Config cfg;
    cfg.pipelined = pipelined;
    cfg.buffer_size = 4;
    cp::StreamProcessor proc(cfg);
    cp::Error err;
    check(!proc.process(src, sink, &err) && err.kind == cp::ErrorKind::Io, "read failure is an I/O error");
  }
  {
    cp::Config cfg;
    cfg.buffer_size = 0;
    cp_test::MemorySource src("a\n");
    cp_test::StringSink sink;
    cp::StreamProcessor proc(cfg);
    cp::Error err;
    check(!proc.process(src, sink, &err) && err.kind == cp::ErrorKind::Config, "zero buffer rejected");
  }
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss; ss << in.rdbuf();
  return ss.str();
}

static void file_runs() {
  const fs::path dir = fs::temp_directory_path() / "cp_e2e";
  fs::create_directories(dir);
  const fs::path out = dir / "out.csv";

  cp::Config cfg;
  cfg.input = (fs::path(CP_TEST_DATA_DIR) / "edge_delimiters.csv").string();
  cfg.output = out.string();
  cfg.fields = std::vector<std::size_t>{2, 1};
  cp::StreamProcessor proc(cfg);
  cp::Error err;
  check(proc.run(&err), "file run ok: " + err.describe());
  check(proc.header() == std::vector<std::string>({"id", "name", "note", "amount"}), "header retained");
  check(slurp(out) == "name,id\nplain,1\ncomma, inside,2\n,3\nmulti\nline note,4\n,5\ntrailing,6\n",
        "file output");

  // truncated on the next run
  cfg.input = (fs::path(CP_TEST_DATA_DIR) / "one_malformed.csv").string();
  cfg.fields.reset();
  cp::StreamProcessor again(cfg);
  check(again.run(&err), "second run ok");
  check(slurp(out) == "a,b,c\n1,2,3\n4,5,6\n", "output truncated and rewritten");
  check(again.malformed_rows() == 1 && again.stats().records() == 2, "malformed fixture counts");

  const fs::path untouched = dir / "never.csv";
  fs::remove(untouched);
  cfg.input = (dir / "does_not_exist.csv").string();
  cfg.output = untouched.string();
  cp::StreamProcessor missing(cfg);
  err = {};
  check(!missing.run(&err) && err.kind == cp::ErrorKind::Io, "missing input is an I/O error");
  check(err.describe().rfind("IO error: ", 0) == 0, "I/O error text");
  check(!fs::exists(untouched), "output not created when input fails");

  fs::remove_all(dir);
}

int main(){
  scenarios(false);
  scenarios(true);
  stray_quote(false);
  stray_quote(true);
  memory_estimate();
  failure_paths();
  file_runs();
  if (failures) return 1;
  std::cout << "[PASS] end-to-end CSV\n";
  return 0;
}
