#include "csvpipe/stream_processor.hpp"
#include "csvpipe/arena.hpp"
#include "csvpipe/byte_stream.hpp"
#include "csvpipe/chunk_channel.hpp"
#include "csvpipe/csv_codec.hpp"
#include "csvpipe/errors.hpp"
#include "csvpipe/line_splitter.hpp"
#include "csvpipe/log.hpp"
#include "csvpipe/projector.hpp"
#include "csvpipe/record_view.hpp"
#include "csvpipe/run_json.hpp"
#include "csvpipe/stats.hpp"

#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <new>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cp {

namespace {
constexpr std::uint64_t kProgressEvery = 100000;
constexpr double kMiB = 1024.0 * 1024.0;
}

struct StreamProcessor::Impl {
  Config cfg;
  std::unique_ptr<ProcessingStats> stats = std::make_unique<ProcessingStats>();
  std::vector<std::string> header;
  std::uint64_t malformed{0};

  explicit Impl(Config c) : cfg(std::move(c)) {}

  bool process(ByteSource& in, ByteSink& out, Error* err);
  void print_stats(std::chrono::duration<double> wall) const;

  double memory_mb() const {
    const double factor = cfg.pipelined ? 2.0 + static_cast<double>(cfg.queue_depth) : 2.0;
    return static_cast<double>(cfg.buffer_size) * factor / kMiB;
  }
};

bool StreamProcessor::Impl::process(ByteSource& in, ByteSink& out, Error* err) {
  stats = std::make_unique<ProcessingStats>();
  header.clear();
  malformed = 0;

  CsvConfig ccfg;
  ccfg.max_record_bytes = cfg.max_record_bytes;
  Arena header_arena(4 * 1024);
  Arena row_arena(64 * 1024);
  CsvFsm csv(ccfg, header_arena, row_arena);

  LineSplitter::Config lcfg;
  lcfg.max_record_bytes = cfg.max_record_bytes;
  LineSplitter splitter(lcfg);

  const bool select = cfg.fields.has_value();
  const std::vector<std::size_t> offsets = select ? to_zero_based(*cfg.fields)
                                                  : std::vector<std::size_t>{};
  if (cfg.threads)
    log_at(LogLevel::Debug, "csv", [&](std::ostream& o) {
      o << "worker count " << *cfg.threads << " accepted; rows stay in one ordered stream";
    });

  std::vector<std::string_view> picked;
  std::string line_out;
  std::uint64_t records = 0;
  Error fatal;

  auto write_row = [&](const std::vector<std::string_view>& fields) {
    line_out.clear();
    if (select) {
      project(fields, offsets, picked);
      serialize_row(picked, ccfg.delimiter, line_out);
    } else {
      serialize_row(fields, ccfg.delimiter, line_out);
    }
    if (!out.write(line_out))
      return fail(&fatal, ErrorKind::Io,
                  "write to " + out.name() + " failed: " + std::strerror(out.last_error()));
    return true;
  };

  auto on_record = [&](const RecordResult& r) {
    if (!r.ok()) {
      log_at(LogLevel::Warn, "csv", [&](std::ostream& o) {
        o << "skipping malformed row, " << r.error->message;
      });
      return true;
    }
    const std::vector<std::string_view>& fields = *r.record->fields();
    if (r.is_header) {
      header.assign(fields.begin(), fields.end());
      log_at(LogLevel::Debug, "csv", [&](std::ostream& o) { o << "header has " << r.record->size() << " columns"; });
      return write_row(fields);
    }
    if (!write_row(fields)) return false;
    ++records;
    stats->set_records(records);
    if (records % kProgressEvery == 0)
      log_at(LogLevel::Debug, "csv", [&](std::ostream& o) { o << "processed " << records << " records"; });
    return true;
  };

  auto on_line = [&](std::string_view line, bool truncated) {
    if (csv.feed(line, truncated, on_record)) return true;
    if (!fatal && csv.fatal()) fail(&fatal, ErrorKind::Parse, csv.error());
    return false;
  };

  auto on_chunk = [&](std::string_view chunk, Error* e) {
    stats->add_bytes(chunk.size());
    if (splitter.feed(chunk, on_line)) return true;
    if (e) *e = fatal;
    return false;
  };

  if (cfg.pipelined) {
    ChunkedTransfer::Config tcfg;
    tcfg.chunk_bytes = cfg.buffer_size;
    tcfg.queue_depth = cfg.queue_depth;
    ChunkedTransfer transfer(tcfg);
    if (!transfer.run(in, on_chunk, err)) return false;
    log_at(LogLevel::Debug, "transfer", [&](std::ostream& o) { o << transfer.chunks_sent() << " chunks handed off"; });
  } else {
    std::vector<char> buf;
    try {
      buf.resize(cfg.buffer_size);
    } catch (const std::bad_alloc&) {
      return fail(err, ErrorKind::Io,
                  "cannot allocate a " + std::to_string(cfg.buffer_size) + " byte read buffer");
    }
    while (true) {
      const std::size_t n = in.read(buf.data(), buf.size());
      if (n == 0) {
        if (in.failed())
          return fail(err, ErrorKind::Io,
                      "read from " + in.name() + " failed: " + std::strerror(in.last_error()));
        break;
      }
      if (!on_chunk(std::string_view(buf.data(), n), err)) return false;
    }
  }

  const bool tail_ok = splitter.finish(on_line) && csv.finish(on_record);
  malformed = csv.malformed();
  if (!tail_ok) {
    if (!fatal && csv.fatal()) fail(&fatal, ErrorKind::Parse, csv.error());
    if (err) *err = fatal;
    return false;
  }

  if (!out.flush())
    return fail(err, ErrorKind::Io,
                "flush of " + out.name() + " failed: " + std::strerror(out.last_error()));

  log_at(LogLevel::Info, "csv", [&](std::ostream& o) {
    o << "total records processed: " << records << ", malformed rows skipped: " << malformed;
  });
  log_at(LogLevel::Debug, "csv", [&](std::ostream& o) {
    o << "row arena high water " << row_arena.high_water() << " bytes";
  });
  return true;
}

void StreamProcessor::Impl::print_stats(std::chrono::duration<double> wall) const {
  const double secs = wall.count();
  std::ostringstream o;
  o << std::fixed << std::setprecision(2);
  o << "\n=== Processing Statistics ===\n"
    << "Records processed: " << stats->records() << "\n"
    << "Bytes processed: " << stats->bytes() << "\n"
    << "Malformed rows skipped: " << malformed << "\n"
    << "Processing time: " << std::setprecision(6) << secs << "s\n"
    << std::setprecision(2)
    << "Records per second: " << ProcessingStats::rate(stats->records(), secs) << "\n"
    << "Memory usage: " << memory_mb() << " MB (estimated)\n";
  std::cerr << o.str();
}

StreamProcessor::StreamProcessor(Config cfg) : p_(new Impl(std::move(cfg))) {}
StreamProcessor::~StreamProcessor() { delete p_; }

const ProcessingStats& StreamProcessor::stats() const noexcept { return *p_->stats; }
std::uint64_t StreamProcessor::malformed_rows() const noexcept { return p_->malformed; }
const std::vector<std::string>& StreamProcessor::header() const noexcept { return p_->header; }
double StreamProcessor::estimated_memory_mb() const noexcept { return p_->memory_mb(); }

bool StreamProcessor::process(ByteSource& in, ByteSink& out, Error* err) {
  if (!validate_config(p_->cfg, err)) return false;
  return p_->process(in, out, err);
}

bool StreamProcessor::run(Error* err) {
  const Config& cfg = p_->cfg;
  if (!validate_config(cfg, err)) return false;
  log_at(LogLevel::Info, "csv", [&](std::ostream& o) { o << "starting: " << describe_config(cfg); });

  auto in = open_input(cfg.input, cfg.buffer_size, err);
  if (!in) return false;
  auto out = open_output(cfg.output, cfg.buffer_size, err);
  if (!out) return false;

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  if (!p_->process(*in, *out, err)) return false;
  const ch::duration<double> wall = ch::steady_clock::now() - t0;
  log_at(LogLevel::Info, "csv", [&](std::ostream& o) { o << "processing completed in " << wall.count() << "s"; });

  if (cfg.stats) p_->print_stats(wall);

  if (!cfg.stats_json.empty()) {
    const double secs = wall.count();
    RunJsonPayload p{};
    p.rows = p_->stats->records();
    p.bytes = p_->stats->bytes();
    p.malformed_rows = p_->malformed;
    p.wall_time_ms = secs * 1000.0;
    p.throughput_mb_s = ProcessingStats::rate(p.bytes, secs) / kMiB;
    p.rows_per_sec = ProcessingStats::rate(p.rows, secs);
    p.est_memory_mb = estimated_memory_mb();
    p.buffer_size = cfg.buffer_size;
    p.mode = cfg.pipelined ? "pipelined" : "sequential";
    p.input = in->name();
    p.output = out->name();
    if (cfg.fields) p.fields = *cfg.fields;
    if (!RunJsonWriter::write_file(cfg.stats_json, p, err)) return false;
  }
  return true;
}

}
