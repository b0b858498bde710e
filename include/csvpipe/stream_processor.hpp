#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "csvpipe/config.hpp"

namespace cp {

class ByteSource;
class ByteSink;
class ProcessingStats;
struct Error;

// Drives one end-to-end run: header, records, projection, output, flush and
// the optional statistics report.
class StreamProcessor {
public:
  explicit StreamProcessor(Config cfg);
  ~StreamProcessor();
  StreamProcessor(const StreamProcessor&) = delete;
  StreamProcessor& operator=(const StreamProcessor&) = delete;

  // Opens the configured input and output, then processes them.
  bool run(Error* err);

  // Processes caller-owned streams. Does not print or write reports.
  bool process(ByteSource& in, ByteSink& out, Error* err);

  const ProcessingStats& stats() const noexcept;
  std::uint64_t malformed_rows() const noexcept;

  // Input header as captured, kept for diagnostics.
  const std::vector<std::string>& header() const noexcept;

  // Memory estimate in MiB, dominated by I/O buffers.
  double estimated_memory_mb() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
