#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cp {

struct Error;

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  std::uint64_t malformed_rows = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;
  double est_memory_mb = 0.0;

  // Run settings
  std::size_t buffer_size = 0;
  std::string mode;        // "sequential" | "pipelined"
  std::string input;       // "<stdin>" when unnamed
  std::string output;      // "<stdout>" when unnamed
  std::vector<std::size_t> fields;
};

class RunJsonWriter {
public:
  static std::string to_json(const RunJsonPayload& p);
  static bool write_file(const std::string& path, const RunJsonPayload& p, Error* err);
};

}
