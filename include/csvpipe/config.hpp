#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cp {

struct Error;

struct Config {
  std::optional<std::string> input;               // none -> stdin
  std::optional<std::string> output;              // none -> stdout
  std::optional<std::vector<std::size_t>> fields; // 1-based, in output order
  std::size_t buffer_size = 64 * 1024;            // 64 KiB
  std::optional<std::size_t> threads;             // accepted, not used to fan out
  bool verbose = false;
  bool stats = false;

  bool        pipelined = false;                  // reader thread + processing thread
  std::size_t queue_depth = 4;                    // chunks in flight when pipelined
  std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per logical row
  std::string stats_json;                         // empty -> no run report
};

bool validate_config(const Config& cfg, Error* err);

// "1,3,2" -> {1,3,2}. Rejects empty tokens and anything that is not a
// non-negative decimal integer.
bool parse_field_list(std::string_view list, std::vector<std::size_t>& out, Error* err);

// Single-line rendering for the start-of-run log message.
std::string describe_config(const Config& cfg);

}
