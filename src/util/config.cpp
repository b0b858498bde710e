#include "csvpipe/config.hpp"
#include "csvpipe/errors.hpp"
#include <charconv>
#include <sstream>
#include <string>

namespace cp {

namespace {
constexpr std::size_t kMaxBytes = std::size_t(1) << 30; // 1 GiB
constexpr std::size_t kMaxQueueDepth = 1024;
}

bool validate_config(const Config& cfg, Error* err) {
  if (cfg.buffer_size == 0)
    return fail(err, ErrorKind::Config, "buffer size must be greater than zero");
  if (cfg.queue_depth == 0)
    return fail(err, ErrorKind::Config, "queue depth must be greater than zero");
  if (cfg.max_record_bytes == 0)
    return fail(err, ErrorKind::Config, "max record bytes must be greater than zero");
  if (cfg.buffer_size > kMaxBytes)
    return fail(err, ErrorKind::Config,
                "buffer size " + std::to_string(cfg.buffer_size) + " exceeds " + std::to_string(kMaxBytes));
  if (cfg.max_record_bytes > kMaxBytes)
    return fail(err, ErrorKind::Config,
                "max record bytes " + std::to_string(cfg.max_record_bytes) + " exceeds " + std::to_string(kMaxBytes));
  if (cfg.queue_depth > kMaxQueueDepth)
    return fail(err, ErrorKind::Config,
                "queue depth " + std::to_string(cfg.queue_depth) + " exceeds " + std::to_string(kMaxQueueDepth));
  if (cfg.fields && cfg.fields->empty())
    return fail(err, ErrorKind::FieldSelection, "field list is empty");
  return true;
}

bool parse_field_list(std::string_view list, std::vector<std::size_t>& out, Error* err) {
  out.clear();
  if (list.empty()) return fail(err, ErrorKind::FieldSelection, "field list is empty");

  std::size_t start = 0;
  while (start <= list.size()) {
    std::size_t comma = list.find(',', start);
    if (comma == std::string_view::npos) comma = list.size();
    std::string_view tok = list.substr(start, comma - start);
    if (tok.empty())
      return fail(err, ErrorKind::FieldSelection, "empty entry in field list '" + std::string(list) + "'");

    std::size_t v = 0;
    auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
    if (ec != std::errc() || ptr != tok.data() + tok.size())
      return fail(err, ErrorKind::FieldSelection, "invalid field index '" + std::string(tok) + "'");
    out.push_back(v);
    start = comma + 1;
  }
  return true;
}

std::string describe_config(const Config& cfg) {
  std::ostringstream o;
  o << "input=" << (cfg.input ? *cfg.input : "<stdin>")
    << " output=" << (cfg.output ? *cfg.output : "<stdout>")
    << " fields=";
  if (cfg.fields) {
    for (std::size_t i = 0; i < cfg.fields->size(); ++i) {
      if (i) o << ',';
      o << (*cfg.fields)[i];
    }
  } else {
    o << "all";
  }
  o << " buffer_size=" << cfg.buffer_size
    << " threads=";
  if (cfg.threads) o << *cfg.threads; else o << "auto";
  o << " mode=" << (cfg.pipelined ? "pipelined" : "sequential");
  if (cfg.pipelined) o << " queue_depth=" << cfg.queue_depth;
  o << " stats=" << (cfg.stats ? "on" : "off");
  return o.str();
}

}
