#include "csvpipe/run_json.hpp"
#include "csvpipe/errors.hpp"
#include <cmath> // std::isfinite
#include <fstream>
#include <sstream>

namespace cp {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:   o << c;      break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"rows\":" << p.rows << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"malformed_rows\":" << p.malformed_rows << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"rows_per_sec\":" << safe_num(p.rows_per_sec) << ",";
  o << "\"est_memory_mb\":" << safe_num(p.est_memory_mb) << ",";
  o << "\"buffer_size\":" << p.buffer_size << ",";

  o << "\"mode\":";   esc(o, p.mode);   o << ",";
  o << "\"input\":";  esc(o, p.input);  o << ",";
  o << "\"output\":"; esc(o, p.output); o << ",";

  o << "\"fields\":[";
  for (size_t i=0;i<p.fields.size();++i){
    if (i) o << ",";
    o << p.fields[i];
  }
  o << "]";

  o << "}";
  return o.str();
}

bool RunJsonWriter::write_file(const std::string& path, const RunJsonPayload& p, Error* err) {
  const std::string body = to_json(p);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return fail(err, ErrorKind::Io, "cannot create run report '" + path + "'");
  out.write(body.data(), static_cast<std::streamsize>(body.size()));
  out.flush();
  if (!out) return fail(err, ErrorKind::Io, "failed to write run report '" + path + "'");
  return true;
}

}
