#include "csvpipe/csv_codec.hpp"
#include "csvpipe/arena.hpp"
#include "csvpipe/errors.hpp"
#include "csvpipe/record_view.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>
#include <vector>

namespace cp {

FieldSplitter::FieldSplitter(const CsvConfig& cfg, Arena& arena) : cfg_(cfg), arena_(arena) {}

LineParse FieldSplitter::push(std::string_view line) {
  if (!in_row_) {
    arena_.reset();
    ends_.clear();
    mode_ = Mode::FieldStart;
    row_bytes_ = 0;
    in_row_ = true;
  } else {
    // the line break belongs to the open quoted field
    *arena_.alloc(1) = '\n';
    ++row_bytes_;
  }
  row_bytes_ += line.size();

  // Unquoting only ever shrinks the text, so line.size() bytes is enough.
  char* const base = arena_.alloc(line.size());
  const std::size_t base_off = arena_.used() - line.size();
  char* w = base;
  auto close_field = [&] { ends_.push_back(base_off + static_cast<std::size_t>(w - base)); };

  Mode mode = mode_;
  for (const char c : line) {
    switch (mode) {
      case Mode::FieldStart:
        if (c == cfg_.quote) {
          mode = Mode::Quoted;
        } else if (c == cfg_.delimiter) {
          close_field();
        } else {
          *w++ = c;
          mode = Mode::Unquoted;
        }
        break;
      case Mode::Unquoted:
        // a quote inside an unquoted field is literal
        if (c == cfg_.delimiter) { close_field(); mode = Mode::FieldStart; }
        else *w++ = c;
        break;
      case Mode::Quoted:
        if (c == cfg_.quote) mode = Mode::QuoteEscape;
        else *w++ = c;
        break;
      case Mode::QuoteEscape:
        if (c == cfg_.quote) {
          *w++ = c;                         // escaped quote
          mode = Mode::Quoted;
        } else if (c == cfg_.delimiter) {
          close_field();
          mode = Mode::FieldStart;
        } else {
          *w++ = c;                         // "x"y reads as xy
          mode = Mode::Unquoted;
        }
        break;
    }
  }
  mode_ = mode;
  arena_.unalloc(line.size() - static_cast<std::size_t>(w - base));
  return mode_ == Mode::Quoted ? LineParse::Incomplete : LineParse::Ok;
}

void FieldSplitter::end_row(std::vector<std::string_view>& out) {
  ends_.push_back(arena_.used());
  out.clear();
  const char* base = arena_.data();
  std::size_t start = 0;
  for (const std::size_t end : ends_) {
    out.emplace_back(base + start, end - start);
    start = end;
  }
  in_row_ = false;
}

void serialize_row(const std::vector<std::string_view>& fields, char delimiter,
                   std::string& out) {
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i) out.push_back(delimiter);
    out.append(fields[i].data(), fields[i].size());
  }
  out.push_back('\n');
}

struct CsvFsm::Impl {
  CsvConfig cfg;
  Arena& header_arena;
  FieldSplitter splitter;

  std::vector<std::string_view> header;
  std::vector<std::string_view> fields;
  bool has_header{false};

  std::uint64_t line_no{0};
  std::uint64_t row_line{0};  // physical line the current row started on
  bool bad_utf8{false};
  Error row_err;

  Impl(const CsvConfig& c, Arena& ha, Arena& ra) : cfg(c), header_arena(ha), splitter(c, ra) {}

  // Header tokens go to header_arena in one block so they survive row_arena resets.
  void capture_header() {
    std::size_t total = 0;
    for (auto sv : fields) total += sv.size();
    header_arena.reset();
    char* dst = header_arena.alloc(total);
    header.clear();
    header.reserve(fields.size());
    for (auto sv : fields) {
      sv.copy(dst, sv.size());
      header.emplace_back(dst, sv.size());
      dst += sv.size();
    }
    has_header = true;
  }
};

CsvFsm::CsvFsm(const CsvConfig& cfg, Arena& header_arena, Arena& row_arena)
  : p_(new Impl(cfg, header_arena, row_arena)) {}

CsvFsm::~CsvFsm() { delete p_; }

bool CsvFsm::reject(std::uint64_t at, const std::string& why, const RecordCallback& on_record) {
  Impl& s = *p_;
  s.splitter.abandon_row();
  s.bad_utf8 = false;
  if (!s.has_header) {
    fatal_ = true;
    err_ = "header row (line " + std::to_string(at) + "): " + why;
    return false;
  }
  ++malformed_;
  s.row_err.kind = ErrorKind::Parse;
  s.row_err.message = "line " + std::to_string(at) + ": " + why;
  RecordResult r;
  r.error = &s.row_err;
  r.line = at;
  return on_record(r);
}

bool CsvFsm::emit_row(const RecordCallback& on_record) {
  Impl& s = *p_;
  s.splitter.end_row(s.fields);
  if (s.bad_utf8) return reject(s.row_line, "invalid UTF-8", on_record);

  RecordResult r;
  r.line = s.row_line;
  if (!s.has_header) {
    s.capture_header();
    RecordView rv(&s.header);
    r.record = &rv;
    r.is_header = true;
    return on_record(r);
  }
  RecordView rv(&s.fields);
  r.record = &rv;
  return on_record(r);
}

bool CsvFsm::feed(std::string_view line, bool truncated, const RecordCallback& on_record) {
  Impl& s = *p_;
  ++s.line_no;
  const bool continuing = s.splitter.in_row();
  const std::uint64_t start_line = continuing ? s.row_line : s.line_no;

  if (truncated)
    return reject(start_line, "row exceeds " + std::to_string(s.cfg.max_record_bytes) + " bytes", on_record);
  if (!continuing) {
    if (line.empty()) return true; // blank lines are not rows
    s.row_line = s.line_no;
    s.bad_utf8 = false;
  } else if (s.splitter.row_bytes() + 1 + line.size() > s.cfg.max_record_bytes) {
    return reject(start_line, "quoted field exceeds " + std::to_string(s.cfg.max_record_bytes) + " bytes",
                  on_record);
  }
  // A multi-byte sequence never contains '\n', so lines validate on their own.
  if (!simdjson::validate_utf8(line.data(), line.size())) s.bad_utf8 = true;

  if (s.splitter.push(line) == LineParse::Incomplete) return true;
  return emit_row(on_record);
}

bool CsvFsm::finish(const RecordCallback& on_record) {
  Impl& s = *p_;
  // end of input closes a quoted field that is still open
  if (s.splitter.in_row() && !emit_row(on_record)) return false;
  if (!s.has_header) {
    fatal_ = true;
    err_ = "empty input: no header row";
    return false;
  }
  return true;
}

}
