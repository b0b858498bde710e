#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cp {

class Arena;
class RecordView;
struct Error;

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
  std::size_t max_record_bytes = 8 * 1024 * 1024; // joined multi-line rows included
};

enum class LineParse { Ok, Incomplete };

// Quote-aware field tokenizer fed one physical line at a time. Every byte is
// scanned once: the unquoted text of the current row accumulates in `arena`
// and field ends are kept as offsets, so the arena may grow between lines.
class FieldSplitter {
public:
  FieldSplitter(const CsvConfig& cfg, Arena& arena);

  // Scans `line` as the start of a new row, or as the continuation of the
  // current one after a '\n' when the last push returned Incomplete.
  // Incomplete means the line ended inside a quoted field.
  LineParse push(std::string_view line);

  // Closes the current row. `out` views the arena and stays valid until the
  // next push that starts a row.
  void end_row(std::vector<std::string_view>& out);

  // Drops the row in progress.
  void abandon_row() noexcept { in_row_ = false; }

  bool in_row() const noexcept { return in_row_; }

  // Raw bytes of the current row, joining newlines included.
  std::size_t row_bytes() const noexcept { return row_bytes_; }

private:
  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape };

  CsvConfig cfg_;
  Arena& arena_;
  Mode mode_{Mode::FieldStart};
  std::vector<std::size_t> ends_;
  std::size_t row_bytes_{0};
  bool in_row_{false};
};

// Appends fields joined by `delimiter` plus '\n'. No quoting is applied.
void serialize_row(const std::vector<std::string_view>& fields, char delimiter,
                   std::string& out);

// One item of the record sequence: either a row or the reason it was skipped.
struct RecordResult {
  const RecordView* record = nullptr; // set on success
  const Error* error = nullptr;       // set on a malformed row
  std::uint64_t line = 0;             // 1-based physical line the row starts on
  bool is_header = false;

  bool ok() const noexcept { return record != nullptr; }
};

// Push parser: fed one physical line at a time, emits the header once and then
// one RecordResult per logical row. A malformed data row is reported and
// parsing carries on; a malformed or missing header is fatal.
class CsvFsm {
public:
  // Return false to stop parsing.
  using RecordCallback = std::function<bool(const RecordResult&)>;

  // Split arenas: headers live in `header_arena`, row fields in `row_arena`.
  CsvFsm(const CsvConfig& cfg, Arena& header_arena, Arena& row_arena);
  ~CsvFsm();
  CsvFsm(const CsvFsm&) = delete;
  CsvFsm& operator=(const CsvFsm&) = delete;

  // Returns false when the callback stopped or the header was unusable
  // (fatal() is then true and error() says why).
  bool feed(std::string_view line, bool truncated, const RecordCallback& on_record);

  // End of input: closes a row left inside an open quote.
  bool finish(const RecordCallback& on_record);

  bool fatal() const noexcept { return fatal_; }
  const std::string& error() const { return err_; }
  std::uint64_t malformed() const { return malformed_; }

private:
  bool emit_row(const RecordCallback& on_record);
  bool reject(std::uint64_t at, const std::string& why, const RecordCallback& on_record);

  struct Impl; Impl* p_;
  std::uint64_t malformed_{0};
  bool fatal_{false};
  std::string err_;
};

}
