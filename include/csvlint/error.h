#ifndef CSVLINT_ERROR_H
#define CSVLINT_ERROR_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace csvlint {

// Defect categories. The set is closed: every switch over it is exhaustive
// so that adding a category is checked at each consumer.
enum class ErrorCategory {
    FIELD_COUNT_MISMATCH,        // Record has a different field count than the header
    LINE_ENDING_ERROR,           // Line break other than CRLF in RFC 4180 mode
    QUOTE_ERROR,                 // See QuoteErrorKind
    UNESCAPED_SPECIAL_CHARACTER, // Lazily recovered field holds a delimiter, quote or line break
    ENCODING_ERROR,              // Input is not valid UTF-8
    IO_ERROR                     // Read failure or unusable configuration
};

// Subkind of ErrorCategory::QUOTE_ERROR.
enum class QuoteErrorKind {
    NONE = 0,
    UNTERMINATED_QUOTE,  // Quoted field still open at end of input
    BARE_QUOTE,          // Quote inside an unquoted field
    MALFORMED_ESCAPE     // Closing quote followed by something other than a quote, delimiter or line break
};

// A single rule violation, attributed to a record.
struct Defect {
    uint64_t record_number;   // 1-indexed, header is record 1; 0 for run-level defects
    ErrorCategory category;
    QuoteErrorKind quote_kind = QuoteErrorKind::NONE;
    size_t field = 0;         // 1-indexed field, 0 when the defect concerns the whole record
    size_t byte_offset = 0;   // Offset of the offending byte, or of the record start
    bool fatal = false;

    std::string message;      // Human-readable detail
    std::string context;      // Snippet of the offending record

    Defect(uint64_t record, ErrorCategory cat, const std::string& msg)
        : record_number(record), category(cat), message(msg) {}

    // "Record #N has error: <message>", followed by the context line if any.
    std::string to_string() const;

    bool operator==(const Defect& other) const;
    bool operator!=(const Defect& other) const { return !(*this == other); }
};

// Outcome of one validation run. Owned by the caller once the run completes.
struct ValidationResult {
    std::vector<Defect> errors;
    bool valid = true;
    bool halted = false;               // A fatal condition stopped the scan early
    bool error_limit_reached = false;  // ValidationOptions::max_errors stopped the scan early

    uint64_t records = 0;              // Records scanned, header included
    uint64_t bytes = 0;                // Bytes consumed from the source
    size_t header_field_count = 0;

    size_t count(ErrorCategory category) const;

    // The defect describing a fatal abort, or nullptr.
    const Defect* fatal_error() const;
};

// Accumulates defects in discovery order during a run.
class DefectCollector {
public:
    explicit DefectCollector(size_t max_errors = 0)
        : max_errors_(max_errors), has_fatal_(false) {}

    void add_error(const Defect& defect) {
        errors_.push_back(defect);
        if (defect.fatal) {
            has_fatal_ = true;
        }
    }

    void add_error(Defect&& defect) {
        bool fatal = defect.fatal;
        errors_.push_back(std::move(defect));
        if (fatal) {
            has_fatal_ = true;
        }
    }

    // True once a fatal defect was recorded or the error cap was reached.
    bool should_stop() const { return has_fatal_ || limit_reached(); }

    bool limit_reached() const {
        return max_errors_ != 0 && errors_.size() >= max_errors_;
    }

    bool has_errors() const { return !errors_.empty(); }
    bool has_fatal_errors() const { return has_fatal_; }
    size_t error_count() const { return errors_.size(); }
    size_t count(ErrorCategory category) const;
    const std::vector<Defect>& errors() const { return errors_; }

    // Moves the collected defects out, leaving the collector empty.
    std::vector<Defect> take();

    // Drops defects beyond the cap, keeping discovery order.
    void truncate_to_limit();

    std::string summary() const;

    void clear() {
        errors_.clear();
        has_fatal_ = false;
    }

    size_t max_errors() const { return max_errors_; }

private:
    size_t max_errors_;
    std::vector<Defect> errors_;
    bool has_fatal_;
};

const char* category_to_string(ErrorCategory category);
const char* quote_error_kind_to_string(QuoteErrorKind kind);

// Only these two categories may halt a run.
inline bool category_can_be_fatal(ErrorCategory category) {
    return category == ErrorCategory::ENCODING_ERROR ||
           category == ErrorCategory::IO_ERROR;
}

} // namespace csvlint

#endif // CSVLINT_ERROR_H
