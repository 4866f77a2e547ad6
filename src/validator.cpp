#include "csvlint/validator.h"
#include "csvlint/utf8.h"

#include <sstream>

namespace csvlint {

const char* final_line_ending_to_string(FinalLineEnding policy) {
    switch (policy) {
        case FinalLineEnding::OPTIONAL: return "optional";
        case FinalLineEnding::REQUIRED: return "required";
        case FinalLineEnding::OPTIONAL_IF_NO_DATA: return "optional-if-no-data";
    }
    return "unknown";
}

namespace {

bool is_special(char c, char delimiter) {
    return c == delimiter || c == QUOTE_CHAR || c == '\r' || c == '\n';
}

}  // namespace

struct Validator::Impl {
    Dialect dialect;
    ValidationOptions options;
    Scanner scanner;
    DefectCollector collector;
    ValidationResult result;

    bool have_header = false;
    size_t header_fields = 0;
    bool halted = false;
    bool done = false;

    Impl(ByteSource& source, const Dialect& d, const ValidationOptions& opts)
        : dialect(d), options(opts), scanner(source, d, opts.chunk_size, opts.skip_blank_lines),
          collector(opts.max_errors) {
        if (dialect.strict_rfc4180 && dialect.delimiter != ',') {
            Defect defect(0, ErrorCategory::IO_ERROR,
                          "RFC 4180 mode requires a comma delimiter, got " +
                              delimiter_name(dialect.delimiter));
            defect.fatal = true;
            collector.add_error(std::move(defect));
            halted = true;
            finish();
        }
    }

    std::string context_of(const Record& record) const {
        if (options.context_width == 0) return std::string();
        std::string joined;
        for (size_t i = 0; i < record.field_count(); ++i) {
            if (i > 0) joined += dialect.delimiter;
            joined += record[i].data;
            // Enough text for the window even after escaping
            if (joined.size() > options.context_width * 4) break;
        }
        return utf8_truncate(escape_for_display(joined), options.context_width);
    }

    void check_field_count(const Record& record) {
        if (!have_header) {
            have_header = true;
            header_fields = record.field_count();
            result.header_field_count = header_fields;
            return;
        }
        if (record.field_count() == header_fields) return;

        std::ostringstream msg;
        msg << "wrong number of fields: expected " << header_fields << ", found "
            << record.field_count();
        Defect defect(record.record_number(), ErrorCategory::FIELD_COUNT_MISMATCH, msg.str());
        defect.byte_offset = record.byte_offset();
        defect.context = context_of(record);
        collector.add_error(std::move(defect));
    }

    bool final_terminator_missing_ok(const Record& record) const {
        switch (options.final_line_ending) {
            case FinalLineEnding::OPTIONAL: return true;
            case FinalLineEnding::REQUIRED: return false;
            case FinalLineEnding::OPTIONAL_IF_NO_DATA: return record.record_number() <= 1;
        }
        return true;
    }

    void check_line_endings(const Record& record) {
        if (!dialect.strict_rfc4180) return;

        LineEnding le = record.line_ending();
        if (le == LineEnding::LF || le == LineEnding::CR) {
            Defect defect(record.record_number(), ErrorCategory::LINE_ENDING_ERROR,
                          std::string("invalid line ending ") + line_ending_to_string(le) +
                              " (RFC 4180 requires CRLF)");
            defect.byte_offset = record.byte_offset();
            collector.add_error(std::move(defect));
        } else if (le == LineEnding::NONE && !final_terminator_missing_ok(record)) {
            Defect defect(record.record_number(), ErrorCategory::LINE_ENDING_ERROR,
                          "missing line ending on last record (RFC 4180 requires CRLF)");
            defect.byte_offset = record.byte_offset();
            collector.add_error(std::move(defect));
        }

        for (const auto& field : record) {
            if (!field.bare_line_break) continue;
            Defect defect(record.record_number(), ErrorCategory::LINE_ENDING_ERROR,
                          "invalid line break inside quoted field " +
                              std::to_string(field.field_index + 1) +
                              " (RFC 4180 requires CRLF)");
            defect.field = field.field_index + 1;
            defect.byte_offset = record.byte_offset();
            collector.add_error(std::move(defect));
        }
    }

    void forward_issues(const Record& record, bool fatal) {
        for (const auto& issue : record.issues()) {
            if (issue.fatal != fatal) continue;
            Defect defect(record.record_number(), issue.category, issue.message);
            defect.quote_kind = issue.quote_kind;
            defect.field = issue.field;
            defect.byte_offset = issue.byte_offset;
            defect.fatal = issue.fatal;
            collector.add_error(std::move(defect));
        }
    }

    void check_recovered_fields(const Record& record) {
        for (const auto& field : record) {
            if (!field.recovered) continue;
            bool special = false;
            for (char c : field.data) {
                if (is_special(c, dialect.delimiter)) {
                    special = true;
                    break;
                }
            }
            if (!special) continue;

            Defect defect(record.record_number(), ErrorCategory::UNESCAPED_SPECIAL_CHARACTER,
                          "unescaped special character in field " +
                              std::to_string(field.field_index + 1));
            defect.field = field.field_index + 1;
            defect.byte_offset = record.byte_offset();
            defect.context = utf8_truncate(escape_for_display(field.data), options.context_width);
            collector.add_error(std::move(defect));
        }
    }

    void check_record(const Record& record) {
        if (record.truncated()) {
            // Only what the scanner saw before it stopped is meaningful
            forward_issues(record, false);
            forward_issues(record, true);
            return;
        }

        check_field_count(record);
        check_line_endings(record);
        forward_issues(record, false);
        check_recovered_fields(record);
    }

    void finish() {
        if (done) return;
        done = true;

        if (!halted && collector.limit_reached()) {
            result.error_limit_reached = true;
            collector.truncate_to_limit();
        }

        result.errors = collector.take();
        result.halted = halted;
        result.valid = result.errors.empty() && !halted;
        result.records = scanner.records_scanned();
        result.bytes = scanner.bytes_consumed();
    }

    bool step() {
        if (done) return false;

        if (!scanner.next_record()) {
            halted = halted || scanner.halted();
            finish();
            return false;
        }

        check_record(scanner.record());

        if (scanner.halted() || collector.has_fatal_errors()) {
            halted = true;
            finish();
            return false;
        }
        if (collector.limit_reached()) {
            finish();
            return false;
        }
        return true;
    }

    const ValidationResult& snapshot() {
        if (!done) {
            result.errors = collector.errors();
            result.valid = result.errors.empty();
            result.records = scanner.records_scanned();
            result.bytes = scanner.bytes_consumed();
        }
        return result;
    }
};

Validator::Validator(ByteSource& source, const Dialect& dialect, const ValidationOptions& options)
    : impl_(std::make_unique<Impl>(source, dialect, options)) {}

Validator::~Validator() = default;

Validator::Validator(Validator&&) noexcept = default;
Validator& Validator::operator=(Validator&&) noexcept = default;

bool Validator::step() {
    return impl_->step();
}

const ValidationResult& Validator::run() {
    while (impl_->step()) {
    }
    return impl_->result;
}

const ValidationResult& Validator::result() const {
    return impl_->snapshot();
}

bool Validator::done() const {
    return impl_->done;
}

size_t Validator::expected_field_count() const {
    return impl_->header_fields;
}

const Dialect& Validator::dialect() const {
    return impl_->dialect;
}

const ValidationOptions& Validator::options() const {
    return impl_->options;
}

ValidationResult validate(ByteSource& source, const Dialect& dialect,
                          const ValidationOptions& options) {
    Validator validator(source, dialect, options);
    return validator.run();
}

ValidationResult validate(std::istream& input, const Dialect& dialect,
                          const ValidationOptions& options) {
    StreamSource source(input);
    return validate(source, dialect, options);
}

}  // namespace csvlint
