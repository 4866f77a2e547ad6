/**
 * @file scanner.cpp
 * @brief Implementation of the streaming CSV scanner.
 */

#include "csvlint/scanner.h"
#include "csvlint/utf8.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace csvlint {

//-----------------------------------------------------------------------------
// Record implementation
//-----------------------------------------------------------------------------

const Field& Record::at(size_t index) const {
    if (index >= fields_.size()) {
        throw std::out_of_range("Field index out of range: " + std::to_string(index));
    }
    return fields_[index];
}

std::vector<std::string> Record::values() const {
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto& field : fields_) {
        out.push_back(field.data);
    }
    return out;
}

void Record::clear() {
    fields_.clear();
    issues_.clear();
    record_number_ = 0;
    byte_offset_ = 0;
    line_ending_ = LineEnding::NONE;
    malformed_ = false;
    truncated_ = false;
    blank_ = false;
}

//-----------------------------------------------------------------------------
// Scanner implementation
//-----------------------------------------------------------------------------

/**
 * @brief Tokenizer states.
 */
enum class ScanState {
    FIELD_START,     ///< At the beginning of a field
    UNQUOTED_FIELD,  ///< Inside an unquoted field
    QUOTED_FIELD,    ///< Inside a quoted field
    QUOTE_PENDING,   ///< Just saw a quote inside a quoted field
    SKIP_FIELD       ///< Discarding the rest of a field after a malformed escape
};

/// Result of pulling one byte from the input.
enum class Fetch { BYTE, END, FATAL };

namespace {

std::string describe_byte(uint8_t c) {
    static const char HEX[] = "0123456789ABCDEF";
    if (c >= 0x20 && c < 0x7F) {
        return std::string("'") + static_cast<char>(c) + "'";
    }
    std::string out = "0x";
    out += HEX[c >> 4];
    out += HEX[c & 0x0F];
    return out;
}

}  // namespace

struct Scanner::Impl {
    ByteSource& source;
    Dialect dialect;

    // Read buffer; bytes are copied into field storage as they are consumed
    std::vector<uint8_t> buffer;
    size_t buf_pos = 0;
    size_t buf_len = 0;
    bool source_done = false;
    bool read_failed = false;
    std::string read_error;

    bool started = false;
    bool finished = false;
    bool halted = false;
    uint64_t consumed = 0;
    uint64_t record_count = 0;
    Encoding encoding = Encoding::UTF8;
    Utf8Validator utf8;

    // Record being built
    Record record;
    ScanState state = ScanState::FIELD_START;
    std::string field;
    bool field_quoted = false;
    bool field_recovered = false;
    bool field_bare_break = false;
    bool quotes_literal = false;  // Quotes are data for the rest of the record
    bool skip_blank_lines = false;

    Impl(ByteSource& src, const Dialect& d, size_t chunk_size, bool skip_blank)
        : source(src), dialect(d), buffer(std::max<size_t>(chunk_size, 4)),
          skip_blank_lines(skip_blank) {}

    // Make at least `want` unread bytes available if the source still has them
    void fill(size_t want) {
        if (buf_len - buf_pos >= want) return;

        if (buf_pos > 0) {
            std::memmove(buffer.data(), buffer.data() + buf_pos, buf_len - buf_pos);
            buf_len -= buf_pos;
            buf_pos = 0;
        }

        while (buf_len < want && !source_done && !read_failed) {
            ReadResult r = source.read(buffer.data() + buf_len, buffer.size() - buf_len);
            if (r.error) {
                read_failed = true;
                read_error = r.message.empty() ? "read error on " + source.name() : r.message;
            } else if (r.bytes == 0) {
                source_done = true;
            } else {
                buf_len += r.bytes;
            }
        }
    }

    void add_issue(ErrorCategory category, QuoteErrorKind kind, uint64_t offset,
                   const std::string& message, bool fatal = false) {
        ScanIssue issue;
        issue.category = category;
        issue.quote_kind = kind;
        issue.field = record.fields_.size() + 1;
        issue.byte_offset = offset;
        issue.fatal = fatal;
        issue.message = message;
        record.issues_.push_back(std::move(issue));
        if (kind != QuoteErrorKind::NONE) {
            record.malformed_ = true;
        }
    }

    void add_fatal(ErrorCategory category, uint64_t offset, const std::string& message) {
        add_issue(category, QuoteErrorKind::NONE, offset, message, true);
        record.truncated_ = true;
        halted = true;
        finished = true;
    }

    really_inline Fetch fetch(uint8_t& c) {
        if (unlikely(buf_pos == buf_len)) {
            fill(1);
            if (buf_pos == buf_len) {
                if (read_failed) {
                    add_fatal(ErrorCategory::IO_ERROR, consumed, read_error);
                    return Fetch::FATAL;
                }
                if (!utf8.complete()) {
                    add_fatal(ErrorCategory::ENCODING_ERROR, consumed,
                              "truncated UTF-8 sequence at end of input");
                    return Fetch::FATAL;
                }
                return Fetch::END;
            }
        }

        c = buffer[buf_pos++];
        ++consumed;
        if (likely(c < 0x80 && utf8.complete())) {
            return Fetch::BYTE;
        }
        if (!utf8.feed(c)) {
            add_fatal(ErrorCategory::ENCODING_ERROR, consumed - 1,
                      "invalid UTF-8 byte " + describe_byte(c) + " at byte offset " +
                          std::to_string(consumed - 1));
            return Fetch::FATAL;
        }
        return Fetch::BYTE;
    }

    // Look at the next byte without consuming it
    bool peek(uint8_t& c) {
        if (buf_pos == buf_len) {
            fill(1);
            if (buf_pos == buf_len) return false;
        }
        c = buffer[buf_pos];
        return true;
    }

    // Returns false if the input announces an encoding other than UTF-8
    bool check_bom() {
        fill(4);
        BomResult bom = detect_bom(buffer.data() + buf_pos, buf_len - buf_pos);
        encoding = bom.encoding;
        if (bom.encoding == Encoding::UTF8_BOM) {
            buf_pos += bom.bom_length;
            consumed += bom.bom_length;
            return true;
        }
        if (bom.encoding != Encoding::UTF8) {
            add_fatal(ErrorCategory::ENCODING_ERROR, 0,
                      std::string("input is ") + encoding_to_string(bom.encoding) +
                          " encoded (byte order mark found); only UTF-8 is supported");
            return false;
        }
        return true;
    }

    void emit_field() {
        Field f;
        f.data = std::move(field);
        f.is_quoted = field_quoted;
        f.recovered = field_recovered;
        f.bare_line_break = field_bare_break;
        f.field_index = record.fields_.size();
        record.fields_.push_back(std::move(f));

        field.clear();
        field_quoted = false;
        field_recovered = false;
        field_bare_break = false;
    }

    // c is CR or LF; consumes the LF of a CRLF pair
    LineEnding take_line_ending(uint8_t c) {
        if (c == '\n') return LineEnding::LF;
        uint8_t next;
        if (peek(next) && next == '\n') {
            uint8_t lf;
            fetch(lf);
            return LineEnding::CRLF;
        }
        return LineEnding::CR;
    }

    bool deliver() {
        record.record_number_ = ++record_count;
        return true;
    }

    void end_of_input() {
        switch (state) {
            case ScanState::QUOTED_FIELD:
                add_issue(ErrorCategory::QUOTE_ERROR, QuoteErrorKind::UNTERMINATED_QUOTE,
                          consumed, "unterminated quote");
                emit_field();
                break;
            case ScanState::FIELD_START:
            case ScanState::UNQUOTED_FIELD:
            case ScanState::QUOTE_PENDING:
            case ScanState::SKIP_FIELD:
                emit_field();
                break;
        }
        record.line_ending_ = LineEnding::NONE;
        finished = true;
    }

    bool next_record() {
        if (finished) return false;

        record.clear();
        state = ScanState::FIELD_START;
        quotes_literal = false;
        field.clear();
        field_quoted = field_recovered = field_bare_break = false;

        if (!started) {
            started = true;
            if (!check_bom()) {
                return deliver();
            }
        }

        record.byte_offset_ = consumed;
        const char delim = dialect.delimiter;
        const uint8_t quote = static_cast<uint8_t>(QUOTE_CHAR);
        bool any = false;

        while (true) {
            uint8_t c;
            Fetch f = fetch(c);
            if (f == Fetch::END) {
                if (!any) {
                    finished = true;
                    return false;
                }
                end_of_input();
                return deliver();
            }
            if (f == Fetch::FATAL) {
                if (any) emit_field();
                return deliver();
            }

            const bool first = !any;
            any = true;

            switch (state) {
                case ScanState::FIELD_START:
                    if (c == static_cast<uint8_t>(delim)) {
                        emit_field();
                    } else if (c == quote && !quotes_literal) {
                        state = ScanState::QUOTED_FIELD;
                        field_quoted = true;
                    } else if (c == '\r' || c == '\n') {
                        if (first && skip_blank_lines) {
                            // Drop the line entirely; it is neither numbered nor delivered
                            take_line_ending(c);
                            record.byte_offset_ = consumed;
                            any = false;
                            break;
                        }
                        record.blank_ = first;
                        emit_field();
                        record.line_ending_ = take_line_ending(c);
                        return deliver();
                    } else {
                        state = ScanState::UNQUOTED_FIELD;
                        field.push_back(static_cast<char>(c));
                    }
                    break;

                case ScanState::UNQUOTED_FIELD:
                    if (c == static_cast<uint8_t>(delim)) {
                        emit_field();
                        state = ScanState::FIELD_START;
                    } else if (c == '\r' || c == '\n') {
                        emit_field();
                        record.line_ending_ = take_line_ending(c);
                        return deliver();
                    } else {
                        if (c == quote) {
                            if (dialect.lazy_quotes) {
                                field_recovered = true;
                            } else if (!quotes_literal) {
                                add_issue(ErrorCategory::QUOTE_ERROR, QuoteErrorKind::BARE_QUOTE,
                                          consumed - 1, "bare \" in non-quoted field");
                                quotes_literal = true;
                            }
                        }
                        field.push_back(static_cast<char>(c));
                    }
                    break;

                case ScanState::QUOTED_FIELD:
                    if (c == quote) {
                        state = ScanState::QUOTE_PENDING;
                    } else if (c == '\r') {
                        field.push_back('\r');
                        uint8_t next;
                        if (peek(next) && next == '\n') {
                            uint8_t lf;
                            fetch(lf);
                            field.push_back('\n');
                        } else {
                            field_bare_break = true;
                        }
                    } else {
                        if (c == '\n') field_bare_break = true;
                        field.push_back(static_cast<char>(c));
                    }
                    break;

                case ScanState::QUOTE_PENDING:
                    if (c == quote) {
                        // Doubled quote escape
                        field.push_back(static_cast<char>(quote));
                        state = ScanState::QUOTED_FIELD;
                    } else if (c == static_cast<uint8_t>(delim)) {
                        emit_field();
                        state = ScanState::FIELD_START;
                    } else if (c == '\r' || c == '\n') {
                        emit_field();
                        record.line_ending_ = take_line_ending(c);
                        return deliver();
                    } else if (dialect.lazy_quotes) {
                        // Keep the lone quote and carry on as unquoted text
                        field.push_back(static_cast<char>(quote));
                        field.push_back(static_cast<char>(c));
                        field_recovered = true;
                        state = ScanState::UNQUOTED_FIELD;
                    } else {
                        add_issue(ErrorCategory::QUOTE_ERROR, QuoteErrorKind::MALFORMED_ESCAPE,
                                  consumed - 1,
                                  "invalid escape sequence: unexpected " + describe_byte(c) +
                                      " after closing quote in quoted field");
                        state = ScanState::SKIP_FIELD;
                    }
                    break;

                case ScanState::SKIP_FIELD:
                    if (c == static_cast<uint8_t>(delim)) {
                        emit_field();
                        state = ScanState::FIELD_START;
                    } else if (c == '\r' || c == '\n') {
                        emit_field();
                        record.line_ending_ = take_line_ending(c);
                        return deliver();
                    }
                    break;
            }
        }
    }
};

Scanner::Scanner(ByteSource& source, const Dialect& dialect, size_t chunk_size,
                 bool skip_blank_lines)
    : impl_(std::make_unique<Impl>(source, dialect, chunk_size, skip_blank_lines)) {}

Scanner::~Scanner() = default;

Scanner::Scanner(Scanner&&) noexcept = default;
Scanner& Scanner::operator=(Scanner&&) noexcept = default;

bool Scanner::next_record() {
    return impl_->next_record();
}

const Record& Scanner::record() const {
    return impl_->record;
}

const Dialect& Scanner::dialect() const {
    return impl_->dialect;
}

uint64_t Scanner::records_scanned() const {
    return impl_->record_count;
}

uint64_t Scanner::bytes_consumed() const {
    return impl_->consumed;
}

bool Scanner::halted() const {
    return impl_->halted;
}

bool Scanner::finished() const {
    return impl_->finished;
}

Encoding Scanner::encoding() const {
    return impl_->encoding;
}

RecordIterator Scanner::begin() {
    return RecordIterator(this);
}

RecordIterator Scanner::end() {
    return RecordIterator();
}

//-----------------------------------------------------------------------------
// RecordIterator implementation
//-----------------------------------------------------------------------------

RecordIterator::RecordIterator() : scanner_(nullptr), at_end_(true) {}

RecordIterator::RecordIterator(Scanner* scanner) : scanner_(scanner), at_end_(false) {
    // Advance to first record
    if (!scanner_ || !scanner_->next_record()) {
        at_end_ = true;
    }
}

RecordIterator::reference RecordIterator::operator*() const {
    return scanner_->record();
}

RecordIterator::pointer RecordIterator::operator->() const {
    return &scanner_->record();
}

RecordIterator& RecordIterator::operator++() {
    if (scanner_ && !scanner_->next_record()) {
        at_end_ = true;
    }
    return *this;
}

RecordIterator RecordIterator::operator++(int) {
    RecordIterator tmp = *this;
    ++(*this);
    return tmp;
}

bool RecordIterator::operator==(const RecordIterator& other) const {
    if (at_end_ && other.at_end_) return true;
    if (at_end_ || other.at_end_) return false;
    return scanner_ == other.scanner_;
}

bool RecordIterator::operator!=(const RecordIterator& other) const {
    return !(*this == other);
}

}  // namespace csvlint
