/**
 * @file scanner.h
 * @brief Streaming, pull-based CSV tokenizer.
 *
 * The Scanner turns a ByteSource into a sequence of Records, one per call to
 * next_record(). It applies quoting and delimiter rules and notes low-level
 * malformations (bare quotes, malformed escapes, unterminated quotes,
 * invalid UTF-8, read failures) on the record being produced. Field-count and
 * line-ending policy are left to the Validator.
 *
 * Only the current record is held in memory; it is overwritten by the next
 * call to next_record(). The sequence is single-pass and cannot be restarted.
 *
 * @code
 * csvlint::FileSource source("data.csv");
 * csvlint::Scanner scanner(source, csvlint::Dialect::csv());
 * for (const auto& record : scanner) {
 *     std::cout << record.record_number() << ": " << record.field_count() << "\n";
 * }
 * @endcode
 */

#ifndef CSVLINT_SCANNER_H
#define CSVLINT_SCANNER_H

#include "csvlint/common_defs.h"
#include "csvlint/dialect.h"
#include "csvlint/encoding.h"
#include "csvlint/error.h"
#include "csvlint/io_util.h"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace csvlint {

/**
 * @brief A single field of a record.
 */
struct Field {
    std::string data;              ///< Content, with doubled quotes collapsed
    bool is_quoted = false;        ///< Field started with a quote
    bool recovered = false;        ///< Produced by lazy-quote recovery
    bool bare_line_break = false;  ///< Quoted content holds a LF or CR that is not part of CRLF
    size_t field_index = 0;        ///< 0-based position in the record
};

/**
 * @brief Low-level problem noticed while producing a record.
 */
struct ScanIssue {
    ErrorCategory category;
    QuoteErrorKind quote_kind = QuoteErrorKind::NONE;
    size_t field = 0;          ///< 1-based field the issue was found in
    size_t byte_offset = 0;    ///< Offset of the offending byte in the input
    bool fatal = false;        ///< Scanning stopped here
    std::string message;
};

/**
 * @brief One logical row of fields.
 */
class Record {
public:
    using const_iterator = std::vector<Field>::const_iterator;

    /// 1-based record number; the header is record 1.
    uint64_t record_number() const { return record_number_; }

    /// Byte offset of the first byte of the record.
    size_t byte_offset() const { return byte_offset_; }

    size_t field_count() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    const Field& operator[](size_t index) const { return fields_[index]; }

    /// @throws std::out_of_range if index >= field_count()
    const Field& at(size_t index) const;

    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    /// Terminator that ended the record; NONE only for the last record.
    LineEnding line_ending() const { return line_ending_; }

    /// Raw terminator bytes.
    std::string_view terminator() const { return line_ending_bytes(line_ending_); }

    bool has_terminator() const { return line_ending_ != LineEnding::NONE; }

    /// A quote malformation was detected while producing this record.
    bool malformed() const { return malformed_; }

    /// Scanning stopped inside this record on a fatal condition.
    bool truncated() const { return truncated_; }

    /// The line held nothing but its terminator.
    bool blank() const { return blank_; }

    const std::vector<ScanIssue>& issues() const { return issues_; }

    /// Field contents in order.
    std::vector<std::string> values() const;

    void clear();

private:
    friend class Scanner;

    std::vector<Field> fields_;
    std::vector<ScanIssue> issues_;
    uint64_t record_number_ = 0;
    size_t byte_offset_ = 0;
    LineEnding line_ending_ = LineEnding::NONE;
    bool malformed_ = false;
    bool truncated_ = false;
    bool blank_ = false;
};

class RecordIterator;

/**
 * @brief Pull-based scanner over a ByteSource.
 *
 * The source must outlive the scanner.
 */
class Scanner {
public:
    /// With skip_blank_lines set, lines holding only a terminator are consumed
    /// without producing a record and do not advance the record number.
    Scanner(ByteSource& source, const Dialect& dialect,
            size_t chunk_size = CSVLINT_DEFAULT_CHUNK_SIZE, bool skip_blank_lines = false);
    ~Scanner();

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept;
    Scanner& operator=(Scanner&&) noexcept;

    /**
     * @brief Produce the next record.
     *
     * @return true if record() now holds a new record; false once the input
     *         is exhausted or a fatal condition ended the previous record.
     */
    bool next_record();

    /// The record produced by the last successful next_record().
    const Record& record() const;

    const Dialect& dialect() const;

    uint64_t records_scanned() const;
    uint64_t bytes_consumed() const;

    /// A fatal condition (encoding or read failure) stopped scanning.
    bool halted() const;

    /// No further records will be produced.
    bool finished() const;

    /// Encoding announced by the input's byte order mark (UTF8 if none).
    Encoding encoding() const;

    RecordIterator begin();
    RecordIterator end();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Input iterator over a Scanner's records.
 */
class RecordIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Record;
    using difference_type = std::ptrdiff_t;
    using pointer = const Record*;
    using reference = const Record&;

    RecordIterator();
    explicit RecordIterator(Scanner* scanner);

    reference operator*() const;
    pointer operator->() const;
    RecordIterator& operator++();
    RecordIterator operator++(int);

    bool operator==(const RecordIterator& other) const;
    bool operator!=(const RecordIterator& other) const;

private:
    Scanner* scanner_;
    bool at_end_;
};

}  // namespace csvlint

#endif  // CSVLINT_SCANNER_H
