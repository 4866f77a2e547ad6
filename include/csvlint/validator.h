/**
 * @file validator.h
 * @brief Record-by-record RFC 4180 rule checking.
 *
 * The Validator owns a Scanner over the caller's ByteSource and applies the
 * per-record rules in a fixed order:
 *
 * 1. Field count must match the header (the header itself is exempt).
 * 2. In strict RFC 4180 mode every record must end in CRLF, and quoted fields
 *    may only hold CRLF line breaks.
 * 3. Quote malformations noticed by the scanner are forwarded.
 * 4. Fields recovered under lazy quotes must not hold the delimiter, a quote
 *    or a line break.
 *
 * A violation of one rule never hides another. Encoding and read failures
 * stop the run; the defect describing them is always the last one.
 *
 * @code
 * csvlint::FileSource source("data.csv");
 * csvlint::ValidationResult result = csvlint::validate(source, csvlint::Dialect::rfc4180());
 * if (!result.valid) {
 *     for (const auto& err : result.errors) std::cerr << err.to_string() << "\n";
 * }
 * @endcode
 */

#ifndef CSVLINT_VALIDATOR_H
#define CSVLINT_VALIDATOR_H

#include "csvlint/common_defs.h"
#include "csvlint/dialect.h"
#include "csvlint/error.h"
#include "csvlint/io_util.h"
#include "csvlint/scanner.h"

#include <cstddef>
#include <istream>
#include <memory>

namespace csvlint {

/**
 * @brief How a missing line ending on the last record is treated in strict mode.
 */
enum class FinalLineEnding {
    OPTIONAL,            ///< Accepted (RFC 4180 section 2.2)
    REQUIRED,            ///< Reported as a line ending error
    OPTIONAL_IF_NO_DATA  ///< Accepted only when the input holds nothing but a header
};

const char* final_line_ending_to_string(FinalLineEnding policy);

/**
 * @brief Run settings that are not part of the dialect.
 */
struct ValidationOptions {
    /// Stop after this many defects (0 = unlimited).
    size_t max_errors = 0;

    FinalLineEnding final_line_ending = FinalLineEnding::OPTIONAL;

    /// Drop empty lines before any rule sees them. When false, an empty line
    /// is a record with one empty field and is checked like any other.
    bool skip_blank_lines = false;

    size_t chunk_size = CSVLINT_DEFAULT_CHUNK_SIZE;

    /// Bytes of record text kept as defect context (0 disables context).
    size_t context_width = CSVLINT_DEFAULT_CONTEXT_WIDTH;
};

/**
 * @brief Drives a Scanner and accumulates defects for one validation run.
 *
 * A Validator is single-use. The source must outlive it.
 */
class Validator {
public:
    Validator(ByteSource& source, const Dialect& dialect,
              const ValidationOptions& options = ValidationOptions());
    ~Validator();

    Validator(const Validator&) = delete;
    Validator& operator=(const Validator&) = delete;
    Validator(Validator&&) noexcept;
    Validator& operator=(Validator&&) noexcept;

    /**
     * @brief Validate the next record.
     *
     * @return false once the input is exhausted, a fatal defect was recorded
     *         or the error limit was reached.
     */
    bool step();

    /// Drain the input and return the final result.
    const ValidationResult& run();

    /// Result so far; final once done() is true.
    const ValidationResult& result() const;

    bool done() const;

    /// Header field count, 0 before the header has been read.
    size_t expected_field_count() const;

    const Dialect& dialect() const;
    const ValidationOptions& options() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Validate an entire source in one call.
ValidationResult validate(ByteSource& source, const Dialect& dialect = Dialect::csv(),
                          const ValidationOptions& options = ValidationOptions());

/// Validate an input stream in one call.
ValidationResult validate(std::istream& input, const Dialect& dialect = Dialect::csv(),
                          const ValidationOptions& options = ValidationOptions());

}  // namespace csvlint

#endif  // CSVLINT_VALIDATOR_H
