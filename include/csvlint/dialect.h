/**
 * @file dialect.h
 * @brief Validation dialect: delimiter choice and the lenient/strict axis.
 *
 * A Dialect is the mode a validation run is performed under. It is copied
 * into the Validator at construction and never changes during the run.
 *
 * @see Validator for how each setting is enforced
 */

#ifndef CSVLINT_DIALECT_H
#define CSVLINT_DIALECT_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace csvlint {

/// Quote character. RFC 4180 fixes it to DQUOTE and it is not configurable.
constexpr char QUOTE_CHAR = '"';

/**
 * @brief Line terminator observed at the end of a record.
 *
 * NONE is only ever seen on the last record of the input.
 */
enum class LineEnding { NONE, LF, CRLF, CR };

/// Raw bytes of a terminator ("\r\n", "\n", "\r" or empty).
std::string_view line_ending_bytes(LineEnding le);

/// Display name ("CRLF", "LF", "CR", "none").
const char* line_ending_to_string(LineEnding le);

/**
 * @brief Validation mode.
 *
 * - delimiter: field separator (comma, tab, pipe, colon or semicolon)
 * - lazy_quotes: tolerate malformed quoting, recovering the field as literal text
 * - strict_rfc4180: require comma delimiter and CRLF line endings
 */
struct Dialect {
    char delimiter = ',';
    bool lazy_quotes = false;
    bool strict_rfc4180 = false;

    /// Factory for standard CSV (comma-separated)
    static Dialect csv() { return Dialect{',', false, false}; }

    /// Factory for TSV (tab-separated)
    static Dialect tsv() { return Dialect{'\t', false, false}; }

    /// Factory for pipe-separated
    static Dialect pipe() { return Dialect{'|', false, false}; }

    /// Factory for colon-separated
    static Dialect colon() { return Dialect{':', false, false}; }

    /// Factory for semicolon-separated (European style)
    static Dialect semicolon() { return Dialect{';', false, false}; }

    /// Factory for strict RFC 4180 validation
    static Dialect rfc4180() { return Dialect{',', false, true}; }

    bool operator==(const Dialect& other) const {
        return delimiter == other.delimiter &&
               lazy_quotes == other.lazy_quotes &&
               strict_rfc4180 == other.strict_rfc4180;
    }

    bool operator!=(const Dialect& other) const {
        return !(*this == other);
    }

    /// Returns a human-readable description of the dialect
    std::string to_string() const;
};

/**
 * @brief Parse a delimiter given on the command line.
 *
 * Accepts the character itself or its name: "," / "comma", "\t" (either the
 * tab character or the two-character escape) / "tab", "|" / "pipe",
 * ":" / "colon", ";" / "semicolon".
 *
 * @return The delimiter byte, or std::nullopt for anything else.
 */
std::optional<char> parse_delimiter(std::string_view text);

/// Display name of a delimiter ("comma", "tab", ...).
std::string delimiter_name(char delimiter);

}  // namespace csvlint

#endif  // CSVLINT_DIALECT_H
