/**
 * @file encoding.h
 * @brief Byte order mark detection and incremental UTF-8 validation.
 *
 * csvlint only accepts UTF-8 input. A UTF-8 BOM is tolerated and skipped;
 * UTF-16 and UTF-32 BOMs are recognised so the fatal encoding defect can say
 * what the input actually is.
 */

#ifndef CSVLINT_ENCODING_H
#define CSVLINT_ENCODING_H

#include <cstddef>
#include <cstdint>

namespace csvlint {

enum class Encoding {
    UTF8,       // No BOM
    UTF8_BOM,
    UTF16_LE,
    UTF16_BE,
    UTF32_LE,
    UTF32_BE
};

struct BomResult {
    Encoding encoding = Encoding::UTF8;
    size_t bom_length = 0;
};

const char* encoding_to_string(Encoding enc);

/**
 * @brief Detect a byte order mark at the start of a buffer.
 *
 * Needs at most 4 bytes; shorter buffers are checked for the BOMs that fit.
 */
BomResult detect_bom(const uint8_t* buf, size_t len);

/**
 * @brief Streaming UTF-8 validator.
 *
 * Bytes are fed one at a time, so a multi-byte sequence may straddle any
 * number of reads. Rejects overlong forms, surrogates, code points above
 * U+10FFFF and stray continuation bytes (RFC 3629).
 */
class Utf8Validator {
public:
    /// Feed one byte. Returns false if it makes the input invalid.
    bool feed(uint8_t byte) {
        if (needed_ == 0) {
            if (byte < 0x80) return true;
            return start_sequence(byte);
        }
        if (byte < lower_ || byte > upper_) {
            return false;
        }
        lower_ = 0x80;
        upper_ = 0xBF;
        --needed_;
        return true;
    }

    /// True when no multi-byte sequence is open.
    bool complete() const { return needed_ == 0; }

    /// Continuation bytes still expected by the open sequence.
    int pending() const { return needed_; }

    void reset() {
        needed_ = 0;
        lower_ = 0x80;
        upper_ = 0xBF;
    }

private:
    bool start_sequence(uint8_t byte);

    int needed_ = 0;
    uint8_t lower_ = 0x80;  // Bounds for the next continuation byte
    uint8_t upper_ = 0xBF;
};

/// Validate a whole buffer. Returns the offset of the first invalid byte, or len.
size_t utf8_validate(const uint8_t* buf, size_t len);

} // namespace csvlint

#endif // CSVLINT_ENCODING_H
