/**
 * @file fuzz_scanner.cpp
 * @brief LibFuzzer target for the record scanner.
 *
 * The first input byte picks the delimiter and quote policy; the rest is
 * scanned with one-byte reads so every state transition meets a read boundary.
 */

#include <cstddef>
#include <cstdint>

#include "csvlint/io_util.h"
#include "csvlint/scanner.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;
    constexpr size_t MAX_INPUT_SIZE = 16 * 1024;
    if (size > MAX_INPUT_SIZE) size = MAX_INPUT_SIZE;

    static const char DELIMITERS[] = {',', '\t', '|', ':', ';'};
    csvlint::Dialect dialect;
    dialect.delimiter = DELIMITERS[data[0] % sizeof(DELIMITERS)];
    dialect.lazy_quotes = (data[0] & 0x80) != 0;

    csvlint::MemorySource source(data + 1, size - 1, 1);
    csvlint::Scanner scanner(source, dialect, 4);
    uint64_t last = 0;
    while (scanner.next_record()) {
        const csvlint::Record& record = scanner.record();
        if (record.record_number() != last + 1) __builtin_trap();
        last = record.record_number();
    }
    if (scanner.bytes_consumed() > size - 1) __builtin_trap();

    return 0;
}
