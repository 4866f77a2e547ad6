/**
 * @file fuzz_validator.cpp
 * @brief LibFuzzer target for the validator in every mode.
 */

#include <cstddef>
#include <cstdint>

#include "csvlint/io_util.h"
#include "csvlint/validator.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    // 64KB limit keeps iterations fast while still spanning several reads
    constexpr size_t MAX_INPUT_SIZE = 64 * 1024;
    if (size > MAX_INPUT_SIZE) size = MAX_INPUT_SIZE;

    const csvlint::Dialect dialects[] = {
        csvlint::Dialect::csv(),
        csvlint::Dialect::rfc4180(),
        csvlint::Dialect{';', true, false},
    };

    for (const auto& dialect : dialects) {
        csvlint::MemorySource source(data, size, 7);
        csvlint::ValidationOptions options;
        options.chunk_size = 16;
        csvlint::ValidationResult result = csvlint::validate(source, dialect, options);

        // The verdict must agree with the defect list
        if (result.valid != (result.errors.empty() && !result.halted)) __builtin_trap();
        for (size_t i = 1; i < result.errors.size(); ++i) {
            if (result.errors[i - 1].record_number > result.errors[i].record_number) __builtin_trap();
        }
    }

    return 0;
}
