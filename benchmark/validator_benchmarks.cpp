#include <benchmark/benchmark.h>
#include "csvlint/io_util.h"
#include "csvlint/scanner.h"
#include "csvlint/validator.h"
#include <sstream>
#include <string>

// Generate CSV data of specified size
static std::string generate_csv_data(size_t rows, size_t cols, bool quoted) {
  std::ostringstream oss;
  // Header
  for (size_t c = 0; c < cols; ++c) {
    if (c > 0) oss << ',';
    oss << "col" << c;
  }
  oss << "\r\n";
  // Data rows
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      if (c > 0) oss << ',';
      if (quoted) {
        oss << "\"value " << r << ", \"\"" << c << "\"\"\"";
      } else {
        oss << "value" << r << "_" << c;
      }
    }
    oss << "\r\n";
  }
  return oss.str();
}

// Generate CSV with some malformed rows (missing fields)
static std::string generate_csv_with_errors(size_t rows, size_t cols, size_t error_rate) {
  std::ostringstream oss;
  // Header
  for (size_t c = 0; c < cols; ++c) {
    if (c > 0) oss << ',';
    oss << "col" << c;
  }
  oss << "\r\n";
  // Data rows
  for (size_t r = 0; r < rows; ++r) {
    // Every error_rate rows, create a malformed row
    size_t actual_cols = ((error_rate > 0) && (r % error_rate == 0)) ? (cols - 1) : cols;
    for (size_t c = 0; c < actual_cols; ++c) {
      if (c > 0) oss << ',';
      oss << "value" << r << "_" << c;
    }
    oss << "\r\n";
  }
  return oss.str();
}

// ============================================================================
// BENCHMARK: Scanner throughput
// ============================================================================

static void BM_Scan(benchmark::State& state) {
  size_t rows = static_cast<size_t>(state.range(0));
  bool quoted = state.range(1) != 0;
  std::string csv_data = generate_csv_data(rows, 10, quoted);

  for (auto _ : state) {
    csvlint::MemorySource source(csv_data);
    csvlint::Scanner scanner(source, csvlint::Dialect::csv());
    size_t fields = 0;
    while (scanner.next_record()) {
      fields += scanner.record().field_count();
    }
    benchmark::DoNotOptimize(fields);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv_data.size() * state.iterations()));
  state.counters["Rows"] = static_cast<double>(rows);
}
BENCHMARK(BM_Scan)->Args({10000, 0})->Args({10000, 1})->Args({100000, 0})->Args({100000, 1});

// ============================================================================
// BENCHMARK: Full validation
// ============================================================================

static void BM_Validate_Clean(benchmark::State& state) {
  size_t rows = static_cast<size_t>(state.range(0));
  bool strict = state.range(1) != 0;
  std::string csv_data = generate_csv_data(rows, 10, false);
  csvlint::Dialect dialect = strict ? csvlint::Dialect::rfc4180() : csvlint::Dialect::csv();

  for (auto _ : state) {
    csvlint::MemorySource source(csv_data);
    csvlint::ValidationResult result = csvlint::validate(source, dialect);
    benchmark::DoNotOptimize(result.valid);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv_data.size() * state.iterations()));
  state.counters["Rows"] = static_cast<double>(rows);
}
BENCHMARK(BM_Validate_Clean)->Args({10000, 0})->Args({10000, 1})->Args({100000, 1});

static void BM_Validate_WithErrors(benchmark::State& state) {
  size_t rows = static_cast<size_t>(state.range(0));
  size_t error_rate = static_cast<size_t>(state.range(1));
  std::string csv_data = generate_csv_with_errors(rows, 10, error_rate);

  size_t errors = 0;
  for (auto _ : state) {
    csvlint::MemorySource source(csv_data);
    csvlint::ValidationResult result = csvlint::validate(source, csvlint::Dialect::rfc4180());
    errors = result.errors.size();
    benchmark::DoNotOptimize(errors);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv_data.size() * state.iterations()));
  state.counters["Errors"] = static_cast<double>(errors);
}
BENCHMARK(BM_Validate_WithErrors)->Args({10000, 10})->Args({10000, 100})->Args({100000, 1000});

// ============================================================================
// BENCHMARK: Read size
// ============================================================================

static void BM_Validate_ChunkSize(benchmark::State& state) {
  std::string csv_data = generate_csv_data(50000, 10, true);
  csvlint::ValidationOptions options;
  options.chunk_size = static_cast<size_t>(state.range(0));

  for (auto _ : state) {
    csvlint::MemorySource source(csv_data);
    csvlint::ValidationResult result = csvlint::validate(source, csvlint::Dialect::csv(), options);
    benchmark::DoNotOptimize(result.valid);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv_data.size() * state.iterations()));
}
BENCHMARK(BM_Validate_ChunkSize)->Arg(512)->Arg(4096)->Arg(64 * 1024)->Arg(1024 * 1024);
