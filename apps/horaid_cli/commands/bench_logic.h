#pragma once

#include "horaid/id/generator.h"

#include <nlohmann/json.hpp>

#include <cstddef>

// BenchReport summarises one bench run.
// unique + duplicates == total - errors.
struct BenchReport {
  std::size_t total{0};       // NOLINT(readability-identifier-naming)
  std::size_t unique{0};      // NOLINT(readability-identifier-naming)
  std::size_t duplicates{0};  // NOLINT(readability-identifier-naming)
  std::size_t errors{0};      // NOLINT(readability-identifier-naming)
  double elapsed_ms{0.0};     // NOLINT(readability-identifier-naming)
};

// run_bench calls gen.next() count times back to back, then counts distinct
// identifiers. Generation errors (e.g. a full bucket) are counted, not fatal.
// Only the generation loop is timed.
//
// With threads > 1 the calls are split across that many std::threads, so gen
// must be thread-safe (a LockedGenerator).
[[nodiscard]] BenchReport run_bench(horaid::id::IHoraGenerator& gen, std::size_t count,
                                    std::size_t threads = 1);

[[nodiscard]] nlohmann::json bench_report_to_json(const BenchReport& report);
