#include "bench_logic.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>
#include <unordered_set>
#include <vector>

namespace {

struct WorkerTally {
  std::vector<std::uint64_t> issued;
  std::size_t errors{0};
};

void generate_into(horaid::id::IHoraGenerator& gen, const std::size_t count, WorkerTally& tally) {
  tally.issued.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    const auto result = gen.next();
    if (result.has_value()) {
      tally.issued.push_back(result.value().to_u64());
    } else {
      ++tally.errors;
    }
  }
}

}  // namespace

BenchReport run_bench(horaid::id::IHoraGenerator& gen, const std::size_t count,
                      const std::size_t threads) {
  BenchReport report;
  report.total = count;

  const std::size_t workers = threads == 0 ? 1 : threads;
  std::vector<WorkerTally> tallies(workers);

  const auto start = std::chrono::steady_clock::now();
  if (workers == 1) {
    generate_into(gen, count, tallies.front());
  } else {
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
      // The first (count % workers) workers take one extra identifier.
      const std::size_t share = (count / workers) + (w < count % workers ? 1 : 0);
      pool.emplace_back(generate_into, std::ref(gen), share, std::ref(tallies[w]));
    }
    for (auto& t : pool) {
      t.join();
    }
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;
  report.elapsed_ms = std::chrono::duration<double, std::milli>(elapsed).count();

  // Duplicate analysis runs outside the timed section.
  std::unordered_set<std::uint64_t> distinct;
  distinct.reserve(count);
  std::size_t issued_total = 0;
  for (const auto& tally : tallies) {
    report.errors += tally.errors;
    issued_total += tally.issued.size();
    distinct.insert(tally.issued.begin(), tally.issued.end());
  }
  report.unique = distinct.size();
  report.duplicates = issued_total - distinct.size();

  return report;
}

nlohmann::json bench_report_to_json(const BenchReport& report) {
  nlohmann::json j;
  j["total"] = report.total;
  j["unique"] = report.unique;
  j["duplicates"] = report.duplicates;
  j["errors"] = report.errors;
  j["elapsed_ms"] = report.elapsed_ms;
  return j;
}
