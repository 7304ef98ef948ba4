#pragma once

#include "horaid/id/generator.h"

#include <cstdint>
#include <memory>
#include <random>
#include <unordered_set>

namespace horaid::id {

// DedupGenerator issues identifiers whose bytes 6–7 (and optionally byte 5)
// are random, rejecting any value already issued in the current bucket.
//
// The issued set is cleared when the bucket advances, so memory is bounded by
// the number of calls per bucket. Ordering within a bucket is random; ordering
// across buckets follows time.
//
// Not thread-safe: holds a mutable set and PRNG without synchronization.
class DedupGenerator final : public IHoraGenerator {
 public:
  // Reads the clock once to capture the initial bucket.
  // Fails with kClockBeforeEpoch if the clock reads before the reference epoch.
  [[nodiscard]] static core::Result<std::shared_ptr<DedupGenerator>, core::GenerateError> create(
      std::uint8_t machine_id, core::IClock& clock, const GeneratorConfig& config = {});

  ~DedupGenerator() override = default;

  DedupGenerator(const DedupGenerator&) = delete;
  DedupGenerator& operator=(const DedupGenerator&) = delete;
  DedupGenerator(DedupGenerator&&) = delete;
  DedupGenerator& operator=(DedupGenerator&&) = delete;

  // Draws up to config.max_dedup_attempts candidates; returns
  // kRetryBudgetExhausted rather than a duplicate if every draw collides.
  [[nodiscard]] core::Result<HoraId, core::GenerateError> next() override;

  [[nodiscard]] GeneratorPolicy policy() const override { return GeneratorPolicy::kDedup; }
  [[nodiscard]] std::uint8_t machine_id() const override { return machine_id_; }
  [[nodiscard]] std::size_t issued_in_bucket() const override { return recently_issued_.size(); }

 private:
  DedupGenerator(std::uint8_t machine_id, core::IClock& clock, GeneratorConfig config,
                 std::uint64_t initial_period);

  core::IClock& clock_;
  GeneratorConfig config_;
  std::uint8_t machine_id_;
  std::uint64_t last_period_;
  std::unordered_set<std::uint64_t> recently_issued_;
  std::mt19937_64 rng_;
};

}  // namespace horaid::id
