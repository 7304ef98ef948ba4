#include "horaid/id/dedup_generator.h"

#include <utility>

namespace horaid::id {

namespace {

std::uint64_t seed_from(const GeneratorConfig& config) {
  if (config.random_seed.has_value()) {
    return config.random_seed.value();
  }
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32U) | rd();
}

}  // namespace

DedupGenerator::DedupGenerator(const std::uint8_t machine_id, core::IClock& clock,
                               GeneratorConfig config, const std::uint64_t initial_period)
    : clock_(clock),
      config_(std::move(config)),
      machine_id_(machine_id),
      last_period_(initial_period),
      rng_(seed_from(config_)) {}

core::Result<std::shared_ptr<DedupGenerator>, core::GenerateError> DedupGenerator::create(
    const std::uint8_t machine_id, core::IClock& clock, const GeneratorConfig& config) {
  using R = core::Result<std::shared_ptr<DedupGenerator>, core::GenerateError>;

  const auto elapsed = millis_since_reference(clock, config.reference_epoch_millis);
  if (!elapsed.has_value()) {
    return R::err(core::GenerateError::kClockBeforeEpoch);
  }

  const std::uint64_t period = time_bucket(elapsed.value(), config.bucket);
  return R::ok(
      std::shared_ptr<DedupGenerator>(new DedupGenerator(machine_id, clock, config, period)));
}

core::Result<HoraId, core::GenerateError> DedupGenerator::next() {
  using R = core::Result<HoraId, core::GenerateError>;

  const auto elapsed = millis_since_reference(clock_, config_.reference_epoch_millis);
  if (!elapsed.has_value()) {
    return R::err(core::GenerateError::kClockBeforeEpoch);
  }

  const std::uint64_t period = time_bucket(elapsed.value(), config_.bucket);
  if (period > last_period_) {
    recently_issued_.clear();
  }

  for (std::size_t attempt = 0; attempt < config_.max_dedup_attempts; ++attempt) {
    // One draw supplies both the sequence bytes and, if requested, byte 5.
    const std::uint64_t bits = rng_();
    const auto random_tail = static_cast<std::uint16_t>(bits & 0xFFFFU);
    const std::uint8_t machine_byte =
        config_.random_machine_byte ? static_cast<std::uint8_t>((bits >> 16U) & 0xFFU)
                                    : machine_id_;

    const HoraId candidate = HoraId::encode(elapsed.value(), machine_byte, random_tail);
    if (recently_issued_.insert(candidate.to_u64()).second) {
      last_period_ = period;
      return R::ok(candidate);
    }
  }

  return R::err(core::GenerateError::kRetryBudgetExhausted);
}

}  // namespace horaid::id
