#include "horaid/id/sequence_generator.h"

#include <utility>

namespace horaid::id {

SequenceGenerator::SequenceGenerator(const std::uint8_t machine_id, core::IClock& clock,
                                     GeneratorConfig config, const std::uint64_t initial_period)
    : clock_(clock),
      config_(std::move(config)),
      machine_id_(machine_id),
      last_period_(initial_period) {}

core::Result<std::shared_ptr<SequenceGenerator>, core::GenerateError> SequenceGenerator::create(
    const std::uint8_t machine_id, core::IClock& clock, const GeneratorConfig& config) {
  using R = core::Result<std::shared_ptr<SequenceGenerator>, core::GenerateError>;

  const auto elapsed = millis_since_reference(clock, config.reference_epoch_millis);
  if (!elapsed.has_value()) {
    return R::err(core::GenerateError::kClockBeforeEpoch);
  }

  const std::uint64_t period = time_bucket(elapsed.value(), config.bucket);
  return R::ok(
      std::shared_ptr<SequenceGenerator>(new SequenceGenerator(machine_id, clock, config, period)));
}

core::Result<HoraId, core::GenerateError> SequenceGenerator::next() {
  using R = core::Result<HoraId, core::GenerateError>;

  const auto elapsed = millis_since_reference(clock_, config_.reference_epoch_millis);
  if (!elapsed.has_value()) {
    return R::err(core::GenerateError::kClockBeforeEpoch);
  }

  const std::uint64_t period = time_bucket(elapsed.value(), config_.bucket);
  if (period > last_period_) {
    sequence_ = 0;
  }

  if (sequence_ == kMaxSequence) {
    if (config_.overflow == SequenceOverflow::kFail) {
      // Leave state untouched: the caller may retry once the bucket advances.
      return R::err(core::GenerateError::kSequenceExhausted);
    }
    sequence_ = 0;
  }

  ++sequence_;
  last_period_ = period;
  return R::ok(HoraId::encode(elapsed.value(), machine_id_, sequence_));
}

}  // namespace horaid::id
