#include "horaid/id/generator.h"

#include "horaid/id/dedup_generator.h"
#include "horaid/id/rescale.h"
#include "horaid/id/sequence_generator.h"

namespace horaid::id {

std::optional<std::uint64_t> millis_since_reference(core::IClock& clock,
                                                    const std::int64_t reference_epoch_millis) {
  const std::int64_t now = clock.now_unix_millis();
  if (now < reference_epoch_millis) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(now - reference_epoch_millis);
}

std::uint64_t time_bucket(const std::uint64_t reference_millis,
                          const BucketResolution resolution) {
  switch (resolution) {
    case BucketResolution::kTick:
      return rescale_millis(reference_millis);
    case BucketResolution::kSecond:
      return reference_millis / 1000U;
  }
  return rescale_millis(reference_millis);  // unreachable: all enumerators covered above
}

core::Result<std::shared_ptr<IHoraGenerator>, core::GenerateError> create_generator(
    const std::uint8_t machine_id, core::IClock& clock, const GeneratorConfig& config) {
  using R = core::Result<std::shared_ptr<IHoraGenerator>, core::GenerateError>;

  switch (config.policy) {
    case GeneratorPolicy::kSequence: {
      auto result = SequenceGenerator::create(machine_id, clock, config);
      if (!result.has_value()) {
        return R::err(result.error());
      }
      return R::ok(result.value());
    }
    case GeneratorPolicy::kDedup: {
      auto result = DedupGenerator::create(machine_id, clock, config);
      if (!result.has_value()) {
        return R::err(result.error());
      }
      return R::ok(result.value());
    }
  }
  return R::err(core::GenerateError::kClockBeforeEpoch);  // unreachable: all policies covered
}

core::Result<HoraId, core::ClockError> generate_detached(core::IClock& clock,
                                                         const std::uint8_t machine_id,
                                                         const std::int64_t reference_epoch_millis) {
  using R = core::Result<HoraId, core::ClockError>;

  const auto elapsed = millis_since_reference(clock, reference_epoch_millis);
  if (!elapsed.has_value()) {
    return R::err(core::ClockError::kBeforeReferenceEpoch);
  }
  return R::ok(HoraId::encode(elapsed.value(), machine_id, 0));
}

}  // namespace horaid::id
