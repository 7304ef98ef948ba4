#pragma once

#include "horaid/core/clock.h"
#include "horaid/core/result.h"
#include "horaid/id/generator_config.h"
#include "horaid/id/hora_id.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace horaid::id {

// Abstract generator interface for dependency injection.
// Callers hold an IHoraGenerator and stay agnostic of the anti-collision policy.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
//
// Thread-safety: implementations are NOT thread-safe unless stated otherwise.
// Give each thread its own generator (with a distinct machine id) or wrap a
// shared one in LockedGenerator.
class IHoraGenerator {
 public:
  virtual ~IHoraGenerator() = default;

  // Issue the next identifier stamped with the clock's current time.
  // Errors: kClockBeforeEpoch if the clock reads before the reference epoch;
  // kSequenceExhausted / kRetryBudgetExhausted if the current bucket is full.
  [[nodiscard]] virtual core::Result<HoraId, core::GenerateError> next() = 0;

  [[nodiscard]] virtual GeneratorPolicy policy() const = 0;
  [[nodiscard]] virtual std::uint8_t machine_id() const = 0;

  // Number of identifiers issued in the most recent bucket.
  [[nodiscard]] virtual std::size_t issued_in_bucket() const = 0;

 protected:
  IHoraGenerator() = default;
  IHoraGenerator(const IHoraGenerator&) = default;
  IHoraGenerator& operator=(const IHoraGenerator&) = default;
  IHoraGenerator(IHoraGenerator&&) = default;
  IHoraGenerator& operator=(IHoraGenerator&&) = default;
};

// millis_since_reference reads the clock once and returns milliseconds elapsed
// since reference_epoch_millis, or nullopt if the clock reads earlier.
[[nodiscard]] std::optional<std::uint64_t> millis_since_reference(
    core::IClock& clock, std::int64_t reference_epoch_millis);

// time_bucket maps elapsed milliseconds to the bucket key that decides when
// per-bucket generator state resets. Monotonic non-decreasing in its input.
[[nodiscard]] std::uint64_t time_bucket(std::uint64_t reference_millis,
                                        BucketResolution resolution);

// create_generator builds the generator selected by config.policy.
// The clock must outlive the returned generator.
[[nodiscard]] core::Result<std::shared_ptr<IHoraGenerator>, core::GenerateError> create_generator(
    std::uint8_t machine_id, core::IClock& clock, const GeneratorConfig& config = {});

// generate_detached stamps a single identifier with sequence 0 and no
// per-bucket state.
//
// Caution: two calls within the same tick with the same machine id return the
// same identifier. Use only for low-frequency generation; use a generator otherwise.
[[nodiscard]] core::Result<HoraId, core::ClockError> generate_detached(
    core::IClock& clock, std::uint8_t machine_id = 0,
    std::int64_t reference_epoch_millis = kReferenceEpochMillis);

}  // namespace horaid::id
