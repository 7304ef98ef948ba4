#pragma once

#include "horaid/id/generator.h"

#include <cstdint>
#include <memory>

namespace horaid::id {

// SequenceGenerator issues strictly increasing identifiers on one machine.
//
// Bytes 6–7 carry a counter that restarts at 1 whenever the time bucket
// advances. Capacity is kMaxSequence (65535) identifiers per bucket; what
// happens past that is governed by GeneratorConfig::overflow.
//
// Not thread-safe: holds a mutable counter without synchronization.
class SequenceGenerator final : public IHoraGenerator {
 public:
  // Reads the clock once to capture the initial bucket.
  // Fails with kClockBeforeEpoch if the clock reads before the reference epoch.
  [[nodiscard]] static core::Result<std::shared_ptr<SequenceGenerator>, core::GenerateError>
  create(std::uint8_t machine_id, core::IClock& clock, const GeneratorConfig& config = {});

  ~SequenceGenerator() override = default;

  // Not copyable or movable (a copy would re-issue the same sequence values)
  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  [[nodiscard]] core::Result<HoraId, core::GenerateError> next() override;

  [[nodiscard]] GeneratorPolicy policy() const override { return GeneratorPolicy::kSequence; }
  [[nodiscard]] std::uint8_t machine_id() const override { return machine_id_; }
  [[nodiscard]] std::size_t issued_in_bucket() const override { return sequence_; }

 private:
  SequenceGenerator(std::uint8_t machine_id, core::IClock& clock, GeneratorConfig config,
                    std::uint64_t initial_period);

  core::IClock& clock_;
  GeneratorConfig config_;
  std::uint8_t machine_id_;
  std::uint16_t sequence_{0};
  std::uint64_t last_period_;
};

}  // namespace horaid::id
