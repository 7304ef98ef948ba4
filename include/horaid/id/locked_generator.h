#pragma once

#include "horaid/id/generator.h"

#include <memory>
#include <mutex>
#include <utility>

namespace horaid::id {

// LockedGenerator shares one generator between threads.
//
// Thread-safety: Uses std::mutex for all operations (coarse-grained locking).
// Every next() on the wrapped generator happens under the lock, so ids keep the
// wrapped policy's guarantees across threads.
class LockedGenerator final : public IHoraGenerator {
 public:
  explicit LockedGenerator(std::shared_ptr<IHoraGenerator> inner) : inner_(std::move(inner)) {}
  ~LockedGenerator() override = default;

  // Disable copy/move (mutex not copyable)
  LockedGenerator(const LockedGenerator&) = delete;
  LockedGenerator& operator=(const LockedGenerator&) = delete;
  LockedGenerator(LockedGenerator&&) = delete;
  LockedGenerator& operator=(LockedGenerator&&) = delete;

  [[nodiscard]] core::Result<HoraId, core::GenerateError> next() override;

  [[nodiscard]] GeneratorPolicy policy() const override;
  [[nodiscard]] std::uint8_t machine_id() const override;
  [[nodiscard]] std::size_t issued_in_bucket() const override;

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<IHoraGenerator> inner_;
};

}  // namespace horaid::id
