#include "horaid/id/locked_generator.h"

namespace horaid::id {

core::Result<HoraId, core::GenerateError> LockedGenerator::next() {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_->next();
}

GeneratorPolicy LockedGenerator::policy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_->policy();
}

std::uint8_t LockedGenerator::machine_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_->machine_id();
}

std::size_t LockedGenerator::issued_in_bucket() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_->issued_in_bucket();
}

}  // namespace horaid::id
