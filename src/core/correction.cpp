#include <boxscan/core/correction.hpp>

namespace boxscan::core {

std::string_view correction_kind_name(const CorrectionKind& kind) noexcept {
  if (std::holds_alternative<NameEdit>(kind)) return "name-edit";
  if (std::holds_alternative<VerificationConfirmed>(kind)) return "confirmed";
  return "rejected";
}

void CorrectionQueue::submit(CorrectionRecord record) {
  std::lock_guard lock(mutex_);
  pending_.push_back(std::move(record));
}

std::vector<CorrectionRecord> CorrectionQueue::drain() {
  std::lock_guard lock(mutex_);
  std::vector<CorrectionRecord> out(std::make_move_iterator(pending_.begin()),
                                    std::make_move_iterator(pending_.end()));
  pending_.clear();
  return out;
}

std::size_t CorrectionQueue::size() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

}  // namespace boxscan::core
