#include "memory_status_repository.hpp"

namespace inkvault::db::memory {

Result MemoryStatusRepository::Upsert(const model::StatusRecord& record) {
  if (record.image_name.empty()) return Result::Err(ErrorCode::ConstraintViolation, "image name is empty");

  std::lock_guard lock(mutex_);
  records_[record.image_name] = record;
  return Result::Ok();
}

std::optional<model::StatusRecord> MemoryStatusRepository::Get(const std::string& image_name) {
  std::lock_guard lock(mutex_);
  auto            it = records_.find(image_name);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::StatusRecord> MemoryStatusRepository::List() {
  std::lock_guard lock(mutex_);

  std::vector<model::StatusRecord> out;
  out.reserve(records_.size());
  for (const auto& [_, r] : records_) out.push_back(r);
  return out;
}

model::StatusCounts MemoryStatusRepository::Count() {
  std::lock_guard lock(mutex_);

  model::StatusCounts counts;
  for (const auto& [_, r] : records_) {
    ++counts.total;
    if (r.done) ++counts.done;
    if (r.ink_found) ++counts.ink_found;
  }
  return counts;
}

} // namespace inkvault::db::memory
