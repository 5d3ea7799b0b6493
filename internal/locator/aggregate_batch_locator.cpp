#include "aggregate_batch_locator.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbmgr::locator {

AggregateBatchLocator::AggregateBatchLocator(std::vector<std::shared_ptr<const BatchLocator>> locators, Mode mode) : mode_(mode) {
  for (auto& locator : locators) {
    Add(std::move(locator));
  }
}

void AggregateBatchLocator::Add(std::shared_ptr<const BatchLocator> locator) {
  if (!locator) {
    throw util::InvalidArgument("batch locator is null");
  }
  locators_.push_back(std::move(locator));
}

void AggregateBatchLocator::Insert(std::size_t index, std::shared_ptr<const BatchLocator> locator) {
  if (!locator) {
    throw util::InvalidArgument("batch locator is null");
  }
  if (index > locators_.size()) {
    throw util::OutOfRange("batch locator index " + std::to_string(index) + " out of range");
  }
  locators_.insert(locators_.begin() + static_cast<std::ptrdiff_t>(index), std::move(locator));
}

bool AggregateBatchLocator::Remove(const std::shared_ptr<const BatchLocator>& locator) {
  auto it = std::find(locators_.begin(), locators_.end(), locator);
  if (it == locators_.end()) return false;
  locators_.erase(it);
  return true;
}

void AggregateBatchLocator::Clear() {
  locators_.clear();
}

NameSet AggregateBatchLocator::GetNames() const {
  NameSet names;
  for (const auto& locator : locators_) {
    auto current = locator->GetNames();
    names.insert(current.begin(), current.end());
  }
  return names;
}

std::optional<batch::Batch> AggregateBatchLocator::GetBatch(const std::string&                name,
                                                            const std::optional<std::string>& separator,
                                                            const BatchFactory&               factory) const {
  if (util::IsBlank(name)) {
    throw util::InvalidArgument("batch name is empty");
  }
  if (separator && util::IsBlank(*separator)) {
    throw util::InvalidArgument("command separator is empty");
  }

  if (mode_ == Mode::kWaterfall) {
    for (const auto& locator : locators_) {
      if (auto batch = locator->GetBatch(name, separator, factory)) {
        return batch;
      }
    }
    return std::nullopt;
  }

  // every sub-locator must provide the batch
  std::optional<batch::Batch> merged;
  for (const auto& locator : locators_) {
    auto current = locator->GetBatch(name, separator, factory);
    if (!current) {
      DBMGR_LOG_DEBUG("Batch missing from a merged locator", {observability::StringField("batch", name)});
      return std::nullopt;
    }

    if (!merged) {
      merged = std::move(current);
      continue;
    }
    for (const auto& command : current->Commands()) {
      merged->AddCommand(command);
    }
  }

  return merged;
}

} // namespace dbmgr::locator
