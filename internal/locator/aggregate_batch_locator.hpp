#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "internal/locator/batch_locator.hpp"

namespace dbmgr::locator {

/*
  Combines several locators into one.

  Waterfall: sub-locators are asked in order; the first match wins.
  Merge:     every sub-locator that lists the name must produce it; their
             commands are appended in order. A listed name that a
             sub-locator then fails to resolve fails the whole lookup.

  GetNames() is always the case-insensitive union.
*/
class AggregateBatchLocator final : public BatchLocator {
 public:
  enum class Mode {
    kWaterfall,
    kMerge,
  };

  explicit AggregateBatchLocator(Mode mode = Mode::kWaterfall) : mode_(mode) {
  }
  AggregateBatchLocator(std::vector<std::shared_ptr<const BatchLocator>> locators, Mode mode = Mode::kWaterfall);

  Mode GetMode() const {
    return mode_;
  }
  void SetMode(Mode mode) {
    mode_ = mode;
  }

  void        Add(std::shared_ptr<const BatchLocator> locator);
  void        Insert(std::size_t index, std::shared_ptr<const BatchLocator> locator);
  bool        Remove(const std::shared_ptr<const BatchLocator>& locator);
  void        Clear();
  std::size_t Count() const {
    return locators_.size();
  }

  NameSet GetNames() const override;

  std::optional<batch::Batch> GetBatch(const std::string&                name,
                                       const std::optional<std::string>& separator = std::nullopt,
                                       const BatchFactory&               factory   = {}) const override;

 private:
  std::vector<std::shared_ptr<const BatchLocator>> locators_;
  Mode                                             mode_;
};

} // namespace dbmgr::locator
