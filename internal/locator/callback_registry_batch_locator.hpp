#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/locator/batch_locator.hpp"

namespace dbmgr::locator {

/*
  Explicit registry of code batches, filled by the host at startup.

  The factory is invoked for every GetBatch so each batch gets a fresh
  callback. Several registrations under one name form one batch with one
  command per registration, in registration order.
*/
class CallbackRegistryBatchLocator final : public BatchLocatorBase {
 public:
  using CallbackFactory = std::function<batch::Callback()>;

  struct Registration {
    std::string                       name;
    CallbackFactory                   factory;
    batch::TransactionRequirement     requirement = batch::TransactionRequirement::kDontCare;
    std::optional<db::IsolationLevel> isolation;
    db::ExecutionType                 execution_type = db::ExecutionType::kReader;
  };

  void Register(Registration registration);

  // Convenience for stateless callbacks.
  void Register(const std::string&                name,
                batch::Callback                   callback,
                batch::TransactionRequirement     requirement    = batch::TransactionRequirement::kDontCare,
                std::optional<db::IsolationLevel> isolation      = std::nullopt,
                db::ExecutionType                 execution_type = db::ExecutionType::kReader);

  // Removes every registration under name.
  std::size_t Unregister(const std::string& name);

  const std::vector<Registration>& Registrations() const {
    return registrations_;
  }

 protected:
  std::vector<std::string> ListNames() const override;
  bool FillBatch(batch::Batch& batch, const std::string& name, const std::optional<std::string>& separator) const override;

 private:
  std::vector<Registration> registrations_;
};

} // namespace dbmgr::locator
