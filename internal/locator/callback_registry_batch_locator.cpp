#include "callback_registry_batch_locator.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace dbmgr::locator {

void CallbackRegistryBatchLocator::Register(Registration registration) {
  if (util::IsBlank(registration.name)) {
    throw util::InvalidArgument("batch name is empty");
  }
  if (!registration.factory) {
    throw util::InvalidArgument("callback factory for batch '" + registration.name + "' is empty");
  }
  registrations_.push_back(std::move(registration));
}

void CallbackRegistryBatchLocator::Register(const std::string&                name,
                                            batch::Callback                   callback,
                                            batch::TransactionRequirement     requirement,
                                            std::optional<db::IsolationLevel> isolation,
                                            db::ExecutionType                 execution_type) {
  if (!callback) {
    throw util::InvalidArgument("callback for batch '" + name + "' is empty");
  }

  Registration registration;
  registration.name           = name;
  registration.factory        = [callback = std::move(callback)] { return callback; };
  registration.requirement    = requirement;
  registration.isolation      = isolation;
  registration.execution_type = execution_type;
  Register(std::move(registration));
}

std::size_t CallbackRegistryBatchLocator::Unregister(const std::string& name) {
  const auto before = registrations_.size();
  registrations_.erase(std::remove_if(registrations_.begin(), registrations_.end(),
                                      [&](const Registration& r) { return util::EqualsIgnoreCase(r.name, name); }),
                       registrations_.end());
  return before - registrations_.size();
}

std::vector<std::string> CallbackRegistryBatchLocator::ListNames() const {
  std::vector<std::string> names;
  names.reserve(registrations_.size());
  for (const auto& registration : registrations_) {
    names.push_back(registration.name);
  }
  return names;
}

bool CallbackRegistryBatchLocator::FillBatch(batch::Batch& batch, const std::string& name, const std::optional<std::string>&) const {
  bool found = false;

  for (const auto& registration : registrations_) {
    if (!util::EqualsIgnoreCase(registration.name, name)) {
      continue;
    }

    auto callback = registration.factory();
    if (!callback) {
      throw util::InvalidCommand("callback factory for batch '" + name + "' produced an empty callback");
    }
    batch.AddCallback(std::move(callback), registration.requirement, registration.isolation, registration.execution_type);
    found = true;
  }

  return found;
}

} // namespace dbmgr::locator
