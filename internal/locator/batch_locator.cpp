#include "batch_locator.hpp"

#include <cctype>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dbmgr::locator {

namespace {

std::string RemoveCarriageReturns(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c != '\r') out.push_back(c);
  }
  return out;
}

// A bare word such as GO separates only when it stands on its own line.
bool IsLineMarker(std::string_view separator) {
  if (separator.empty()) return false;
  for (char c : separator) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
  }
  return true;
}

template <typename T>
void Merge(std::optional<T>& slot, T value, std::string_view key) {
  if (slot && *slot != value) {
    throw util::ConflictingRequirement("conflicting values for command option " + std::string(key));
  }
  slot = value;
}

} // namespace

std::vector<std::string> SeparateScriptCommands(std::string_view script, const std::optional<std::string>& separator) {
  const auto normalized = RemoveCarriageReturns(script);
  if (util::IsBlank(normalized)) {
    return {};
  }

  if (!separator || util::IsBlank(*separator)) {
    return {normalized};
  }

  const auto raw    = RemoveCarriageReturns(*separator);
  const auto marker = util::Trim(raw);

  std::vector<std::string> commands;
  std::string              current;
  auto flush = [&] {
    auto piece = util::Trim(current);
    if (!piece.empty()) {
      commands.push_back(std::move(piece));
    }
    current.clear();
  };

  if (!IsLineMarker(marker)) {
    std::size_t start = 0;
    for (auto pos = normalized.find(raw); pos != std::string::npos; pos = normalized.find(raw, start)) {
      current = normalized.substr(start, pos - start);
      flush();
      start = pos + raw.size();
    }
    current = normalized.substr(start);
    flush();
    return commands;
  }

  std::istringstream in(normalized);
  std::string        line;
  while (std::getline(in, line)) {
    if (util::EqualsIgnoreCase(util::Trim(line), marker)) {
      flush();
      continue;
    }
    current += line;
    current += '\n';
  }
  flush();

  return commands;
}

BatchLocatorBase::BatchLocatorBase() : command_separator_(kDefaultCommandSeparator) {
  SetOptionFormat(std::string(kDefaultOptionFormat));
}

void BatchLocatorBase::SetOptionFormat(std::string format) {
  if (util::IsBlank(format)) {
    option_format_.clear();
    option_regex_.reset();
    return;
  }

  try {
    option_regex_.emplace(format, boost::regex::perl | boost::regex::icase);
  } catch (const boost::regex_error& e) {
    throw util::InvalidArgument("invalid option format '" + format + "': " + e.what());
  }
  option_format_ = std::move(format);
}

NameSet BatchLocatorBase::GetNames() const {
  NameSet names;
  for (auto& name : ListNames()) {
    if (!util::IsBlank(name)) {
      names.insert(std::move(name));
    }
  }
  return names;
}

std::optional<batch::Batch> BatchLocatorBase::GetBatch(const std::string&                name,
                                                       const std::optional<std::string>& separator,
                                                       const BatchFactory&               factory) const {
  if (util::IsBlank(name)) {
    throw util::InvalidArgument("batch name is empty");
  }
  if (separator && util::IsBlank(*separator)) {
    throw util::InvalidArgument("command separator is empty");
  }

  std::optional<std::string> effective = separator;
  if (!effective && !util::IsBlank(command_separator_)) {
    effective = command_separator_;
  }

  batch::Batch batch = factory ? factory() : batch::Batch();
  if (batch.Name().empty()) {
    batch.SetName(name);
  }

  if (!FillBatch(batch, name, effective)) {
    return std::nullopt;
  }
  return batch;
}

CommandOptions BatchLocatorBase::ParseCommandOptions(std::string_view command) const {
  CommandOptions options;
  if (!option_regex_) {
    return options;
  }

  const std::string text(command);
  for (boost::sregex_iterator it(text.begin(), text.end(), *option_regex_), end; it != end; ++it) {
    const auto& match = *it;
    const auto  key   = match["key"].str();
    const auto  value = match["value"].str();

    if (util::EqualsIgnoreCase(key, "TransactionRequirement")) {
      if (auto parsed = batch::ParseTransactionRequirement(value)) {
        Merge(options.transaction_requirement, *parsed, key);
        continue;
      }
    } else if (util::EqualsIgnoreCase(key, "IsolationLevel")) {
      if (auto parsed = db::ParseIsolationLevel(value)) {
        Merge(options.isolation_level, *parsed, key);
        continue;
      }
    } else if (util::EqualsIgnoreCase(key, "ExecutionType")) {
      if (auto parsed = db::ParseExecutionType(value)) {
        Merge(options.execution_type, *parsed, key);
        continue;
      }
    } else {
      DBMGR_LOG_DEBUG("Ignoring unknown command option", {observability::StringField("key", key)});
      continue;
    }

    DBMGR_LOG_WARN("Ignoring command option with invalid value",
                   {observability::StringField("key", key), observability::StringField("value", value)});
  }

  return options;
}

void BatchLocatorBase::AddScriptCommands(batch::Batch&                     batch,
                                         std::string_view                  script,
                                         const std::optional<std::string>& separator,
                                         batch::TransactionRequirement     preset_requirement,
                                         std::optional<db::IsolationLevel> preset_isolation) const {
  for (auto& text : SeparateScriptCommands(script, separator)) {
    const auto options = ParseCommandOptions(text);

    auto requirement = preset_requirement;
    if (options.transaction_requirement && *options.transaction_requirement != batch::TransactionRequirement::kDontCare) {
      if (requirement != batch::TransactionRequirement::kDontCare && requirement != *options.transaction_requirement) {
        throw util::ConflictingRequirement("batch '" + batch.Name() + "' requires transaction " +
                                           std::string(batch::ToString(requirement)) + " but a command asks for " +
                                           std::string(batch::ToString(*options.transaction_requirement)));
      }
      requirement = *options.transaction_requirement;
    }

    auto isolation = preset_isolation;
    if (options.isolation_level) {
      if (isolation && *isolation != *options.isolation_level) {
        throw util::ConflictingRequirement("batch '" + batch.Name() + "' uses isolation " + std::string(db::ToString(*isolation)) +
                                           " but a command asks for " + std::string(db::ToString(*options.isolation_level)));
      }
      isolation = options.isolation_level;
    }

    batch.AddScript(std::move(text), requirement, isolation, options.execution_type.value_or(db::ExecutionType::kReader));
  }
}

} // namespace dbmgr::locator
