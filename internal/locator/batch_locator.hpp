#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <boost/regex.hpp>

#include "internal/batch/batch.hpp"
#include "internal/util/strings.hpp"

namespace dbmgr::locator {

using NameSet      = std::set<std::string, util::CaseInsensitiveLess>;
using BatchFactory = std::function<batch::Batch()>;

// A line consisting only of this text separates two commands.
inline constexpr std::string_view kDefaultCommandSeparator = "GO";

// Inline directive: /* DBMANAGER:Key=Value */
inline constexpr std::string_view kDefaultOptionFormat =
    R"(/\*\s*DBMANAGER\s*:\s*(?<key>\w+)\s*=\s*(?<value>\w+)\s*\*/)";

/*
  Resolves named batches from some source.

  Names are case-insensitive. GetBatch returns nullopt when the name is
  unknown to this locator; an empty batch is a valid match.

  separator: nullopt selects the locator default. A given separator must
  not be blank.
  factory: creates the empty batch to fill; a default Batch when empty.
*/
class BatchLocator {
 public:
  virtual ~BatchLocator() = default;

  virtual NameSet GetNames() const = 0;

  virtual std::optional<batch::Batch> GetBatch(const std::string&                name,
                                               const std::optional<std::string>& separator = std::nullopt,
                                               const BatchFactory&               factory   = {}) const = 0;
};

// Per-command options extracted from inline directives.
struct CommandOptions {
  std::optional<batch::TransactionRequirement> transaction_requirement;
  std::optional<db::IsolationLevel>            isolation_level;
  std::optional<db::ExecutionType>             execution_type;
};

/*
  Splits a script into command texts.

  '\r' is removed first. A blank script yields nothing. Without a
  separator the whole script is one command. A word separator such as
  GO ends a command on every line whose trimmed text equals it
  (case-insensitive); any other separator splits wherever it occurs.
  Segments are trimmed and blank ones dropped.
*/
std::vector<std::string> SeparateScriptCommands(std::string_view script, const std::optional<std::string>& separator);

/*
  Shared behavior of script-producing locators: argument validation,
  default separator, directive parsing.
*/
class BatchLocatorBase : public BatchLocator {
 public:
  BatchLocatorBase();

  NameSet GetNames() const final;

  std::optional<batch::Batch> GetBatch(const std::string&                name,
                                       const std::optional<std::string>& separator = std::nullopt,
                                       const BatchFactory&               factory   = {}) const final;

  // Blank disables splitting.
  const std::string& CommandSeparator() const {
    return command_separator_;
  }
  void SetCommandSeparator(std::string separator) {
    command_separator_ = std::move(separator);
  }

  // Must contain the named captures key and value. Blank disables directives.
  const std::string& OptionFormat() const {
    return option_format_;
  }
  void SetOptionFormat(std::string format);

  // Unknown keys are skipped; unparseable values are logged and skipped.
  // Repeating a key with a different value throws util::ConflictingRequirement.
  CommandOptions ParseCommandOptions(std::string_view command) const;

 protected:
  virtual std::vector<std::string> ListNames() const = 0;

  // Returns false when the name is unknown.
  virtual bool FillBatch(batch::Batch& batch, const std::string& name, const std::optional<std::string>& separator) const = 0;

  /*
    Splits script, applies directives over the preset requirement and
    isolation, and appends one script command per piece. A directive that
    contradicts a non-default preset throws util::ConflictingRequirement.
  */
  void AddScriptCommands(batch::Batch&                     batch,
                         std::string_view                  script,
                         const std::optional<std::string>& separator,
                         batch::TransactionRequirement     preset_requirement,
                         std::optional<db::IsolationLevel> preset_isolation) const;

 private:
  std::string                 command_separator_;
  std::string                 option_format_;
  std::optional<boost::regex> option_regex_;
};

} // namespace dbmgr::locator
