#include "pg_connection.hpp"

#include <cstddef>

namespace dbmgr::db::postgres {

namespace {

pqxx::params ToParams(const sql::ParameterSet& parameters) {
  pqxx::params out;
  for (const auto& parameter : parameters) {
    const auto& value = parameter.value;
    if (sql::IsNull(value)) {
      out.append();
    } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
      out.append(*i);
    } else if (const auto* d = std::get_if<double>(&value)) {
      out.append(*d);
    } else if (const auto* s = std::get_if<std::string>(&value)) {
      out.append(*s);
    } else {
      const auto& blob = std::get<sql::Blob>(value);
      out.append(pqxx::bytes_view(reinterpret_cast<const std::byte*>(blob.data()), blob.size()));
    }
  }
  return out;
}

sql::Value FieldValue(const pqxx::field& field) {
  if (field.is_null()) {
    return nullptr;
  }
  return std::string(field.c_str(), field.size());
}

sql::Values Collect(const pqxx::result& result, ExecutionType type) {
  sql::Values out;

  switch (type) {
    case ExecutionType::kReader:
      for (const auto& row : result) {
        for (const auto& field : row) {
          out.push_back(FieldValue(field));
        }
      }
      break;
    case ExecutionType::kScalar:
      if (!result.empty() && result.columns() > 0) {
        out.push_back(FieldValue(result[0][0]));
      } else {
        out.push_back(nullptr);
      }
      break;
    case ExecutionType::kNonQuery:
      // statements returning rows changed nothing
      out.push_back(result.columns() > 0 ? std::int64_t{-1} : static_cast<std::int64_t>(result.affected_rows()));
      break;
  }

  return out;
}

} // namespace

PgConnection::PgConnection(std::unique_ptr<pqxx::connection> conn, bool read_only) : conn_(std::move(conn)), read_only_(read_only) {
  if (read_only_) {
    pqxx::nontransaction tx(*conn_);
    tx.exec("SET SESSION CHARACTERISTICS AS TRANSACTION READ ONLY");
  }
}

sql::Values PgConnection::Execute(const std::string& script, ExecutionType type, const sql::ParameterSet& parameters) {
  auto run = [&](pqxx::transaction_base& tx) {
    if (parameters.Empty()) {
      return tx.exec(script);
    }
    return tx.exec_params(script, ToParams(parameters));
  };

  if (active_ != nullptr) {
    return Collect(run(*active_), type);
  }

  pqxx::nontransaction tx(*conn_);
  return Collect(run(tx), type);
}

} // namespace dbmgr::db::postgres
