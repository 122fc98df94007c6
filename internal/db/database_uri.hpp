#pragma once

#include <optional>
#include <string>

namespace modeldb::db {

enum class Backend {
  kPostgres,
  kSqlite,
  kMemory
};

/*
  Parsed connection URI.

    dialect[+driver]://[user[:password]@]host[:port]/database[?options]

  Dialects: postgresql | postgres, sqlite, memory. The driver suffix is
  accepted for compatibility with SQLAlchemy style URIs and ignored.

  sqlite follows the SQLAlchemy path convention:
    sqlite:///relative.db   sqlite:////abs/path.db   sqlite:// (in-memory)
*/
struct DatabaseUri {
  Backend     backend = Backend::kMemory;
  std::string dialect;
  std::string driver;

  std::string        user;
  std::string        password;
  std::string        host;
  std::optional<int> port;
  std::string        database;
  std::string        options;

  // Everything after "://"
  std::string remainder;

  // Throws util::DeployError(kInvalidArgument).
  static DatabaseUri Parse(const std::string& uri);

  // libpq URI without the driver suffix.
  std::string LibpqConnectionString() const;

  // ":memory:" for in-memory databases.
  std::string SqlitePath() const;

  // URI with the password masked, for logs and error messages.
  std::string Redacted() const;
};

} // namespace modeldb::db
