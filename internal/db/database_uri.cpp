#include "database_uri.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace modeldb::db {

using util::DeployError;
using util::ErrorKind;

namespace {

std::string Lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

[[noreturn]] void Invalid(const std::string& what) {
  throw DeployError(ErrorKind::kInvalidArgument, "invalid database uri: " + what);
}

void ParseAuthority(const std::string& authority, DatabaseUri& out) {
  std::string host_port = authority;

  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    const auto userinfo = authority.substr(0, at);
    host_port           = authority.substr(at + 1);

    auto colon = userinfo.find(':');
    out.user   = userinfo.substr(0, colon);
    if (colon != std::string::npos) {
      out.password = userinfo.substr(colon + 1);
    }
  }

  std::string port_text;
  if (!host_port.empty() && host_port.front() == '[') {
    auto close = host_port.find(']');
    if (close == std::string::npos) Invalid("unterminated IPv6 host");
    out.host = host_port.substr(1, close - 1);
    if (close + 1 < host_port.size()) {
      if (host_port[close + 1] != ':') Invalid("garbage after IPv6 host");
      port_text = host_port.substr(close + 2);
    }
  } else {
    auto colon = host_port.rfind(':');
    out.host   = host_port.substr(0, colon);
    if (colon != std::string::npos) port_text = host_port.substr(colon + 1);
  }

  if (!port_text.empty()) {
    int port = 0;
    for (char c : port_text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) Invalid("non-numeric port '" + port_text + "'");
      port = port * 10 + (c - '0');
      if (port > 65535) Invalid("port out of range '" + port_text + "'");
    }
    out.port = port;
  }
}

} // namespace

DatabaseUri DatabaseUri::Parse(const std::string& uri) {
  auto sep = uri.find("://");
  if (sep == std::string::npos || sep == 0) Invalid("expected <dialect>://..., got '" + uri + "'");

  DatabaseUri out;
  const auto  scheme = Lower(uri.substr(0, sep));
  out.remainder      = uri.substr(sep + 3);

  auto plus   = scheme.find('+');
  out.dialect = scheme.substr(0, plus);
  if (plus != std::string::npos) out.driver = scheme.substr(plus + 1);

  if (out.dialect == "postgresql" || out.dialect == "postgres") {
    out.backend = Backend::kPostgres;
  } else if (out.dialect == "sqlite") {
    out.backend = Backend::kSqlite;
  } else if (out.dialect == "memory") {
    out.backend = Backend::kMemory;
  } else {
    Invalid("unsupported dialect '" + out.dialect + "'");
  }

  if (out.backend != Backend::kPostgres) {
    out.database = out.remainder;
    return out;
  }

  auto rest  = out.remainder;
  auto query = rest.find('?');
  if (query != std::string::npos) {
    out.options = rest.substr(query + 1);
    rest        = rest.substr(0, query);
  }

  auto slash = rest.find('/');
  ParseAuthority(rest.substr(0, slash), out);
  if (slash != std::string::npos) out.database = rest.substr(slash + 1);

  if (out.host.empty()) Invalid("missing host");
  return out;
}

std::string DatabaseUri::LibpqConnectionString() const {
  return "postgresql://" + remainder;
}

std::string DatabaseUri::SqlitePath() const {
  // sqlite:// and sqlite:/// both mean in-memory
  if (remainder.empty() || remainder == "/" || remainder == "/:memory:") {
    return ":memory:";
  }
  if (remainder.front() == '/') {
    return remainder.substr(1);
  }
  return remainder;
}

std::string DatabaseUri::Redacted() const {
  std::string scheme = dialect + (driver.empty() ? "" : "+" + driver) + "://";
  if (backend != Backend::kPostgres || password.empty()) {
    return scheme + remainder;
  }

  auto at    = remainder.rfind('@', remainder.find('/'));
  auto colon = remainder.find(':');
  if (at == std::string::npos || colon == std::string::npos || colon > at) {
    return scheme + remainder;
  }
  return scheme + remainder.substr(0, colon + 1) + "***" + remainder.substr(at);
}

} // namespace modeldb::db
