#pragma once

#include <string>
#include <string_view>

namespace doccat::catalog {

/*
  NS.NAME object name.

  SQLite has no schemas, so an object of namespace NS is one SQLite object
  whose physical name is "NS.NAME". Always render it with Quoted().
*/
struct QualifiedName {
  std::string schema;
  std::string name;

  std::string Physical() const {
    return schema + "." + name;
  }

  std::string Quoted() const;

  bool operator==(const QualifiedName& other) const {
    return schema == other.schema && name == other.name;
  }
};

// "x" with embedded double quotes doubled
std::string QuoteIdentifier(std::string_view identifier);

// 'x' with embedded single quotes doubled
std::string QuoteLiteral(std::string_view text);

// Splits a physical name at its first '.'; the schema is empty when there is none.
QualifiedName FromPhysical(std::string_view physical);

/*
  The three namespaces doccat works with.
*/
struct NamespaceLayout {
  std::string native   = "SYSCAT";
  std::string extended = "DOCDATA";
  std::string merged   = "DOCCAT";

  QualifiedName Native(std::string_view table) const {
    return {native, std::string(table)};
  }

  QualifiedName Extended(std::string_view table) const {
    return {extended, std::string(table)};
  }

  QualifiedName Merged(std::string_view table) const {
    return {merged, std::string(table)};
  }
};

} // namespace doccat::catalog
