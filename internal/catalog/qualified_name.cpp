#include "internal/catalog/qualified_name.hpp"

namespace doccat::catalog {

namespace {

std::string QuoteWith(std::string_view text, char quote) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back(quote);
  for (char c : text) {
    if (c == quote) out.push_back(quote);
    out.push_back(c);
  }
  out.push_back(quote);
  return out;
}

} // namespace

std::string QualifiedName::Quoted() const {
  return QuoteIdentifier(Physical());
}

std::string QuoteIdentifier(std::string_view identifier) {
  return QuoteWith(identifier, '"');
}

std::string QuoteLiteral(std::string_view text) {
  return QuoteWith(text, '\'');
}

QualifiedName FromPhysical(std::string_view physical) {
  auto dot = physical.find('.');
  if (dot == std::string_view::npos) {
    return {"", std::string(physical)};
  }
  return {std::string(physical.substr(0, dot)), std::string(physical.substr(dot + 1))};
}

} // namespace doccat::catalog
