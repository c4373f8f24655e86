#pragma once

#include "internal/ddl/kind_template.hpp"
#include "internal/ddl/statement.hpp"

namespace doccat::ddl {

/*
  Merge view over one kind: every native column in native order, with the
  comment column taken from the extended row when one exists. Native rows
  without an extended row still appear (left join).

  When the native table has no comment column the view passes the native
  columns through unchanged.
*/
CreateView GenerateMergeView(const KindTemplate& tmpl);

} // namespace doccat::ddl
