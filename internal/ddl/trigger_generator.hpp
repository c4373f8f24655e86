#pragma once

#include "internal/catalog/qualified_name.hpp"
#include "internal/ddl/kind_template.hpp"
#include "internal/ddl/statement.hpp"

namespace doccat::ddl {

// SQLite keeps triggers apart from tables; the suffix keeps catalog names distinct too.
catalog::QualifiedName TriggerNameFor(const catalog::QualifiedName& view);

/*
  INSTEAD OF UPDATE OF <comment> trigger on the merge view. Writes go to
  the extended table only, following the comment transition table; other
  column updates through the view are not redirected.

  Throws MetadataNotFound when the native table has no comment column.
*/
CreateTrigger GenerateCommentTrigger(const KindTemplate& tmpl);

} // namespace doccat::ddl
