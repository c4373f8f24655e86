#include "internal/ddl/trigger_generator.hpp"

#include "internal/util/errors.hpp"

namespace doccat::ddl {

catalog::QualifiedName TriggerNameFor(const catalog::QualifiedName& view) {
  return {view.schema, view.name + "_SYNC"};
}

CreateTrigger GenerateCommentTrigger(const KindTemplate& tmpl) {
  if (!tmpl.HasCommentColumn()) {
    throw util::MetadataNotFound(tmpl.native.Physical() + " has no comment column to redirect");
  }

  CreateTrigger trigger;
  trigger.trigger        = TriggerNameFor(tmpl.merged);
  trigger.view           = tmpl.merged;
  trigger.target         = tmpl.extended;
  trigger.comment_column = tmpl.comment_column;
  trigger.keys           = tmpl.keys;
  trigger.carried        = tmpl.carried;
  trigger.steps          = TriggerSteps();
  return trigger;
}

} // namespace doccat::ddl
