#include "internal/core/orchestrator.hpp"

#include "internal/core/routines.hpp"
#include "internal/ddl/kind_template.hpp"
#include "internal/ddl/trigger_generator.hpp"
#include "internal/ddl/view_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace doccat::core {

using catalog::TableType;

Orchestrator::Orchestrator(std::shared_ptr<catalog::NativeCatalog> catalog,
                           std::shared_ptr<catalog::Introspector> introspector,
                           std::shared_ptr<ddl::DdlExecutor> executor, catalog::NamespaceLayout layout)
    : catalog_(std::move(catalog)),
      introspector_(std::move(introspector)),
      executor_(std::move(executor)),
      layout_(std::move(layout)) {
}

std::vector<ddl::Statement> Orchestrator::PlanInstall() const {
  std::vector<ddl::Statement> plan;

  for (const auto& table : introspector_->TablesIn(layout_.native)) {
    if (!introspector_->TableExists(layout_.Extended(table))) {
      plan.emplace_back(ddl::CreateAlias{layout_.Merged(table), layout_.Native(table)});
      continue;
    }

    auto tmpl = ddl::BuildKindTemplate(*introspector_, layout_, table);
    if (!tmpl.HasCommentColumn()) {
      throw util::MetadataNotFound(tmpl.native.Physical() + " has no " + std::string(catalog::kCommentColumn) +
                                   " column but " + tmpl.extended.Physical() + " exists");
    }
    plan.emplace_back(ddl::GenerateMergeView(tmpl));
    plan.emplace_back(ddl::GenerateCommentTrigger(tmpl));
  }

  return plan;
}

InstallReport Orchestrator::Install() {
  observability::SpanScope span("Orchestrator.Install");
  span.SetAttribute("namespace", layout_.merged);

  auto plan = PlanInstall();
  executor_->ExecuteAll(plan);

  InstallReport report;
  for (const auto& stmt : plan) {
    if (const auto* view = std::get_if<ddl::CreateView>(&stmt)) {
      report.merged.push_back(view->view.name);
      DOCCAT_LOG_INFO("merge view installed", {observability::StringField("kind", view->view.name)});
    } else if (const auto* alias = std::get_if<ddl::CreateAlias>(&stmt)) {
      report.aliased.push_back(alias->alias.name);
      DOCCAT_LOG_INFO("alias installed", {observability::StringField("table", alias->alias.name)});
    }
  }
  span.SetAttribute("merged", static_cast<std::int64_t>(report.merged.size()));
  span.SetAttribute("aliased", static_cast<std::int64_t>(report.aliased.size()));
  return report;
}

std::vector<ddl::Statement> Orchestrator::PlanUninstall() const {
  std::vector<ddl::Statement> plan;

  for (const auto& name : catalog_->TablesOfType(layout_.merged, TableType::kAlias)) {
    plan.emplace_back(ddl::DropObject{ddl::ObjectType::kAlias, layout_.Merged(name)});
  }
  for (const auto& name : catalog_->TriggersIn(layout_.merged)) {
    plan.emplace_back(ddl::DropObject{ddl::ObjectType::kTrigger, layout_.Merged(name)});
  }
  for (const auto& name : catalog_->TablesOfType(layout_.merged, TableType::kView)) {
    plan.emplace_back(ddl::DropObject{ddl::ObjectType::kView, layout_.Merged(name)});
  }
  for (const auto& name : catalog_->RoutinesIn(layout_.merged)) {
    if (name == kUninstallRoutine) continue;
    plan.emplace_back(ddl::DropObject{ddl::ObjectType::kRoutine, layout_.Merged(name)});
  }
  for (const auto& name : catalog_->TablesOfType(layout_.extended, TableType::kTable)) {
    plan.emplace_back(ddl::DropObject{ddl::ObjectType::kTable, layout_.Extended(name)});
  }
  if (catalog_->SchemaExists(layout_.extended)) {
    plan.emplace_back(ddl::DropSchema{layout_.extended});
  }

  return plan;
}

void Orchestrator::Uninstall() {
  observability::SpanScope span("Orchestrator.Uninstall");
  span.SetAttribute("namespace", layout_.merged);

  auto plan = PlanUninstall();
  executor_->ExecuteAll(plan);
  DOCCAT_LOG_INFO("uninstalled", {observability::IntField("statements", static_cast<std::int64_t>(plan.size()))});
}

} // namespace doccat::core
