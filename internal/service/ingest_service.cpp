#include "ingest_service.hpp"

#include <algorithm>
#include <exception>

#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rating/qualifier_handler.hpp"
#include "internal/util/errors.hpp"

namespace gaitrank::service {

namespace {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

void WriteRaceEntries(db::Repository& repository, db::Transaction& tx, const model::Race& race) {
  const auto race_date_s = util::ToUnixSeconds(race.race_date);
  for (const auto& starter : race.starters) {
    if (starter.scratched || starter.horse_name.empty()) continue;

    db::model::RaceEntryRecord entry;
    entry.race_date_s  = race_date_s;
    entry.venue        = race.venue;
    entry.race_number  = race.race_number;
    entry.horse_name   = starter.horse_name;
    entry.driver_name  = starter.driver_name;
    entry.trainer_name = starter.trainer_name;
    entry.finish       = starter.finish.Display();
    entry.race_class   = race.race_class;
    entry.discipline   = race.discipline;
    entry.qualifier    = race.qualifier;
    db::ThrowIfDbError(repository.UpsertRaceEntry(tx, entry), "record race entry " + starter.horse_name);
  }
}

void Count(BatchSummary& summary, const RaceReport& report) {
  switch (report.disposition) {
    case RaceDisposition::kApplied:
      ++summary.processed;
      break;
    case RaceDisposition::kQualifier:
      ++summary.qualifiers;
      break;
    case RaceDisposition::kSkipped:
      ++summary.skipped;
      break;
    case RaceDisposition::kDuplicate:
      ++summary.duplicates;
      break;
    case RaceDisposition::kOutOfOrder:
      ++summary.out_of_order;
      break;
    case RaceDisposition::kFailed:
      ++summary.failed;
      break;
  }
  summary.class_failures += report.class_failures.size();
}

} // namespace

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::mutex& IngestService::DisciplineMutex(model::Discipline discipline) {
  return discipline_mutexes_[discipline == model::Discipline::kTrot ? 0 : 1];
}

BatchSummary IngestService::IngestBatch(std::vector<model::Race> races, const IngestOptions& options) {
  // disciplines are independent, so one global date order also orders each discipline
  std::stable_sort(races.begin(), races.end(), [](const model::Race& a, const model::Race& b) {
    if (a.race_date != b.race_date) return a.race_date < b.race_date;
    return a.race_number < b.race_number;
  });

  BatchSummary summary;
  for (const auto& race : races) {
    auto report = IngestRace(race, options);
    Count(summary, report);
    summary.races.push_back(std::move(report));
  }

  GAITRANK_LOG_INFO("Batch finished", {IntField("races", static_cast<int64_t>(races.size())),
                                       IntField("processed", static_cast<int64_t>(summary.processed)),
                                       IntField("qualifiers", static_cast<int64_t>(summary.qualifiers)),
                                       IntField("skipped", static_cast<int64_t>(summary.skipped)),
                                       IntField("duplicates", static_cast<int64_t>(summary.duplicates)),
                                       IntField("out_of_order", static_cast<int64_t>(summary.out_of_order)),
                                       IntField("failed", static_cast<int64_t>(summary.failed)),
                                       IntField("class_failures", static_cast<int64_t>(summary.class_failures)),
                                       BoolField("dry_run", options.dry_run)});
  return summary;
}

RaceReport IngestService::IngestRace(const model::Race& input, const IngestOptions& options) {
  const auto                  race = model::Normalized(input);
  std::lock_guard<std::mutex> lock(DisciplineMutex(race.discipline));

  RaceReport report;
  try {
    return ApplyLocked(race, options);
  } catch (const util::OutOfOrder& e) {
    GAITRANK_LOG_WARN("Race out of order, rejected", {StringField("race", model::Describe(race)), StringField("reason", e.what())});
    report.disposition = RaceDisposition::kOutOfOrder;
    report.error       = e.what();
  } catch (const std::exception& e) {
    GAITRANK_LOG_ERROR("Race failed, rolled back", {StringField("race", model::Describe(race)), StringField("error", e.what())});
    report.disposition = RaceDisposition::kFailed;
    report.error       = e.what();
  }
  report.race = model::Describe(race);
  return report;
}

RaceReport IngestService::ApplyLocked(const model::Race& race, const IngestOptions& options) {
  RaceReport report;
  report.race = model::Describe(race);

  auto tx = ctx_.repository->Begin();

  const auto race_date_s = util::ToUnixSeconds(race.race_date);
  if (!ctx_.repository->GetRaceEntries(*tx, race_date_s, race.venue, race.race_number).empty()) {
    GAITRANK_LOG_WARN("Race already applied, skipped", {StringField("race", report.race)});
    report.disposition = RaceDisposition::kDuplicate;
    return report;
  }

  if (const auto latest = ctx_.repository->LatestRaceDate(*tx, race.discipline); latest && race_date_s < *latest) {
    throw util::OutOfOrder("race dated before latest applied " + std::string(model::ToString(race.discipline)) + " race (" +
                           util::FormatDateTime(util::FromUnixSeconds(*latest)) + ")");
  }

  if (race.qualifier) {
    ctx_.qualifier_handler->Apply(*tx, race);
    report.disposition = RaceDisposition::kQualifier;
  } else {
    const auto outcome = ctx_.update_engine->Apply(*tx, race);
    if (outcome.status == rating::RaceStatus::kSkippedInsufficientField) {
      report.disposition = RaceDisposition::kSkipped;
      return report;
    }
    report.disposition = RaceDisposition::kApplied;
    for (const auto& c : outcome.classes) {
      if (c.status == rating::ClassStatus::kFailed) report.class_failures.push_back(c);
    }
  }

  WriteRaceEntries(*ctx_.repository, *tx, race);

  if (options.dry_run) {
    tx->Rollback();
    GAITRANK_LOG_INFO("Dry run, race rolled back", {StringField("race", report.race)});
    return report;
  }

  tx->Commit();
  return report;
}

} // namespace gaitrank::service
