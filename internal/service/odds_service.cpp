#include "odds_service.hpp"

#include <optional>
#include <string>
#include <unordered_set>

#include "internal/db/api/repository.hpp"
#include "internal/history/history_reader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rating/fusion.hpp"
#include "internal/rating/odds_engine.hpp"
#include "internal/rating/rating_store.hpp"
#include "internal/util/errors.hpp"

namespace gaitrank::service {

using namespace gaitrank::v1;

namespace {

using observability::IntField;
using observability::StringField;

void AppendForm(const std::vector<history::FormEntry>& entries, google::protobuf::RepeatedPtrField<FormLine>* out) {
  for (const auto& entry : entries) {
    auto* line = out->Add();
    line->set_race_date(util::FormatDate(entry.race_date));
    line->set_venue(entry.venue);
    line->set_finish(entry.finish);
    line->set_race_class(entry.race_class.value_or(""));
    line->set_horse_name(entry.horse_name.value_or(""));
    line->set_mu(entry.mu);
    line->set_sigma(entry.sigma);
    line->set_mu_delta(entry.mu_delta);
  }
}

struct PricedStarter {
  const model::Starter*         starter = nullptr;
  rating::Belief                horse;
  std::optional<rating::Belief> driver;
  std::optional<rating::Belief> trainer;
  rating::FusedBelief           fused;
};

} // namespace

OddsService::OddsService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

OddsReport OddsService::Price(const model::Race& input) {
  const auto race       = model::Normalized(input);
  const auto race_label = model::Describe(race);
  auto       tx         = ctx_.repository->Begin();

  std::vector<PricedStarter>      priced;
  std::unordered_set<std::string> seen;
  for (const auto& starter : race.starters) {
    if (starter.scratched || starter.horse_name.empty()) continue;
    if (!seen.insert(starter.horse_name).second) {
      GAITRANK_LOG_WARN("Horse listed twice on card, later entry ignored",
                        {StringField("race", race_label), StringField("horse", starter.horse_name)});
      continue;
    }

    PricedStarter p;
    p.starter = &starter;
    p.horse   = ctx_.store->ReadOrDefault(*tx, {race.discipline, model::EntityClass::kHorse, starter.horse_name}, race.race_date);
    if (starter.driver_name && !starter.driver_name->empty()) {
      p.driver = ctx_.store->ReadOrDefault(*tx, {race.discipline, model::EntityClass::kDriver, *starter.driver_name}, race.race_date);
    }
    if (starter.trainer_name && !starter.trainer_name->empty()) {
      p.trainer = ctx_.store->ReadOrDefault(*tx, {race.discipline, model::EntityClass::kTrainer, *starter.trainer_name}, race.race_date);
    }
    p.fused = ctx_.fusion->Fuse(p.horse, p.driver, p.trainer);
    priced.push_back(std::move(p));
  }

  if (priced.empty()) {
    throw util::InvalidArgument("no starters to price in " + race_label);
  }

  std::vector<rating::OddsInput> field;
  field.reserve(priced.size());
  for (const auto& p : priced) {
    field.push_back(rating::OddsInput{p.starter->horse_name, p.fused.fused.mu});
  }
  const auto results = ctx_.odds->Compute(field);

  OddsReport report;
  report.set_discipline(std::string(model::ToString(race.discipline)));
  report.set_race_date(util::FormatDateTime(race.race_date));
  report.set_venue(race.venue);
  report.set_race_number(race.race_number);

  uint32_t rank = 0;
  for (const auto& result : results) {
    const auto& p    = priced[result.input_index];
    auto*       line = report.add_lines();
    line->set_rank(++rank);
    line->set_horse_name(p.starter->horse_name);
    if (p.driver) line->set_driver_name(*p.starter->driver_name);
    if (p.trainer) line->set_trainer_name(*p.starter->trainer_name);
    line->set_win_probability(result.win_probability);
    line->set_decimal_odds(result.decimal_odds);
    line->set_fused_mu(p.fused.fused.mu);
    line->set_fused_sigma(p.fused.fused.sigma);
    line->set_horse_mu(p.horse.mu);
    line->set_driver_mu(p.driver ? p.driver->mu : 0.0);
    line->set_trainer_mu(p.trainer ? p.trainer->mu : 0.0);

    const model::EntityKey horse_key{race.discipline, model::EntityClass::kHorse, p.starter->horse_name};
    AppendForm(ctx_.history->RecentForm(*tx, horse_key, history::HistoryReader::DefaultLimit(model::EntityClass::kHorse)),
               line->mutable_horse_form());
    if (p.driver) {
      const model::EntityKey key{race.discipline, model::EntityClass::kDriver, *p.starter->driver_name};
      AppendForm(ctx_.history->RecentForm(*tx, key, history::HistoryReader::DefaultLimit(model::EntityClass::kDriver)),
                 line->mutable_driver_form());
    }
    if (p.trainer) {
      const model::EntityKey key{race.discipline, model::EntityClass::kTrainer, *p.starter->trainer_name};
      AppendForm(ctx_.history->RecentForm(*tx, key, history::HistoryReader::DefaultLimit(model::EntityClass::kTrainer)),
                 line->mutable_trainer_form());
    }
  }

  GAITRANK_LOG_DEBUG("Race priced", {StringField("race", race_label), IntField("starters", static_cast<int64_t>(priced.size()))});
  return report;
}

OddsReportSet OddsService::PriceCard(const std::vector<model::Race>& races) {
  OddsReportSet set;
  for (const auto& race : races) {
    *set.add_reports() = Price(race);
  }
  return set;
}

} // namespace gaitrank::service
