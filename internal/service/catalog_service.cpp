#include "catalog_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace gaitrank::service {

static model::EntityKey Normalized(model::EntityKey key) {
  key.name = util::NormalizeName(key.name);
  return key;
}

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

rating::EffectiveBelief CatalogService::Rating(const model::EntityKey& input, std::optional<util::TimePoint> as_of) {
  const auto key    = Normalized(input);
  auto       tx     = ctx_.repository->Begin();
  auto belief = ctx_.store->Read(*tx, key, as_of.value_or(util::Now()));
  if (!belief) {
    throw util::NotFound("no rating for " + model::ToString(key));
  }
  return *belief;
}

std::vector<history::FormEntry> CatalogService::Form(const model::EntityKey& input, std::optional<std::size_t> limit) {
  const auto key = Normalized(input);
  auto       tx  = ctx_.repository->Begin();
  return ctx_.history->RecentForm(*tx, key, limit.value_or(history::HistoryReader::DefaultLimit(key.entity_class)));
}

std::vector<rating::EffectiveBelief> CatalogService::Leaders(model::Discipline discipline, model::EntityClass entity_class, std::size_t limit,
                                                             std::optional<util::TimePoint> as_of) {
  auto tx      = ctx_.repository->Begin();
  auto beliefs = ctx_.store->List(*tx, discipline, entity_class, as_of.value_or(util::Now()));
  if (beliefs.size() > limit) beliefs.resize(limit);
  return beliefs;
}

} // namespace gaitrank::service
