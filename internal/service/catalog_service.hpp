#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "internal/history/history_reader.hpp"
#include "internal/model/entity.hpp"
#include "internal/rating/rating_store.hpp"
#include "internal/util/time.hpp"
#include "service_context.hpp"

namespace gaitrank::service {

/*
  Read-only queries over stored beliefs and their history.
*/
class CatalogService {
 public:
  explicit CatalogService(ServiceContext ctx);

  // Decayed as of `as_of` (now when unset). Throws util::NotFound for an unseen entity.
  rating::EffectiveBelief Rating(const model::EntityKey& key, std::optional<util::TimePoint> as_of = std::nullopt);

  // Newest first. `limit` defaults to the class's form window.
  std::vector<history::FormEntry> Form(const model::EntityKey& key, std::optional<std::size_t> limit = std::nullopt);

  std::vector<rating::EffectiveBelief> Leaders(model::Discipline discipline, model::EntityClass entity_class, std::size_t limit,
                                               std::optional<util::TimePoint> as_of = std::nullopt);

 private:
  ServiceContext ctx_;
};

} // namespace gaitrank::service
