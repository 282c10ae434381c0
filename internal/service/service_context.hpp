#pragma once

#include <memory>

namespace gaitrank::db { class Repository; }
namespace gaitrank::rating {
class RatingStore;
class RatingUpdateEngine;
class QualifierHandler;
class RatingFusion;
class OddsEngine;
}
namespace gaitrank::history { class HistoryReader; }

namespace gaitrank::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<gaitrank::db::Repository>             repository;
  std::shared_ptr<gaitrank::rating::RatingStore>        store;
  std::shared_ptr<gaitrank::rating::RatingUpdateEngine> update_engine;
  std::shared_ptr<gaitrank::rating::QualifierHandler>   qualifier_handler;
  std::shared_ptr<gaitrank::rating::RatingFusion>       fusion;
  std::shared_ptr<gaitrank::rating::OddsEngine>         odds;
  std::shared_ptr<gaitrank::history::HistoryReader>     history;
};

} // namespace gaitrank::service
