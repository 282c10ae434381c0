#pragma once

#include <vector>

#include "gaitrank/v1/race.pb.h"
#include "internal/model/race.hpp"
#include "service_context.hpp"

namespace gaitrank::service {

/*
  OddsService

  Prices a race card: every non-scratched starter gets a fused rating
  (horse, driver, trainer beliefs decayed as of the race date), the
  field goes through the softmax, and each line carries recent form for
  all three entities. Read only.
*/
class OddsService {
 public:
  explicit OddsService(ServiceContext ctx);

  // Throws util::InvalidArgument when no starter is left to price.
  gaitrank::v1::OddsReport Price(const model::Race& race);

  gaitrank::v1::OddsReportSet PriceCard(const std::vector<model::Race>& races);

 private:
  ServiceContext ctx_;
};

} // namespace gaitrank::service
