#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/race.hpp"
#include "internal/rating/update_engine.hpp"
#include "service_context.hpp"

namespace gaitrank::service {

enum class RaceDisposition {
  kApplied,
  kQualifier,
  kSkipped,    // fewer than two valid finishers
  kDuplicate,  // already applied earlier
  kOutOfOrder, // older than the latest race applied to the discipline
  kFailed,     // rolled back
};

constexpr std::string_view ToString(RaceDisposition disposition) {
  switch (disposition) {
    case RaceDisposition::kApplied:
      return "applied";
    case RaceDisposition::kQualifier:
      return "qualifier";
    case RaceDisposition::kSkipped:
      return "skipped";
    case RaceDisposition::kDuplicate:
      return "duplicate";
    case RaceDisposition::kOutOfOrder:
      return "out_of_order";
    case RaceDisposition::kFailed:
      return "failed";
  }
  return "unknown";
}

struct RaceReport {
  std::string     race;
  RaceDisposition disposition = RaceDisposition::kApplied;
  // classes whose update failed numerically; the rest of the race was applied
  std::vector<rating::ClassOutcome> class_failures;
  std::string                       error;
};

struct BatchSummary {
  std::size_t processed    = 0;
  std::size_t qualifiers   = 0;
  std::size_t skipped      = 0;
  std::size_t duplicates   = 0;
  std::size_t out_of_order = 0;
  std::size_t failed       = 0;
  // (race, class) pairs that failed inside otherwise applied races
  std::size_t class_failures = 0;

  std::vector<RaceReport> races;
};

struct IngestOptions {
  // run everything, then roll each race back
  bool dry_run = false;
};

/*
  IngestService

  Applies finished races to the rating store, one transaction per race.

  - races of a batch are applied in race-date order per discipline
  - a race already present in the audit log is reported as duplicate
    and not re-applied
  - a race older than the latest applied race of its discipline is
    rejected as out of order
  - any error rolls back that race only; the batch continues

  Writers of the same discipline are serialized.
*/
class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  BatchSummary IngestBatch(std::vector<model::Race> races, const IngestOptions& options = {});

  RaceReport IngestRace(const model::Race& race, const IngestOptions& options = {});

 private:
  RaceReport ApplyLocked(const model::Race& race, const IngestOptions& options);

  std::mutex& DisciplineMutex(model::Discipline discipline);

  ServiceContext            ctx_;
  std::array<std::mutex, 2> discipline_mutexes_;
};

} // namespace gaitrank::service
