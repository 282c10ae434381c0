#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/race_card_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"
#include "internal/util/time.hpp"

using gaitrank::factory::Application;
using namespace gaitrank;

static void Usage() {
  std::cout << "Usage:\n"
            << "  gaitrank --config <config.yaml> ingest <races.yaml> [--dry-run]\n"
            << "  gaitrank --config <config.yaml> odds <card.yaml> [--json]\n"
            << "  gaitrank --config <config.yaml> rating <trot|pace> <horse|driver|trainer> <name> [--as-of YYYY-MM-DD]\n"
            << "  gaitrank --config <config.yaml> form <trot|pace> <horse|driver|trainer> <name> [--limit N]\n"
            << "  gaitrank --config <config.yaml> leaders <trot|pace> <horse|driver|trainer> [--limit N] [--as-of YYYY-MM-DD]\n";
}

// Thrown for malformed command lines; main() prints usage and exits 1.
class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct Args {
  std::vector<std::string>   positional;
  bool                       dry_run = false;
  bool                       json    = false;
  std::optional<std::string> as_of;
  std::optional<std::size_t> limit;
};

static Args ParseArgs(const std::vector<std::string>& argv) {
  Args args;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    const auto& arg = argv[i];
    if (arg == "--dry-run") {
      args.dry_run = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--as-of" || arg == "--limit") {
      if (i + 1 >= argv.size()) throw UsageError(arg + " needs a value");
      const auto& value = argv[++i];
      if (arg == "--as-of") {
        args.as_of = value;
      } else {
        try {
          std::size_t consumed = 0;
          const auto  parsed   = std::stoul(value, &consumed);
          if (consumed != value.size()) throw UsageError("invalid --limit: " + value);
          args.limit = parsed;
        } catch (const std::logic_error&) {
          throw UsageError("invalid --limit: " + value);
        }
      }
    } else if (arg.rfind("--", 0) == 0) {
      throw UsageError("unknown option " + arg);
    } else {
      args.positional.push_back(arg);
    }
  }
  return args;
}

static model::EntityKey ParseKey(const std::string& discipline, const std::string& entity_class, const std::string& name) {
  auto d = model::ParseDiscipline(discipline);
  if (!d) throw UsageError("unknown discipline: " + discipline);
  auto c = model::ParseEntityClass(entity_class);
  if (!c) throw UsageError("unknown entity class: " + entity_class);
  return model::EntityKey{*d, *c, util::NormalizeName(name)};
}

static std::optional<util::TimePoint> AsOf(const Args& args) {
  if (!args.as_of) return std::nullopt;
  return util::ParseDate(*args.as_of);
}

static std::string FormatOdds(double odds) {
  if (!std::isfinite(odds)) return "inf";
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << odds;
  return out.str();
}

static void PrintForm(const char* label, const google::protobuf::RepeatedPtrField<v1::FormLine>& form) {
  for (const auto& line : form) {
    std::cout << "      " << std::left << std::setw(8) << label << line.race_date() << "  " << std::setw(14) << line.venue()
              << " fin=" << std::setw(4) << line.finish() << " mu=" << std::fixed << std::setprecision(1) << line.mu() << " ("
              << std::showpos << line.mu_delta() << std::noshowpos << ")";
    if (!line.race_class().empty()) std::cout << " class=" << line.race_class();
    if (!line.horse_name().empty()) std::cout << " horse=" << line.horse_name();
    std::cout << "\n";
  }
}

static void PrintReport(const v1::OddsReport& report) {
  std::cout << report.discipline() << " " << report.venue() << " race " << report.race_number() << " " << report.race_date() << "\n";
  std::cout << std::left << std::setw(5) << "rank" << std::setw(24) << "horse" << std::setw(20) << "driver" << std::setw(20) << "trainer"
            << std::right << std::setw(8) << "win%" << std::setw(9) << "odds" << std::setw(9) << "fused" << std::setw(9) << "horse"
            << std::setw(9) << "driver" << std::setw(9) << "trainer" << "\n";
  for (const auto& line : report.lines()) {
    std::cout << std::left << std::setw(5) << line.rank() << std::setw(24) << line.horse_name() << std::setw(20)
              << (line.has_driver_name() ? line.driver_name() : "-") << std::setw(20)
              << (line.has_trainer_name() ? line.trainer_name() : "-") << std::right << std::fixed << std::setprecision(1) << std::setw(8)
              << line.win_probability() * 100.0 << std::setw(9) << FormatOdds(line.decimal_odds()) << std::setw(9) << line.fused_mu()
              << std::setw(9) << line.horse_mu() << std::setw(9) << line.driver_mu() << std::setw(9) << line.trainer_mu() << "\n";
    PrintForm("horse", line.horse_form());
    PrintForm("driver", line.driver_form());
    PrintForm("trainer", line.trainer_form());
  }
  std::cout << "\n";
}

static int RunIngest(Application& app, const Args& args) {
  if (args.positional.size() != 2) throw UsageError("ingest takes one races file");

  auto races   = ingest::ToModel(ingest::LoadRaceCard(args.positional[1]));
  auto summary = app.ingest_service->IngestBatch(std::move(races), service::IngestOptions{args.dry_run});

  for (const auto& report : summary.races) {
    std::cout << std::left << std::setw(13) << service::ToString(report.disposition) << report.race;
    if (!report.error.empty()) std::cout << "  (" << report.error << ")";
    for (const auto& failure : report.class_failures) {
      std::cout << "  [" << model::ToString(failure.entity_class) << " failed: " << failure.error << "]";
    }
    std::cout << "\n";
  }

  std::cout << "processed=" << summary.processed << " qualifiers=" << summary.qualifiers << " skipped=" << summary.skipped
            << " duplicates=" << summary.duplicates << " out_of_order=" << summary.out_of_order << " failed=" << summary.failed
            << " class_failures=" << summary.class_failures << (args.dry_run ? " (dry run)" : "") << "\n";
  return 0;
}

static int RunOdds(Application& app, const Args& args) {
  if (args.positional.size() != 2) throw UsageError("odds takes one card file");

  const auto races = ingest::ToModel(ingest::LoadRaceCard(args.positional[1]));
  const auto set   = app.odds_service->PriceCard(races);

  if (args.json) {
    std::string                                json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    const auto status      = google::protobuf::util::MessageToJsonString(set, &json, options);
    if (!status.ok()) throw std::runtime_error("failed to render odds as JSON: " + std::string(status.message()));
    std::cout << json << "\n";
    return 0;
  }

  for (const auto& report : set.reports()) PrintReport(report);
  return 0;
}

static int RunRating(Application& app, const Args& args) {
  if (args.positional.size() != 4) throw UsageError("rating takes <discipline> <class> <name>");

  const auto key    = ParseKey(args.positional[1], args.positional[2], args.positional[3]);
  const auto belief = app.catalog_service->Rating(key, AsOf(args));

  std::cout << model::ToString(key) << std::fixed << std::setprecision(2) << " mu=" << belief.belief.mu << " sigma=" << belief.belief.sigma
            << " stored_mu=" << belief.stored_mu << " last_active=" << util::FormatDateTime(belief.last_active)
            << " days_inactive=" << belief.days_inactive;
  if (belief.last_venue) std::cout << " last_venue=" << *belief.last_venue;
  std::cout << "\n";
  return 0;
}

static int RunForm(Application& app, const Args& args) {
  if (args.positional.size() != 4) throw UsageError("form takes <discipline> <class> <name>");

  const auto key  = ParseKey(args.positional[1], args.positional[2], args.positional[3]);
  const auto form = app.catalog_service->Form(key, args.limit);
  if (form.empty()) {
    std::cout << "no history for " << model::ToString(key) << "\n";
    return 0;
  }

  for (const auto& entry : form) {
    std::cout << util::FormatDate(entry.race_date) << "  " << std::left << std::setw(14) << entry.venue << " fin=" << std::setw(4)
              << entry.finish << std::fixed << std::setprecision(1) << " mu=" << entry.mu << " sigma=" << entry.sigma << " ("
              << std::showpos << entry.mu_delta << std::noshowpos << ")";
    if (entry.race_class) std::cout << " class=" << *entry.race_class;
    if (entry.horse_name) std::cout << " horse=" << *entry.horse_name;
    std::cout << "\n";
  }
  return 0;
}

static int RunLeaders(Application& app, const Args& args) {
  if (args.positional.size() != 3) throw UsageError("leaders takes <discipline> <class>");

  const auto key     = ParseKey(args.positional[1], args.positional[2], "");
  const auto leaders = app.catalog_service->Leaders(key.discipline, key.entity_class, args.limit.value_or(20), AsOf(args));

  std::size_t rank = 0;
  for (const auto& entry : leaders) {
    std::cout << std::right << std::setw(4) << ++rank << "  " << std::left << std::setw(28) << entry.key.name << std::right << std::fixed
              << std::setprecision(1) << std::setw(9) << entry.belief.mu << std::setw(8) << entry.belief.sigma << "  "
              << util::FormatDate(entry.last_active) << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> rest(argv + 3, argv + argc);

  try {
    const auto args    = ParseArgs(rest);
    const auto command = args.positional.empty() ? std::string() : args.positional[0];

    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = factory::Build(config);

    int rc = 1;
    if (command == "ingest") {
      rc = RunIngest(app, args);
    } else if (command == "odds") {
      rc = RunOdds(app, args);
    } else if (command == "rating") {
      rc = RunRating(app, args);
    } else if (command == "form") {
      rc = RunForm(app, args);
    } else if (command == "leaders") {
      rc = RunLeaders(app, args);
    } else {
      throw UsageError("unknown command: " + command);
    }

    observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    GAITRANK_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return 2;
  }
}
