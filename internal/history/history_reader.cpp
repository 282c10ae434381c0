#include "history_reader.hpp"

namespace gaitrank::history {

HistoryReader::HistoryReader(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::size_t HistoryReader::DefaultLimit(model::EntityClass entity_class) {
  return entity_class == model::EntityClass::kHorse ? 5 : 3;
}

std::vector<FormEntry> HistoryReader::RecentForm(db::Transaction& tx, const model::EntityKey& key, std::size_t limit) const {
  if (limit == 0) return {};

  // one extra row supplies the baseline for the oldest delta
  const auto rows = repository_->ReadHistory(tx, key, static_cast<uint64_t>(limit) + 1);

  std::vector<FormEntry> out;
  for (std::size_t i = 0; i < rows.size() && i < limit; ++i) {
    const auto& row = rows[i];

    FormEntry entry;
    entry.race_date  = util::FromUnixSeconds(row.race_date_s);
    entry.venue      = row.venue;
    entry.finish     = row.finish;
    entry.race_class = row.race_class;
    entry.horse_name = row.horse_name;
    entry.mu         = row.mu;
    entry.sigma      = row.sigma;
    entry.mu_delta   = i + 1 < rows.size() ? row.mu - rows[i + 1].mu : 0.0;
    out.push_back(std::move(entry));
  }
  return out;
}

} // namespace gaitrank::history
