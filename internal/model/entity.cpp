#include "entity.hpp"

#include "internal/util/names.hpp"

namespace gaitrank::model {

std::optional<Discipline> ParseDiscipline(std::string_view text) {
  const auto lowered = util::NormalizeName(text);
  // OCR reads "trot" as "galt", sometimes with trailing noise
  if (lowered == "trot" || lowered.starts_with("galt")) return Discipline::kTrot;
  if (lowered == "pace") return Discipline::kPace;
  return std::nullopt;
}

std::optional<EntityClass> ParseEntityClass(std::string_view text) {
  const auto lowered = util::NormalizeName(text);
  if (lowered == "horse") return EntityClass::kHorse;
  if (lowered == "driver") return EntityClass::kDriver;
  if (lowered == "trainer") return EntityClass::kTrainer;
  return std::nullopt;
}

std::string ToString(const EntityKey& key) {
  std::string out;
  out.append(ToString(key.discipline));
  out.push_back('/');
  out.append(ToString(key.entity_class));
  out.push_back('/');
  out.append(key.name);
  return out;
}

} // namespace gaitrank::model
