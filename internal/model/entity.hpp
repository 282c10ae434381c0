#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gaitrank::model {

// Two fully isolated rating universes.
enum class Discipline : std::uint8_t {
  kTrot = 1,
  kPace = 2,
};

enum class EntityClass : std::uint8_t {
  kHorse   = 1,
  kDriver  = 2,
  kTrainer = 3,
};

inline constexpr std::array<Discipline, 2>  kAllDisciplines = {Discipline::kTrot, Discipline::kPace};
inline constexpr std::array<EntityClass, 3> kAllEntityClasses = {EntityClass::kHorse, EntityClass::kDriver, EntityClass::kTrainer};

constexpr std::string_view ToString(Discipline discipline) {
  switch (discipline) {
    case Discipline::kTrot:
      return "trot";
    case Discipline::kPace:
      return "pace";
  }
  return "unknown";
}

constexpr std::string_view ToString(EntityClass entity_class) {
  switch (entity_class) {
    case EntityClass::kHorse:
      return "horse";
    case EntityClass::kDriver:
      return "driver";
    case EntityClass::kTrainer:
      return "trainer";
  }
  return "unknown";
}

// Case-insensitive. "galt" is a common OCR misreading of "trot" on printed cards.
std::optional<Discipline>  ParseDiscipline(std::string_view text);
std::optional<EntityClass> ParseEntityClass(std::string_view text);

/*
  Identity of a rated entity: unique within (discipline, entity class).
  `name` is always normalized (see util::NormalizeName).
*/
struct EntityKey {
  Discipline  discipline   = Discipline::kTrot;
  EntityClass entity_class = EntityClass::kHorse;
  std::string name;

  bool operator==(const EntityKey&) const = default;
};

std::string ToString(const EntityKey& key);

} // namespace gaitrank::model
