#pragma once

#include <string>
#include <vector>

#include "gaitrank/v1/race.pb.h"
#include "internal/model/race.hpp"

namespace gaitrank::ingest {

/*
  Race cards and result sheets arrive as YAML matching gaitrank.v1.RaceCard:

    races:
      - gait: trot
        race_date: "2024-05-01 19:30"
        venue: Saratoga
        race_number: 3
        starters:
          - { horse_name: "Lucky Strike", driver_name: "J. Smith", position: 1 }
          - { horse_name: "Slow Poke", finish_code: DNF }
*/
gaitrank::v1::RaceCard LoadRaceCard(const std::string& path);

// Validates and normalizes one race. Throws util::InvalidArgument naming the race on bad input.
model::Race ToModel(const gaitrank::v1::Race& race);

std::vector<model::Race> ToModel(const gaitrank::v1::RaceCard& card);

} // namespace gaitrank::ingest
