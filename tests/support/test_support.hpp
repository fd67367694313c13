#pragma once

#include <cassert>
#include <memory>
#include <string_view>

#include "internal/core/unit_of_work.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

namespace booking::testing {

inline util::TimePoint At(std::string_view text) {
  auto tp = util::ParseDateTime(text);
  assert(tp && "bad timestamp literal in test");
  return *tp;
}

inline util::Date Day(std::string_view text) {
  auto date = util::ParseDate(text);
  assert(date && "bad date literal in test");
  return *date;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

/*
  Directory used across tests:
    spaces 1 "Sala A-101" (sala), 2 "Laboratorio L-2" (laboratorio),
           3 "Sala Cerrada" (sala, inactive), 5 "Auditorio" (auditorio)
    users  1 admin, 2 and 3 students, 4 inactive
*/
inline void SeedDirectory(db::Repository& repository) {
  core::RunUnit(repository, false, [&](db::Transaction& tx) {
    const db::model::SpaceRecord spaces[] = {
        {1, "Sala A-101", "sala", 40, "Edificio A", true},
        {2, "Laboratorio L-2", "laboratorio", 25, "Edificio L", true},
        {3, "Sala Cerrada", "sala", 10, "Edificio A", false},
        {5, "Auditorio", "auditorio", 200, "Edificio C", true},
    };
    for (const auto& space : spaces) {
      core::ThrowIfDbError(repository.UpsertSpace(tx, space), "seed space");
    }

    const db::model::UserRecord users[] = {
        {1, "Admin", "admin", true},
        {2, "Ana", "estudiante", true},
        {3, "Bruno", "estudiante", true},
        {4, "Carla", "estudiante", false},
    };
    for (const auto& user : users) {
      core::ThrowIfDbError(repository.UpsertUser(tx, user), "seed user");
    }
  });
}

inline std::shared_ptr<db::Repository> SeededMemoryRepository() {
  auto repository = std::make_shared<db::memory::MemoryRepository>();
  SeedDirectory(*repository);
  return repository;
}

} // namespace booking::testing
