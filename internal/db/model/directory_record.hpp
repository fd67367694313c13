#pragma once

#include <cstdint>
#include <string>

namespace booking::db::model {

// Read-only collaborators. The engine never edits these outside of seeding.

struct SpaceRecord {
  int64_t     id = 0;
  std::string name;
  std::string type;
  int32_t     capacity = 0;
  std::string location;
  bool        active = true;
};

struct UserRecord {
  int64_t     id = 0;
  std::string name;
  std::string role;
  bool        active = true;
};

} // namespace booking::db::model
