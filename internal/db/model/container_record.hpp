#pragma once

#include <string>

namespace cascade::db::model {

/*
  A container (world) scoping a hierarchy of entities.
  owner_id is what the default access policy checks against.
*/
struct ContainerRecord {
  std::string container_id;
  std::string owner_id;
  std::string name;
};

} // namespace cascade::db::model
