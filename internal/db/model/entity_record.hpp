#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cascade::db::model {

/*
  Hierarchy member.

  The deletion fields (deleted_at_ms, deleted_by, expires_after_s) are set
  together when is_deleted flips to true and cleared together on restore.
*/
struct EntityRecord {
  std::string                container_id;
  std::string                entity_id;
  std::optional<std::string> parent_id; // nullopt marks a root
  std::string                name;

  bool                       is_deleted = false;
  std::optional<uint64_t>    deleted_at_ms;
  std::optional<std::string> deleted_by;
  std::optional<uint64_t>    expires_after_s;
};

} // namespace cascade::db::model
