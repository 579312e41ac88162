#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace cascade::core {

/*
  Decides whether an actor may delete inside a container.
*/
class AccessPolicy {
 public:
  virtual ~AccessPolicy() = default;

  virtual bool CanDelete(const db::model::ContainerRecord& container, const std::string& actor_id) const = 0;
};

// Only the container owner.
class OwnerAccessPolicy final : public AccessPolicy {
 public:
  bool CanDelete(const db::model::ContainerRecord& container, const std::string& actor_id) const override;
};

class AllowAllAccessPolicy final : public AccessPolicy {
 public:
  bool CanDelete(const db::model::ContainerRecord& container, const std::string& actor_id) const override;
};

/*
  Resolves the container and applies the policy.

  Throws util::NotFound for an unknown container and
  util::PermissionDenied when the policy refuses.
*/
class AccessGuard {
 public:
  AccessGuard(std::shared_ptr<db::Repository> repository, std::shared_ptr<AccessPolicy> policy);

  db::model::ContainerRecord Authorize(db::Transaction& tx, const std::string& container_id, const std::string& actor_id) const;

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<AccessPolicy>   policy_;
};

} // namespace cascade::core
