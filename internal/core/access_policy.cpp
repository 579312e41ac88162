#include "access_policy.hpp"

#include "internal/util/errors.hpp"

namespace cascade::core {

bool OwnerAccessPolicy::CanDelete(const db::model::ContainerRecord& container, const std::string& actor_id) const {
  return !actor_id.empty() && container.owner_id == actor_id;
}

bool AllowAllAccessPolicy::CanDelete(const db::model::ContainerRecord&, const std::string&) const {
  return true;
}

AccessGuard::AccessGuard(std::shared_ptr<db::Repository> repository, std::shared_ptr<AccessPolicy> policy)
    : repository_(std::move(repository)), policy_(std::move(policy)) {
}

db::model::ContainerRecord AccessGuard::Authorize(db::Transaction& tx, const std::string& container_id, const std::string& actor_id) const {
  auto container = repository_->GetContainer(tx, container_id);
  if (!container) {
    throw util::NotFound("Container '" + container_id + "' not found.");
  }
  if (!policy_->CanDelete(*container, actor_id)) {
    throw util::PermissionDenied("Actor '" + actor_id + "' is not allowed to delete in container '" + container_id + "'.");
  }
  return *container;
}

} // namespace cascade::core
