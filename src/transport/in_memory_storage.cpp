#include "transport/in_memory_storage.hpp"
#include <stdexcept>
#include <utility>

namespace {

bool coversLocation(const std::string &prefix, const std::string &location) {
  if (location == prefix) {
    return true;
  }
  return location.size() > prefix.size() &&
         location.compare(0, prefix.size(), prefix) == 0 &&
         location[prefix.size()] == '/';
}

bool listsIdentity(const std::set<std::string> &identities,
                   const std::string &identity) {
  return identities.count(identity) > 0 || identities.count("*") > 0;
}

} // namespace

std::string locationOwner(const std::string &location) {
  return location.substr(0, location.find('/'));
}

std::shared_ptr<InMemoryStorageEndpoint>
InMemoryStorage::createEndpoint(const std::string &identity) {
  if (identity.empty() || identity.find('/') != std::string::npos) {
    throw std::invalid_argument("InMemoryStorage identity must be a non-empty path segment");
  }
  return std::make_shared<InMemoryStorageEndpoint>(identity, shared_from_this());
}

void InMemoryStorage::setUnreachable(const std::string &identity, bool unreachable) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unreachable) {
    unreachable_.insert(identity);
  } else {
    unreachable_.erase(identity);
  }
}

const InMemoryStorage::AccessList *
InMemoryStorage::findGoverning(const std::string &location) const {
  const AccessList *governing = nullptr;
  size_t best = 0;
  for (const auto &[prefix, acl] : access_lists_) {
    if (coversLocation(prefix, location) && prefix.size() >= best) {
      governing = &acl;
      best = prefix.size();
    }
  }
  return governing;
}

bool InMemoryStorage::mayRead(const std::string &actor,
                              const std::string &location) const {
  if (locationOwner(location) == actor) {
    return true;
  }
  const AccessList *acl = findGoverning(location);
  return acl != nullptr && listsIdentity(acl->readers, actor);
}

bool InMemoryStorage::mayWrite(const std::string &actor,
                               const std::string &location) const {
  if (locationOwner(location) == actor) {
    return true;
  }
  const AccessList *acl = findGoverning(location);
  return acl != nullptr && listsIdentity(acl->writers, actor);
}

bool InMemoryStorage::isReachable(const std::string &location) const {
  return unreachable_.count(locationOwner(location)) == 0;
}

ringsum::Result<std::string> InMemoryStorage::read(const std::string &actor,
                                                   const std::string &location) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!mayRead(actor, location)) {
    return ringsum::Result<std::string>(ringsum::ErrorCode::TransportPermissionDenied,
                                        actor + " may not read " + location);
  }
  auto it = blobs_.find(location);
  if (it == blobs_.end()) {
    return ringsum::Result<std::string>(ringsum::ErrorCode::TransportNotFound, location);
  }
  return it->second;
}

ringsum::Result<void> InMemoryStorage::write(const std::string &actor,
                                             const std::string &location,
                                             const std::string &content) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!isReachable(location)) {
    return {ringsum::ErrorCode::TransportWriteFailed,
            locationOwner(location) + " is unreachable"};
  }
  if (!mayWrite(actor, location)) {
    return {ringsum::ErrorCode::TransportPermissionDenied,
            actor + " may not write " + location};
  }

  auto it = blobs_.find(location);
  if (it != blobs_.end() && it->second == content) {
    return {};
  }
  blobs_[location] = content;
  history_.push_back({OperationKind::Write, actor, location});
  return {};
}

ringsum::Result<void>
InMemoryStorage::setPermissions(const std::string &actor, const std::string &location,
                                const std::vector<std::string> &readers,
                                const std::vector<std::string> &writers) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!isReachable(location)) {
    return {ringsum::ErrorCode::TransportWriteFailed,
            locationOwner(location) + " is unreachable"};
  }

  auto it = access_lists_.find(location);
  bool allowed = locationOwner(location) == actor || it == access_lists_.end() ||
                 it->second.writers.count(actor) > 0;
  if (!allowed) {
    return {ringsum::ErrorCode::TransportPermissionDenied,
            actor + " may not change permissions on " + location};
  }

  AccessList acl;
  acl.readers.insert(readers.begin(), readers.end());
  acl.writers.insert(writers.begin(), writers.end());
  access_lists_[location] = std::move(acl);
  history_.push_back({OperationKind::SetPermissions, actor, location});
  return {};
}

bool InMemoryStorage::exists(const std::string &actor, const std::string &location) {
  std::lock_guard<std::mutex> lock(mu_);
  // Writers can see their own deposits even when they cannot read them back
  if (!mayRead(actor, location) && !mayWrite(actor, location)) {
    return false;
  }
  return blobs_.count(location) > 0;
}

bool InMemoryStorage::canRead(const std::string &identity,
                              const std::string &location) const {
  std::lock_guard<std::mutex> lock(mu_);
  return mayRead(identity, location);
}

std::optional<InMemoryStorage::AccessList>
InMemoryStorage::governingAccessList(const std::string &location) const {
  std::lock_guard<std::mutex> lock(mu_);
  const AccessList *acl = findGoverning(location);
  if (acl == nullptr) {
    return std::nullopt;
  }
  return *acl;
}

std::optional<std::string> InMemoryStorage::peek(const std::string &location) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = blobs_.find(location);
  if (it == blobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<InMemoryStorage::Operation> InMemoryStorage::history() const {
  std::lock_guard<std::mutex> lock(mu_);
  return history_;
}

std::size_t InMemoryStorage::writeCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t count = 0;
  for (const auto &op : history_) {
    if (op.kind == OperationKind::Write) {
      ++count;
    }
  }
  return count;
}

InMemoryStorageEndpoint::InMemoryStorageEndpoint(std::string identity,
                                                 std::shared_ptr<InMemoryStorage> storage)
    : identity_(std::move(identity)), storage_(std::move(storage)) {
  if (!storage_) {
    throw std::invalid_argument("InMemoryStorageEndpoint requires a storage");
  }
}

ringsum::Result<std::string> InMemoryStorageEndpoint::readText(const std::string &location) {
  return storage_->read(identity_, location);
}

ringsum::Result<void> InMemoryStorageEndpoint::writeText(const std::string &location,
                                                         const std::string &content) {
  return storage_->write(identity_, location, content);
}

ringsum::Result<void>
InMemoryStorageEndpoint::setPermissions(const std::string &location,
                                        const std::vector<std::string> &readers,
                                        const std::vector<std::string> &writers) {
  return storage_->setPermissions(identity_, location, readers, writers);
}

bool InMemoryStorageEndpoint::exists(const std::string &location) {
  return storage_->exists(identity_, location);
}
