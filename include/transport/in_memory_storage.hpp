#pragma once
#include "transport/storage_transport.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

class InMemoryStorageEndpoint;

// Shared in-process namespace with access control. Each participant talks to
// it through its own endpoint, which acts under that participant's identity:
//   - the owner (first path segment) may always read, write and set
//     permissions in its own tree;
//   - anyone else needs the governing access list (longest matching prefix)
//     to name them as reader ("*" = everyone) or writer;
//   - permissions on a location with no access list yet may be set by anyone,
//     afterwards only by its writers.
class InMemoryStorage : public std::enable_shared_from_this<InMemoryStorage> {
public:
  struct AccessList {
    std::set<std::string> readers;
    std::set<std::string> writers;
  };

  enum class OperationKind { Write, SetPermissions };

  struct Operation {
    OperationKind kind;
    std::string actor;
    std::string location;
  };

  std::shared_ptr<InMemoryStorageEndpoint> createEndpoint(const std::string &identity);

  // Writes into `identity`'s tree fail while it is unreachable
  void setUnreachable(const std::string &identity, bool unreachable);

  // Inspection, for tests and the simulation
  bool canRead(const std::string &identity, const std::string &location) const;
  std::optional<AccessList> governingAccessList(const std::string &location) const;
  std::optional<std::string> peek(const std::string &location) const;
  std::vector<Operation> history() const;
  std::size_t writeCount() const;

private:
  friend class InMemoryStorageEndpoint;

  ringsum::Result<std::string> read(const std::string &actor, const std::string &location);
  ringsum::Result<void> write(const std::string &actor, const std::string &location,
                              const std::string &content);
  ringsum::Result<void> setPermissions(const std::string &actor, const std::string &location,
                                       const std::vector<std::string> &readers,
                                       const std::vector<std::string> &writers);
  bool exists(const std::string &actor, const std::string &location);

  // Callers hold mu_
  const AccessList *findGoverning(const std::string &location) const;
  bool mayRead(const std::string &actor, const std::string &location) const;
  bool mayWrite(const std::string &actor, const std::string &location) const;
  bool isReachable(const std::string &location) const;

  std::map<std::string, std::string> blobs_;
  std::map<std::string, AccessList> access_lists_;
  std::unordered_set<std::string> unreachable_;
  std::vector<Operation> history_;
  mutable std::mutex mu_;
};

class InMemoryStorageEndpoint : public StorageTransport {
public:
  InMemoryStorageEndpoint(std::string identity, std::shared_ptr<InMemoryStorage> storage);

  InMemoryStorageEndpoint(const InMemoryStorageEndpoint &) = delete;
  InMemoryStorageEndpoint &operator=(const InMemoryStorageEndpoint &) = delete;

  ringsum::Result<std::string> readText(const std::string &location) override;
  ringsum::Result<void> writeText(const std::string &location,
                                  const std::string &content) override;
  ringsum::Result<void>
  setPermissions(const std::string &location,
                 const std::vector<std::string> &readers,
                 const std::vector<std::string> &writers) override;
  bool exists(const std::string &location) override;

  const std::string &identity() const { return identity_; }

private:
  std::string identity_;
  std::shared_ptr<InMemoryStorage> storage_;
};

// Owner identity of a '/'-separated location
std::string locationOwner(const std::string &location);
