#pragma once
#include "transport/storage_transport.hpp"
#include <filesystem>
#include <string>
#include <vector>

// StorageTransport over a locally synchronized directory tree. A separate
// sync client replicates the tree between participants and honours the
// `_.syftperm` permission files written by setPermissions().
class SyncDirTransport : public StorageTransport {
public:
  static constexpr const char *kPermissionFileName = "_.syftperm";

  explicit SyncDirTransport(std::filesystem::path root);

  ringsum::Result<std::string> readText(const std::string &location) override;
  ringsum::Result<void> writeText(const std::string &location,
                                  const std::string &content) override;
  ringsum::Result<void>
  setPermissions(const std::string &location,
                 const std::vector<std::string> &readers,
                 const std::vector<std::string> &writers) override;
  bool exists(const std::string &location) override;

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;

  std::filesystem::path resolve(const std::string &location) const;
  ringsum::Result<void> writeAtomically(const std::filesystem::path &path,
                                        const std::string &content);
};
