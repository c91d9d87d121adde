#include "transport/sync_dir_transport.hpp"
#include "utils/logging.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

SyncDirTransport::SyncDirTransport(fs::path root) : root_(std::move(root)) {
  if (root_.empty()) {
    throw std::invalid_argument("SyncDirTransport requires a root directory");
  }
}

fs::path SyncDirTransport::resolve(const std::string &location) const {
  return root_ / fs::path(location).relative_path();
}

ringsum::Result<std::string>
SyncDirTransport::readText(const std::string &location) {
  fs::path path = resolve(location);

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return ringsum::Result<std::string>(ringsum::ErrorCode::TransportNotFound,
                                        location);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return ringsum::Result<std::string>(ringsum::ErrorCode::TransportReadFailed,
                                        "cannot open " + path.string());
  }

  std::ostringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    return ringsum::Result<std::string>(ringsum::ErrorCode::TransportReadFailed,
                                        "error reading " + path.string());
  }
  return ss.str();
}

ringsum::Result<void> SyncDirTransport::writeAtomically(const fs::path &path,
                                                        const std::string &content) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    return {ringsum::ErrorCode::TransportWriteFailed,
            "cannot create " + path.parent_path().string() + ": " + ec.message()};
  }

  // Readers on the other end of the sync must never see a half-written file
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return {ringsum::ErrorCode::TransportWriteFailed,
              "cannot open " + tmp.string()};
    }
    file << content;
    file.flush();
    if (!file) {
      return {ringsum::ErrorCode::TransportWriteFailed,
              "error writing " + tmp.string()};
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return {ringsum::ErrorCode::TransportWriteFailed,
            "cannot publish " + path.string()};
  }
  return {};
}

ringsum::Result<void> SyncDirTransport::writeText(const std::string &location,
                                                  const std::string &content) {
  fs::path path = resolve(location);

  auto existing = readText(location);
  if (existing.isSuccess() && existing.value() == content) {
    DEBUG_DEBUG("Unchanged content at " << location << ", skipping write");
    return {};
  }

  auto written = writeAtomically(path, content);
  if (written) {
    DEBUG_DEBUG("Wrote " << content.size() << " bytes to " << path.string());
  }
  return written;
}

ringsum::Result<void>
SyncDirTransport::setPermissions(const std::string &location,
                                 const std::vector<std::string> &readers,
                                 const std::vector<std::string> &writers) {
  // Same shape as the sync client's permission files
  nlohmann::json perm = {{"admin", writers},
                         {"read", readers},
                         {"write", writers},
                         {"filepath", nullptr},
                         {"terminal", false}};

  fs::path perm_path = resolve(location) / kPermissionFileName;
  std::string content = perm.dump(2);

  auto existing = readText(location + "/" + kPermissionFileName);
  if (existing.isSuccess() && existing.value() == content) {
    return {};
  }

  auto written = writeAtomically(perm_path, content);
  if (written) {
    DEBUG_DEBUG("Set permissions on " << location << " (" << readers.size()
                                      << " readers, " << writers.size()
                                      << " writers)");
  }
  return written;
}

bool SyncDirTransport::exists(const std::string &location) {
  std::error_code ec;
  return fs::exists(resolve(location), ec);
}
