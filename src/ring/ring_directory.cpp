#include "ring/ring_directory.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <fstream>
#include <httplib.h>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

ringsum::Result<NeighborPair> resolveNeighbors(const std::vector<std::string> &ring,
                                               const std::string &self_id) {
  size_t index = ring.size();
  for (size_t i = 0; i < ring.size(); ++i) {
    if (ring[i] == self_id) {
      index = i;
      break;
    }
  }

  if (index == ring.size()) {
    return ringsum::Result<NeighborPair>(ringsum::ErrorCode::ConfigNotInRing,
                                         "user_id " + self_id + " not found in the ring");
  }

  const size_t n = ring.size();
  NeighborPair pair;
  pair.prev_id = ring[(index + n - 1) % n];
  pair.next_id = ring[(index + 1) % n];

  DEBUG_INFO("Neighbors determined: previous=" << pair.prev_id
                                               << ", next=" << pair.next_id);
  return pair;
}

bool isValidIdentity(const std::string &identity) {
  return !identity.empty() && identity != "." && identity != ".." &&
         identity.find('/') == std::string::npos;
}

ringsum::Result<void> validateRing(const std::vector<std::string> &ring,
                                   const std::string &self_id) {
  std::unordered_set<std::string> seen;
  bool found_self = false;
  for (const auto &member : ring) {
    if (!isValidIdentity(member)) {
      return {ringsum::ErrorCode::ConfigInvalidConfiguration,
              "ring contains an invalid identity '" + member + "'"};
    }
    if (!seen.insert(member).second) {
      return {ringsum::ErrorCode::ConfigDuplicateMember, member};
    }
    found_self = found_self || member == self_id;
  }

  if (!found_self) {
    return {ringsum::ErrorCode::ConfigNotInRing, "user_id " + self_id + " not found in the ring"};
  }

  // Below 3 members a participant can subtract its own contribution and
  // recover its neighbor's record
  if (ring.size() < kMinRingSize) {
    return {ringsum::ErrorCode::ConfigRingTooSmall,
            std::to_string(ring.size()) + " members"};
  }
  return {};
}

ringsum::Result<std::vector<std::string>> FileRingDirectory::fetchRing() {
  std::ifstream file(path_);
  if (!file.is_open()) {
    return ringsum::Result<std::vector<std::string>>(
        ringsum::ErrorCode::TransportRingFetchFailed, "cannot open " + path_);
  }

  std::ostringstream ss;
  ss << file.rdbuf();

  auto ring = parseRingDocument(ss.str());
  if (!ring) {
    return ringsum::Result<std::vector<std::string>>(
        ringsum::ErrorCode::ProtocolMalformedArtifact, "bad ring document in " + path_);
  }
  return std::move(*ring);
}

bool isHttpUrl(const std::string &source) {
  return source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0;
}

std::optional<std::pair<std::string, std::string>> splitHttpUrl(const std::string &url) {
  if (!isHttpUrl(url)) {
    return std::nullopt;
  }

  size_t host_begin = url.find("://") + 3;
  size_t path_begin = url.find('/', host_begin);
  if (path_begin == host_begin || host_begin == url.size()) {
    return std::nullopt;
  }
  if (path_begin == std::string::npos) {
    return std::make_pair(url, std::string("/"));
  }
  return std::make_pair(url.substr(0, path_begin), url.substr(path_begin));
}

HttpRingDirectory::HttpRingDirectory(const std::string &url, int timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
  if (!isHttpUrl(url)) {
    throw std::invalid_argument("Ring URL must start with http:// or https://: " + url);
  }

  auto parts = splitHttpUrl(url);
  if (!parts) {
    throw std::invalid_argument("Ring URL has no host: " + url);
  }
  scheme_host_port_ = parts->first;
  path_ = parts->second;
}

ringsum::Result<std::vector<std::string>> HttpRingDirectory::fetchRing() {
  try {
    httplib::Client cli(scheme_host_port_);
    cli.set_connection_timeout(timeout_seconds_, 0);
    cli.set_read_timeout(timeout_seconds_, 0);
    cli.set_follow_location(true);

    DEBUG_DEBUG("Fetching ring from " << scheme_host_port_ << path_);
    auto res = cli.Get(path_);

    if (!res || res->status != 200) {
      std::string status =
          res ? std::to_string(res->status) : httplib::to_string(res.error());
      DEBUG_ERROR("Failed to fetch ring. Status: " << status);
      return ringsum::Result<std::vector<std::string>>(
          ringsum::ErrorCode::TransportRingFetchFailed, status);
    }

    auto ring = parseRingDocument(res->body);
    if (!ring) {
      return ringsum::Result<std::vector<std::string>>(
          ringsum::ErrorCode::ProtocolMalformedArtifact, "bad ring document");
    }
    return std::move(*ring);

  } catch (const std::exception &e) {
    DEBUG_ERROR("Exception fetching ring: " << e.what());
    return ringsum::Result<std::vector<std::string>>(
        ringsum::ErrorCode::TransportRingFetchFailed, e.what());
  }
}
