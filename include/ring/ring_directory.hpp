#pragma once
#include "utils/error_codes.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct NeighborPair {
  std::string prev_id;
  std::string next_id;
};

// (ring[(i-1) mod n], ring[(i+1) mod n]) for self at index i. A ring of one
// yields self on both sides; rejecting small rings is validateRing's job.
ringsum::Result<NeighborPair> resolveNeighbors(const std::vector<std::string> &ring,
                                               const std::string &self_id);

// A ring identity names the top-level directory of its tree: non-empty, no
// '/', and not "." or ".."
bool isValidIdentity(const std::string &identity);

// Valid unique members, at least kMinRingSize of them, self among them
ringsum::Result<void> validateRing(const std::vector<std::string> &ring,
                                   const std::string &self_id);

constexpr size_t kMinRingSize = 3;

// Source of the published ring membership. Fetched on every invocation since
// membership can change between invocations.
class RingDirectory {
public:
  virtual ~RingDirectory() = default;
  virtual ringsum::Result<std::vector<std::string>> fetchRing() = 0;
};

class StaticRingDirectory : public RingDirectory {
public:
  explicit StaticRingDirectory(std::vector<std::string> ring) : ring_(std::move(ring)) {}

  ringsum::Result<std::vector<std::string>> fetchRing() override { return ring_; }
  void setRing(std::vector<std::string> ring) { ring_ = std::move(ring); }

private:
  std::vector<std::string> ring_;
};

// Reads a {"ring": [...]} document from disk
class FileRingDirectory : public RingDirectory {
public:
  explicit FileRingDirectory(std::string path) : path_(std::move(path)) {}

  ringsum::Result<std::vector<std::string>> fetchRing() override;

private:
  std::string path_;
};

// Fetches a {"ring": [...]} document over http:// or https://
class HttpRingDirectory : public RingDirectory {
public:
  HttpRingDirectory(const std::string &url, int timeout_seconds);

  ringsum::Result<std::vector<std::string>> fetchRing() override;

  const std::string &schemeHostPort() const { return scheme_host_port_; }
  const std::string &path() const { return path_; }

private:
  std::string scheme_host_port_;
  std::string path_;
  int timeout_seconds_;
};

bool isHttpUrl(const std::string &source);

// ("scheme://host[:port]", "/path") of an http(s) URL; empty when the URL is
// not http(s) or has no host
std::optional<std::pair<std::string, std::string>> splitHttpUrl(const std::string &url);
