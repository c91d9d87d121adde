#pragma once
#include "utils/error_codes.hpp"
#include <string>
#include <vector>

// The shared, eventually consistent namespace participants coordinate
// through. Locations are '/'-separated logical paths whose first segment is
// the owning participant's identity. Every location has a single designated
// writer, and values are written once and then only re-read.
class StorageTransport {
public:
  virtual ~StorageTransport() = default;

  // TransportNotFound when nothing is stored at `location`
  virtual ringsum::Result<std::string> readText(const std::string &location) = 0;

  // Creates parent structure as needed. Rewriting identical content is a
  // no-op.
  virtual ringsum::Result<void> writeText(const std::string &location,
                                          const std::string &content) = 0;

  // Must be called before the guarded value is written
  virtual ringsum::Result<void>
  setPermissions(const std::string &location,
                 const std::vector<std::string> &readers,
                 const std::vector<std::string> &writers) = 0;

  virtual bool exists(const std::string &location) = 0;
};
