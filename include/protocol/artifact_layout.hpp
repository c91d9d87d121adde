#pragma once
#include <string>
#include <utility>

// Where each per-participant artifact lives in the shared namespace:
//
//   <id>/
//   ├── app_pipelines/<app>/
//   │   ├── first/key.txt        written by the previous neighbor
//   │   └── second/key.txt       own secret, owner-only
//   ├── private/
//   │   ├── my_data.json         private record
//   │   └── <app>/aggregate_data.json
//   └── public/<app>/encrypted_data.json   masked record, ring-readable
class ArtifactLayout {
public:
  explicit ArtifactLayout(std::string app_name) : app_name_(std::move(app_name)) {}

  const std::string &appName() const { return app_name_; }

  std::string appDir(const std::string &id) const {
    return id + "/app_pipelines/" + app_name_;
  }
  std::string firstKeyDir(const std::string &id) const { return appDir(id) + "/first"; }
  std::string firstKey(const std::string &id) const { return firstKeyDir(id) + "/key.txt"; }
  std::string secondKeyDir(const std::string &id) const { return appDir(id) + "/second"; }
  std::string secondKey(const std::string &id) const { return secondKeyDir(id) + "/key.txt"; }

  std::string privateDir(const std::string &id) const { return id + "/private"; }
  std::string privateRecord(const std::string &id) const {
    return privateDir(id) + "/my_data.json";
  }
  std::string privateAppDir(const std::string &id) const {
    return privateDir(id) + "/" + app_name_;
  }
  std::string aggregateResult(const std::string &id) const {
    return privateAppDir(id) + "/aggregate_data.json";
  }

  std::string publicAppDir(const std::string &id) const {
    return id + "/public/" + app_name_;
  }
  std::string maskedRecord(const std::string &id) const {
    return publicAppDir(id) + "/encrypted_data.json";
  }

private:
  std::string app_name_;
};
