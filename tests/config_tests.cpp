#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "participant/participant_config.hpp"
#include "participant/record_source.hpp"
#include "protocol/parser.hpp"
#include "transport/sync_dir_transport.hpp"

namespace {

using ringsum::ErrorCode;
namespace fs = std::filesystem;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

fs::path TempPath(const std::string& name) {
  return fs::temp_directory_path() /
         (name + "-" +
          std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
}

void TestConfigDefaults() {
  ParticipantConfig config(nlohmann::json{{"participant_id", "alice@example.org"}});
  Expect(config.participant_id == "alice@example.org", "participant id");
  Expect(config.sync_root == "sync", "default sync root");
  Expect(config.app_name == "private-histogram", "default app name");
  Expect(config.ring_source == "ring.json", "default ring source");
  Expect(config.aggregate_mode == AggregationMode::Mean, "mean by default");
  Expect(config.auto_generate_record, "records generated by default");
  Expect(config.http_timeout_seconds == 5, "default timeout");
  Expect(config.log_file == "app.log", "default log file");
}

void TestConfigOverrides() {
  ParticipantConfig config(nlohmann::json{
      {"participant_id", "bob@example.org"},
      {"sync_root", "/tmp/sync"},
      {"app_name", "movie-stats"},
      {"ring_source", "https://example.org/ring.json"},
      {"aggregate_mode", "sum"},
      {"auto_generate_record", false},
      {"http_timeout_seconds", 30},
      {"log_file", ""},
  });
  Expect(config.sync_root == "/tmp/sync", "sync root");
  Expect(config.app_name == "movie-stats", "app name");
  Expect(config.ring_source == "https://example.org/ring.json", "ring source");
  Expect(config.aggregate_mode == AggregationMode::Sum, "sum mode");
  Expect(!config.auto_generate_record, "auto generation off");
  Expect(config.http_timeout_seconds == 30, "timeout");
  Expect(config.log_file.empty(), "logging to console only");
}

void TestConfigValidation() {
  ExpectThrow([]() { ParticipantConfig config(nlohmann::json::object()); },
              "participant_id is required");
  ExpectThrow([]() { ParticipantConfig config(nlohmann::json{{"participant_id", "a/b"}}); },
              "participant_id must be a single path segment");
  ExpectThrow(
      []() {
        ParticipantConfig config(
            nlohmann::json{{"participant_id", "alice"}, {"aggregate_mode", "median"}});
      },
      "unknown aggregate mode");
  ExpectThrow(
      []() {
        ParticipantConfig config(
            nlohmann::json{{"participant_id", "alice"}, {"app_name", "a/b"}});
      },
      "app name must be a single path segment");
  ExpectThrow(
      []() {
        ParticipantConfig config(
            nlohmann::json{{"participant_id", "alice"}, {"http_timeout_seconds", 0}});
      },
      "timeout must be positive");
  ExpectThrow(
      []() {
        ParticipantConfig config(nlohmann::json{{"participant_id", 42}});
      },
      "participant_id must be a string");
  ExpectThrow([]() { ParticipantConfig config(nlohmann::json{{"participant_id", ".."}}); },
              "participant_id must not name the parent directory");
  ExpectThrow([]() { ParticipantConfig config(nlohmann::json{{"participant_id", "."}}); },
              "participant_id must not name the current directory");
  ExpectThrow(
      []() {
        ParticipantConfig config(nlohmann::json{{"participant_id", "alice"}, {"app_name", ".."}});
      },
      "app name must not name the parent directory");
  ExpectThrow(
      []() {
        ParticipantConfig config(
            nlohmann::json{{"participant_id", "alice"}, {"ring_source", "http:///ring.json"}});
      },
      "ring URL without a host is a configuration error");
  ExpectThrow(
      []() {
        ParticipantConfig config(
            nlohmann::json{{"participant_id", "alice"}, {"ring_source", "https://"}});
      },
      "ring URL with nothing after the scheme");
}

void TestConfigFromFile() {
  const std::string path = TempPath("ringsum-config").string() + ".json";
  {
    std::ofstream out(path);
    out << R"({"participant_id": "carol@example.org", "aggregate_mode": "sum"})";
  }
  ParticipantConfig config(path);
  Expect(config.participant_id == "carol@example.org", "id read from file");
  Expect(config.aggregate_mode == AggregationMode::Sum, "mode read from file");

  {
    std::ofstream out(path, std::ios::trunc);
    out << "{ not json";
  }
  ExpectThrow([&path]() { ParticipantConfig broken(path); }, "malformed config file");
  fs::remove(path);

  ExpectThrow([&path]() { ParticipantConfig missing(path); },
              "missing file leaves participant_id empty");
}

void TestSyncDirReadWrite() {
  const fs::path root = TempPath("ringsum-sync");
  SyncDirTransport transport(root);

  const std::string location = "alice@example.org/public/private-histogram/encrypted_data.json";
  Expect(!transport.exists(location), "nothing there yet");
  Expect(transport.readText(location).error() == ErrorCode::TransportNotFound,
         "missing file is NotFound");

  Expect(transport.writeText(location, R"({"view_time": 1})").isSuccess(), "first write");
  Expect(transport.exists(location), "file exists after write");
  Expect(transport.readText(location).value() == R"({"view_time": 1})", "content round trips");

  Expect(transport.writeText(location, R"({"view_time": 2})").isSuccess(), "overwrite");
  Expect(transport.readText(location).value() == R"({"view_time": 2})", "overwritten");

  const auto before = fs::last_write_time(root / location);
  Expect(transport.writeText(location, R"({"view_time": 2})").isSuccess(), "identical write");
  Expect(fs::last_write_time(root / location) == before, "identical content is not rewritten");

  Expect(!fs::exists(root / (location + ".tmp")), "no temporary file left behind");
  fs::remove_all(root);
}

void TestSyncDirPermissionFile() {
  const fs::path root = TempPath("ringsum-perm");
  SyncDirTransport transport(root);

  const std::string dir = "alice/app_pipelines/private-histogram/first";
  Expect(transport.setPermissions(dir, {"alice"}, {"carol"}).isSuccess(), "permissions set");

  const fs::path perm_path = root / dir / SyncDirTransport::kPermissionFileName;
  Expect(fs::exists(perm_path), "permission file written");

  std::ifstream in(perm_path);
  nlohmann::json perm = nlohmann::json::parse(in);
  Expect(perm["read"] == nlohmann::json::array({"alice"}), "readers");
  Expect(perm["write"] == nlohmann::json::array({"carol"}), "writers");
  Expect(perm["admin"] == nlohmann::json::array({"carol"}), "admins follow writers");
  Expect(perm["filepath"].is_null() && perm["terminal"] == false, "sync client fields");

  fs::remove_all(root);
}

void TestRandomRecordRanges() {
  RandomRecordSource source(99);
  for (int i = 0; i < 50; ++i) {
    PrivateRecord record = source.collectRecord();
    Expect(record.fields.size() == 4, "four histogram fields");
    Expect(record.fields.at("view_time") >= 10 && record.fields.at("view_time") <= 20,
           "view_time in 10..20");
    Expect(record.fields.at("average_views_per_day") >= 1 &&
               record.fields.at("average_views_per_day") <= 5,
           "average_views_per_day in 1..5");
    Expect(record.fields.at("num_movies_watched") >= 5 &&
               record.fields.at("num_movies_watched") <= 10,
           "num_movies_watched in 5..10");
    Expect(record.fields.at("num_movies_rated") >= 0 &&
               record.fields.at("num_movies_rated") <= 5,
           "num_movies_rated in 0..5");
  }

  RandomRecordSource a(7);
  RandomRecordSource b(7);
  Expect(a.collectRecord().fields == b.collectRecord().fields, "seeded sources agree");
}

void TestPrivateRecordParsing() {
  auto record = parsePrivateRecord(R"({"view_time": 12, "num_movies_rated": 0})");
  Expect(record.has_value() && record->fields.size() == 2, "valid record");
  Expect(!parsePrivateRecord("{}").has_value(), "empty record");
  Expect(!parsePrivateRecord(R"({"view_time": "12"})").has_value(), "strings are not values");
  Expect(!parsePrivateRecord(R"({"view_time": 1.5})").has_value(), "fractions are not values");
  Expect(!parsePrivateRecord("[1, 2]").has_value(), "arrays are not records");

  Expect(parsePrivateRecord(R"({"view_time": 4503599627370496})").has_value(),
         "2^52 is the largest accepted value");
  Expect(parsePrivateRecord(R"({"view_time": -4503599627370496})").has_value(),
         "-2^52 is the smallest accepted value");
  Expect(!parsePrivateRecord(R"({"view_time": 4503599627370497})").has_value(),
         "values above 2^52 are rejected");
  Expect(!parsePrivateRecord(R"({"view_time": 9223372036854775807})").has_value(),
         "INT64_MAX would overflow when masked");
  Expect(!parsePrivateRecord(R"({"view_time": -9223372036854775808})").has_value(),
         "INT64_MIN would overflow when masked");
  Expect(!parsePrivateRecord(R"({"view_time": 18446744073709551615})").has_value(),
         "unsigned values above INT64_MAX are not wrapped");
}

}  // namespace

int main() {
  try {
    TestConfigDefaults();
    TestConfigOverrides();
    TestConfigValidation();
    TestConfigFromFile();
    TestSyncDirReadWrite();
    TestSyncDirPermissionFile();
    TestRandomRecordRanges();
    TestPrivateRecordParsing();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Config tests passed" << '\n';
  return 0;
}
