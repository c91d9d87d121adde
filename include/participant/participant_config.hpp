#pragma once
#include "protocol/artifacts.hpp"
#include "ring/ring_directory.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

struct ParticipantConfig {
  // Identity
  std::string participant_id;

  // Storage
  std::string sync_root;
  std::string app_name;

  // Ring membership: http(s) URL or path to a {"ring": [...]} document
  std::string ring_source;
  int http_timeout_seconds;

  // Protocol options
  AggregationMode aggregate_mode;
  bool auto_generate_record;

  // Logging
  std::string log_file;

  ParticipantConfig(const std::string &configFile = "participant.json") {
    setDefaults();

    // Try to load from config file
    std::ifstream file(configFile);
    if (file.is_open()) {
      try {
        nlohmann::json config;
        file >> config;
        load(config);
        validate();
      } catch (const std::exception &e) {
        throw std::runtime_error("Failed to load config from " + configFile + ": " + e.what());
      }
    } else {
      validate();
    }
  }

  explicit ParticipantConfig(const nlohmann::json &config) {
    setDefaults();
    load(config);
    validate();
  }

private:
  void setDefaults() {
    participant_id = "";
    sync_root = "sync";
    app_name = "private-histogram";
    ring_source = "ring.json";
    http_timeout_seconds = 5;
    aggregate_mode = AggregationMode::Mean;
    auto_generate_record = true;
    log_file = "app.log";
  }

  void load(const nlohmann::json &config) {
    if (config.contains("participant_id")) participant_id = config["participant_id"];
    if (config.contains("sync_root")) sync_root = config["sync_root"];
    if (config.contains("app_name")) app_name = config["app_name"];
    if (config.contains("ring_source")) ring_source = config["ring_source"];
    if (config.contains("http_timeout_seconds")) http_timeout_seconds = config["http_timeout_seconds"];
    if (config.contains("auto_generate_record")) auto_generate_record = config["auto_generate_record"];
    if (config.contains("log_file")) log_file = config["log_file"];

    if (config.contains("aggregate_mode")) {
      std::string mode = config["aggregate_mode"];
      auto parsed = parseAggregationMode(mode);
      if (!parsed) {
        throw std::invalid_argument("Invalid aggregate_mode: " + mode + ". Must be 'sum' or 'mean'");
      }
      aggregate_mode = *parsed;
    }
  }

  void validate() {
    if (participant_id.empty()) {
      throw std::invalid_argument("participant_id cannot be empty");
    }

    if (!isValidIdentity(participant_id)) {
      throw std::invalid_argument("Invalid participant_id: " + participant_id + ". Must not contain '/' or be '.' or '..'");
    }

    if (sync_root.empty()) {
      throw std::invalid_argument("sync_root cannot be empty");
    }

    if (app_name.empty() || app_name == "." || app_name == ".." ||
        app_name.find('/') != std::string::npos) {
      throw std::invalid_argument("Invalid app_name: '" + app_name + "'. Must be a non-empty path segment");
    }

    if (ring_source.empty()) {
      throw std::invalid_argument("ring_source cannot be empty");
    }

    if (isHttpUrl(ring_source) && !splitHttpUrl(ring_source)) {
      throw std::invalid_argument("Invalid ring_source: " + ring_source + ". URL has no host");
    }

    if (http_timeout_seconds < 1) {
      throw std::invalid_argument("Invalid http_timeout_seconds: " + std::to_string(http_timeout_seconds) + ". Must be >= 1");
    }
  }
};
