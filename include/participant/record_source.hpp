#pragma once
#include "protocol/artifacts.hpp"
#include <random>
#include <string>

// Abstract interface for the source of a participant's private record
class RecordSource {
public:
  virtual ~RecordSource() = default;

  // Called once per round, when no private record exists yet
  virtual PrivateRecord collectRecord() = 0;
};

// Random viewing statistics in the ranges of the histogram app:
// view_time 10-20, average_views_per_day 1-5, num_movies_watched 5-10,
// num_movies_rated 0-5
class RandomRecordSource : public RecordSource {
public:
  RandomRecordSource();
  explicit RandomRecordSource(unsigned int seed);

  PrivateRecord collectRecord() override;

private:
  std::mt19937 gen_;
};
