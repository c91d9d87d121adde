#include "participant/record_source.hpp"
#include "utils/logging.hpp"

namespace {

struct FieldRange {
  const char *name;
  int min_value;
  int max_value;
};

constexpr FieldRange kHistogramFields[] = {
    {"view_time", 10, 20},
    {"average_views_per_day", 1, 5},
    {"num_movies_watched", 5, 10},
    {"num_movies_rated", 0, 5},
};

} // namespace

RandomRecordSource::RandomRecordSource() : gen_(std::random_device{}()) {}

RandomRecordSource::RandomRecordSource(unsigned int seed) : gen_(seed) {}

PrivateRecord RandomRecordSource::collectRecord() {
  PrivateRecord record;
  for (const auto &range : kHistogramFields) {
    std::uniform_int_distribution<int> dis(range.min_value, range.max_value);
    record.fields[range.name] = dis(gen_);
  }

  DEBUG_DEBUG("Generated private record with " << record.fields.size() << " fields");
  return record;
}
