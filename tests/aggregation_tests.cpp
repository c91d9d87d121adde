#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mpc/key_exchange.hpp"
#include "mpc/secure_sum.hpp"
#include "mpc/sum_computation.hpp"
#include "protocol/artifact_layout.hpp"
#include "protocol/parser.hpp"
#include "ring/ring_directory.hpp"
#include "transport/in_memory_storage.hpp"

namespace {

using ringsum::ErrorCode;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

// Three members with completed key exchange, ready to publish
struct PublishingRing {
  std::shared_ptr<InMemoryStorage> storage = std::make_shared<InMemoryStorage>();
  ArtifactLayout layout{"private-histogram"};
  std::vector<std::string> ring = {"alice", "bob", "carol"};
  std::vector<std::shared_ptr<InMemoryStorageEndpoint>> endpoints;

  PublishingRing() {
    std::vector<std::unique_ptr<KeyExchange>> exchanges;
    for (const auto& member : ring) {
      endpoints.push_back(storage->createEndpoint(member));
      exchanges.push_back(std::make_unique<KeyExchange>(
          *endpoints.back(), layout, member, resolveNeighbors(ring, member).value()));
    }
    for (auto& exchange : exchanges) {
      Expect(exchange->advance().isSuccess(), "key exchange advances");
    }
  }

  void publish(size_t index, const FieldValues& fields) {
    PrivateRecord record;
    record.fields = fields;

    auto neighbors = resolveNeighbors(ring, ring[index]).value();
    KeyExchange exchange(*endpoints[index], layout, ring[index], neighbors);
    auto keys = exchange.loadKeys();
    Expect(keys.isSuccess() && keys.value().ready(), "keys are complete");

    auto masked = SecureSumModule::maskRecord(record, keys.value());
    Expect(masked.isSuccess(), "masking succeeds");

    SecureSumModule module(*endpoints[index], layout, ring[index]);
    Expect(module.publish(masked.value(), ring).isSuccess(), "publish succeeds");
    Expect(module.isPublished(), "record visible after publishing");
  }
};

void TestPendingUntilEveryRecordIsVisible() {
  PublishingRing fx;
  SumComputation aggregator(*fx.endpoints[0], fx.layout, AggregationMode::Sum);

  auto nothing = aggregator.aggregate(fx.ring);
  Expect(nothing.isSuccess() && !nothing.value().has_value(), "pending with no records");

  fx.publish(0, {{"view_time", 10}});
  fx.publish(1, {{"view_time", 15}});
  auto partial = aggregator.aggregate(fx.ring);
  Expect(partial.isSuccess(), "a missing record is not an error");
  Expect(!partial.value().has_value(), "pending while carol has not published");

  fx.publish(2, {{"view_time", 12}});
  auto complete = aggregator.aggregate(fx.ring);
  Expect(complete.isSuccess() && complete.value().has_value(), "all records visible");
  Expect(complete.value()->sums.at("view_time") == 37, "10 + 15 + 12 == 37");
  Expect(complete.value()->participant_count == 3, "three contributors");
}

void TestMeanDividesByRingSize() {
  PublishingRing fx;
  fx.publish(0, {{"view_time", 10}, {"num_movies_rated", 1}});
  fx.publish(1, {{"view_time", 15}, {"num_movies_rated", 2}});
  fx.publish(2, {{"view_time", 12}, {"num_movies_rated", 3}});

  SumComputation aggregator(*fx.endpoints[1], fx.layout, AggregationMode::Mean);
  auto result = aggregator.aggregate(fx.ring);
  Expect(result.isSuccess() && result.value().has_value(), "aggregate computed");

  const AggregateResult& aggregate = *result.value();
  Expect(std::fabs(aggregate.mean("view_time") - 37.0 / 3.0) < 1e-9, "mean of 37 over 3");
  Expect(std::fabs(aggregate.mean("num_movies_rated") - 2.0) < 1e-9, "mean of 6 over 3");
}

void TestEveryMemberComputesTheSameAggregate() {
  PublishingRing fx;
  fx.publish(0, {{"view_time", -4}, {"num_movies_watched", 7}});
  fx.publish(1, {{"view_time", 0}, {"num_movies_watched", 8}});
  fx.publish(2, {{"view_time", 20}, {"num_movies_watched", 9}});

  for (size_t i = 0; i < fx.ring.size(); ++i) {
    SumComputation aggregator(*fx.endpoints[i], fx.layout, AggregationMode::Sum);
    auto result = aggregator.aggregate(fx.ring);
    Expect(result.isSuccess() && result.value().has_value(), "aggregate computed");
    Expect(result.value()->sums.at("view_time") == 16, "negative values cancel correctly");
    Expect(result.value()->sums.at("num_movies_watched") == 24, "second field");
  }
}

void TestPersistKeepsResultPrivate() {
  PublishingRing fx;
  fx.publish(0, {{"view_time", 10}});
  fx.publish(1, {{"view_time", 15}});
  fx.publish(2, {{"view_time", 12}});

  SumComputation aggregator(*fx.endpoints[0], fx.layout, AggregationMode::Mean);
  auto result = aggregator.aggregate(fx.ring);
  Expect(result.isSuccess() && result.value().has_value(), "aggregate computed");
  Expect(!aggregator.isPersisted("alice"), "not persisted yet");
  Expect(aggregator.persist("alice", *result.value()).isSuccess(), "persist succeeds");
  Expect(aggregator.isPersisted("alice"), "persisted");

  auto body = fx.storage->peek(fx.layout.aggregateResult("alice"));
  Expect(body.has_value(), "aggregate written");
  auto j = nlohmann::json::parse(*body);
  Expect(std::fabs(j["view_time"].get<double>() - 37.0 / 3.0) < 1e-9,
         "mean mode writes the mean");

  Expect(!fx.storage->canRead("bob", fx.layout.aggregateResult("alice")),
         "bob cannot read alice's aggregate");
  Expect(!fx.storage->canRead("carol", fx.layout.aggregateResult("alice")),
         "carol cannot read alice's aggregate");
}

void TestSumModeWritesTotals() {
  MaskedRecord a;
  a.fields = {{"view_time", 10}};
  MaskedRecord b;
  b.fields = {{"view_time", 15}};
  MaskedRecord c;
  c.fields = {{"view_time", 12}};

  auto result = SumComputation::aggregateRecords({a, b, c}, AggregationMode::Sum);
  Expect(result.isSuccess(), "records aggregate");
  nlohmann::json j = result.value();
  Expect(j["view_time"].get<int64_t>() == 37, "sum mode writes the total");
}

void TestFieldMismatchIsRejected() {
  MaskedRecord a;
  a.fields = {{"view_time", 1}, {"num_movies_rated", 2}};
  MaskedRecord missing_field;
  missing_field.fields = {{"view_time", 1}};
  MaskedRecord renamed_field;
  renamed_field.fields = {{"view_time", 1}, {"num_movies_watched", 2}};

  Expect(SumComputation::aggregateRecords({a, missing_field}, AggregationMode::Sum).error() ==
             ErrorCode::ProtocolFieldMismatch,
         "missing field is a mismatch");
  Expect(SumComputation::aggregateRecords({a, renamed_field}, AggregationMode::Sum).error() ==
             ErrorCode::ProtocolFieldMismatch,
         "different field is a mismatch");
}

void TestSumOverflowIsReported() {
  MaskedRecord big;
  big.fields = {{"view_time", INT64_MAX - 5}};
  MaskedRecord more;
  more.fields = {{"view_time", 10}};

  Expect(SumComputation::aggregateRecords({big, more}, AggregationMode::Sum).error() ==
             ErrorCode::ProtocolMalformedArtifact,
         "an overflowing sum is an error, not a wrapped total");
}

void TestOutOfRangePrivateValueIsNotMasked() {
  PrivateRecord record;
  record.fields = {{"view_time", INT64_MAX}};

  MaskingKeys keys;
  keys.first_key = 1;
  keys.second_key = 2;
  Expect(SecureSumModule::maskRecord(record, keys).error() ==
             ErrorCode::ProtocolMalformedArtifact,
         "INT64_MAX is refused before masking");

  record.fields = {{"view_time", kMaxFieldMagnitude}};
  auto masked = SecureSumModule::maskRecord(record, keys);
  Expect(masked.isSuccess(), "the bound itself is accepted");
  Expect(fieldsWithin(masked.value().fields, kMaxMaskedMagnitude),
         "masked value stays within the masked bound");
}

void TestMalformedMaskedRecordIsReported() {
  PublishingRing fx;
  fx.publish(0, {{"view_time", 10}});
  fx.publish(1, {{"view_time", 15}});

  Expect(fx.endpoints[2]->setPermissions(fx.layout.publicAppDir("carol"), fx.ring, {"carol"})
             .isSuccess(),
         "open carol's public directory");
  Expect(fx.endpoints[2]->writeText(fx.layout.maskedRecord("carol"), "{not json").isSuccess(),
         "write a corrupt record");

  SumComputation aggregator(*fx.endpoints[0], fx.layout, AggregationMode::Sum);
  Expect(aggregator.aggregate(fx.ring).error() == ErrorCode::ProtocolMalformedArtifact,
         "corrupt record is an error, not pending");
}

void TestMaskedRecordParsing() {
  auto numeric = parseMaskedRecord(R"({"view_time": -123456789012})");
  Expect(numeric.has_value() && numeric->fields.at("view_time") == -123456789012LL,
         "integers outside 32 bits");

  auto stringly = parseMaskedRecord(R"({"view_time": "987654321098"})");
  Expect(stringly.has_value() && stringly->fields.at("view_time") == 987654321098LL,
         "decimal strings are accepted");

  Expect(!parseMaskedRecord(R"({"view_time": "ten"})").has_value(), "non-numeric string");
  Expect(!parseMaskedRecord(R"({"view_time": 1.5})").has_value(), "fractional value");
  Expect(!parseMaskedRecord("[]").has_value(), "not an object");

  Expect(!parseMaskedRecord(R"({"view_time": 9223372036854775807})").has_value(),
         "masked value beyond any mask headroom");
  Expect(!parseMaskedRecord(R"({"view_time": 18446744073709551615})").has_value(),
         "unsigned values above INT64_MAX are not wrapped");
  Expect(!parseMaskedRecord(R"({"view_time": "9223372036854775807"})").has_value(),
         "string-encoded values are bounded too");
  Expect(!parseMaskedRecord(R"({"view_time": "99999999999999999999"})").has_value(),
         "string beyond int64_t");
  Expect(!parseMaskedRecord(R"({"view_time": "12abc"})").has_value(),
         "trailing characters after the number");
}

}  // namespace

int main() {
  try {
    TestPendingUntilEveryRecordIsVisible();
    TestMeanDividesByRingSize();
    TestEveryMemberComputesTheSameAggregate();
    TestPersistKeepsResultPrivate();
    TestSumModeWritesTotals();
    TestFieldMismatchIsRejected();
    TestSumOverflowIsReported();
    TestOutOfRangePrivateValueIsNotMasked();
    TestMalformedMaskedRecordIsReported();
    TestMaskedRecordParsing();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Aggregation tests passed" << '\n';
  return 0;
}
