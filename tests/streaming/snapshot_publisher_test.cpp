/// @file snapshot_publisher_test.cpp
/// @brief Tests for SnapshotPublisher.

#include "streaming/snapshot_publisher.h"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <thread>
#include <vector>

#include "util/exception.h"

using namespace cadenza;

namespace {

/// @brief Snapshot whose chroma holds one value in every class.
ChromaSnapshot uniform_snapshot(int index, float value) {
  ChromaSnapshot snapshot;
  snapshot.frame_index = index;
  snapshot.loudness = value;
  snapshot.raw_loudness = value;
  snapshot.chroma.fill(value);
  snapshot.active = true;
  snapshot.activity = ActivityLevel::Listening;
  return snapshot;
}

}  // namespace

TEST_CASE("SnapshotPublisher initial state", "[streaming][publisher]") {
  SnapshotPublisher publisher;
  auto latest = publisher.latest();

  REQUIRE(latest != nullptr);
  REQUIRE(latest->frame_index == -1);
  REQUIRE(latest->activity == ActivityLevel::Stopped);
  REQUIRE_FALSE(latest->active);
  for (float v : latest->chroma) {
    REQUIRE(v == 0.0f);
  }
  REQUIRE(publisher.subscriber_count() == 0);
}

TEST_CASE("SnapshotPublisher publish", "[streaming][publisher]") {
  SnapshotPublisher publisher;
  auto before = publisher.latest();

  publisher.publish(uniform_snapshot(0, 0.5f));
  auto after = publisher.latest();

  REQUIRE(after->frame_index == 0);
  REQUIRE(after->chroma[3] == 0.5f);

  SECTION("held pointers are not modified by later publishes") {
    publisher.publish(uniform_snapshot(1, 0.25f));
    REQUIRE(before->frame_index == -1);
    REQUIRE(after->frame_index == 0);
    REQUIRE(after->chroma[3] == 0.5f);
    REQUIRE(publisher.latest()->frame_index == 1);
  }
}

TEST_CASE("SnapshotPublisher observers", "[streaming][publisher]") {
  SnapshotPublisher publisher;
  std::vector<int> order;

  auto first = publisher.subscribe([&](const ChromaSnapshot& s) { order.push_back(s.frame_index); });
  auto second =
      publisher.subscribe([&](const ChromaSnapshot& s) { order.push_back(100 + s.frame_index); });
  REQUIRE(first != second);
  REQUIRE(publisher.subscriber_count() == 2);

  publisher.publish(uniform_snapshot(7, 0.1f));
  REQUIRE(order == std::vector<int>{7, 107});

  SECTION("unsubscribe") {
    REQUIRE(publisher.unsubscribe(first));
    REQUIRE_FALSE(publisher.unsubscribe(first));
    publisher.publish(uniform_snapshot(8, 0.1f));
    REQUIRE(order == std::vector<int>{7, 107, 108});
  }

  SECTION("observer sees the published snapshot as latest") {
    int seen = -2;
    publisher.subscribe([&](const ChromaSnapshot&) { seen = publisher.latest()->frame_index; });
    publisher.publish(uniform_snapshot(9, 0.1f));
    REQUIRE(seen == 9);
  }

  SECTION("subscribing from an observer takes effect next publish") {
    int late_calls = 0;
    bool added = false;
    publisher.subscribe([&](const ChromaSnapshot&) {
      if (!added) {
        added = true;
        publisher.subscribe([&](const ChromaSnapshot&) { ++late_calls; });
      }
    });
    publisher.publish(uniform_snapshot(10, 0.1f));
    REQUIRE(late_calls == 0);
    publisher.publish(uniform_snapshot(11, 0.1f));
    REQUIRE(late_calls == 1);
  }
}

TEST_CASE("SnapshotPublisher rejects empty callback", "[streaming][publisher]") {
  SnapshotPublisher publisher;
  REQUIRE_THROWS_AS(publisher.subscribe(SnapshotPublisher::Callback()), CadenzaException);
}

TEST_CASE("SnapshotPublisher concurrent readers see whole snapshots", "[streaming][publisher]") {
  SnapshotPublisher publisher;
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&] {
      while (!done.load()) {
        auto s = publisher.latest();
        // Every published snapshot has a uniform chroma equal to its loudness
        for (float v : s->chroma) {
          if (v != s->loudness) ++torn;
        }
      }
    });
  }

  for (int i = 0; i < 5000; ++i) {
    publisher.publish(uniform_snapshot(i, static_cast<float>(i % 100) / 100.0f));
  }
  done = true;
  for (auto& reader : readers) {
    reader.join();
  }

  REQUIRE(torn.load() == 0);
  REQUIRE(publisher.latest()->frame_index == 4999);
}
