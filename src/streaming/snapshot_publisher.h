#pragma once

/// @file snapshot_publisher.h
/// @brief Single-writer, multi-reader publication of chroma snapshots.

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "streaming/chroma_snapshot.h"

namespace cadenza {

/// @brief Holds the latest ChromaSnapshot and notifies observers.
/// @details The writer builds a complete snapshot and hands it to publish(),
/// which swaps it in as one immutable object. Readers on any thread call
/// latest() and keep the returned pointer as long as they like.
///
/// Observers are invoked on the publishing thread, after the swap, in
/// subscription order. Changes to the observer list made during a publish
/// take effect from the next publish.
class SnapshotPublisher {
 public:
  using SnapshotPtr = std::shared_ptr<const ChromaSnapshot>;
  using Callback = std::function<void(const ChromaSnapshot&)>;
  using SubscriptionId = int;

  /// @brief Starts with a default (Stopped, all-zero) snapshot.
  SnapshotPublisher();

  // Non-copyable, non-movable (observers capture its address)
  SnapshotPublisher(const SnapshotPublisher&) = delete;
  SnapshotPublisher& operator=(const SnapshotPublisher&) = delete;

  /// @brief Replaces the latest snapshot and notifies observers.
  void publish(const ChromaSnapshot& snapshot);

  /// @brief Returns the most recently published snapshot.
  SnapshotPtr latest() const;

  /// @brief Registers an observer.
  /// @param callback Called with every published snapshot
  /// @return Id for unsubscribe()
  /// @throws CadenzaException(InvalidParameter) if callback is empty
  SubscriptionId subscribe(Callback callback);

  /// @brief Removes an observer.
  /// @return false if the id was not registered
  bool unsubscribe(SubscriptionId id);

  /// @brief Returns number of registered observers.
  size_t subscriber_count() const;

 private:
  mutable std::mutex snapshot_mutex_;
  SnapshotPtr latest_;

  mutable std::mutex subscriber_mutex_;
  std::vector<std::pair<SubscriptionId, Callback>> subscribers_;
  SubscriptionId next_id_ = 1;
};

}  // namespace cadenza
