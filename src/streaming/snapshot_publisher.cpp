/// @file snapshot_publisher.cpp
/// @brief Implementation of SnapshotPublisher.

#include "streaming/snapshot_publisher.h"

#include <algorithm>

#include "util/exception.h"

namespace cadenza {

SnapshotPublisher::SnapshotPublisher() : latest_(std::make_shared<const ChromaSnapshot>()) {}

void SnapshotPublisher::publish(const ChromaSnapshot& snapshot) {
  SnapshotPtr next = std::make_shared<const ChromaSnapshot>(snapshot);
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    latest_.swap(next);
  }

  /// Copy the list so observers run without holding the lock
  std::vector<std::pair<SubscriptionId, Callback>> subscribers;
  {
    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    subscribers = subscribers_;
  }
  for (const auto& entry : subscribers) {
    entry.second(snapshot);
  }
}

SnapshotPublisher::SnapshotPtr SnapshotPublisher::latest() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return latest_;
}

SnapshotPublisher::SubscriptionId SnapshotPublisher::subscribe(Callback callback) {
  CADENZA_CHECK_MSG(static_cast<bool>(callback), ErrorCode::InvalidParameter,
                    "Observer callback must not be empty");
  std::lock_guard<std::mutex> lock(subscriber_mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

bool SnapshotPublisher::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(subscriber_mutex_);
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const auto& entry) { return entry.first == id; });
  if (it == subscribers_.end()) {
    return false;
  }
  subscribers_.erase(it);
  return true;
}

size_t SnapshotPublisher::subscriber_count() const {
  std::lock_guard<std::mutex> lock(subscriber_mutex_);
  return subscribers_.size();
}

}  // namespace cadenza
