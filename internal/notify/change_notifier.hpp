#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace permit::notify {

/*
  One mutation batch on one object: which persisted (and, after derivers
  ran, derived) fields changed.
*/
struct ChangeEvent {
  std::string              object_id;
  std::vector<std::string> fields;

  bool Contains(std::string_view field) const;

  // Appends field unless already present.
  void Add(std::string_view field);
};

using SubscriptionToken = std::uint64_t;

/*
  Explicit observer contract for field changes.

  Dispatch order for a batch:
    1. derivers, in registration order, each only if its key field is in the
       batch. A deriver recomputes derived state and may Add() derived names.
    2. observers, in registration order, each at most once per batch, if the
       batch contains its key (or the observer listens to every field).

  Callbacks run on the notifying thread, outside the notifier lock.
*/
class ChangeNotifier {
 public:
  using Deriver  = std::function<void(ChangeEvent&)>;
  using Observer = std::function<void(const ChangeEvent&)>;

  // Empty field name = every field.
  SubscriptionToken AddDeriver(std::string field, Deriver deriver);
  SubscriptionToken Subscribe(std::string field, Observer observer);
  SubscriptionToken SubscribeAll(Observer observer);

  // Returns false for an unknown or already removed token.
  bool Unsubscribe(SubscriptionToken token);

  void Notify(ChangeEvent event);

  std::size_t ObserverCount() const;

 private:
  template <typename Callback>
  struct Entry {
    SubscriptionToken token = 0;
    std::string       field;
    Callback          callback;
  };

  static bool Matches(const std::string& field, const ChangeEvent& event);

  mutable std::mutex           mutex_;
  SubscriptionToken            next_token_ = 1;
  std::vector<Entry<Deriver>>  derivers_;
  std::vector<Entry<Observer>> observers_;
  std::vector<SubscriptionToken> removed_during_dispatch_;
};

} // namespace permit::notify
