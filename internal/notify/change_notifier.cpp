#include "internal/notify/change_notifier.hpp"

#include <algorithm>
#include <utility>

namespace permit::notify {

bool ChangeEvent::Contains(std::string_view field) const {
  return std::find(fields.begin(), fields.end(), field) != fields.end();
}

void ChangeEvent::Add(std::string_view field) {
  if (!Contains(field)) fields.emplace_back(field);
}

bool ChangeNotifier::Matches(const std::string& field, const ChangeEvent& event) {
  return field.empty() || event.Contains(field);
}

SubscriptionToken ChangeNotifier::AddDeriver(std::string field, Deriver deriver) {
  std::lock_guard lock(mutex_);
  const auto token = next_token_++;
  derivers_.push_back({token, std::move(field), std::move(deriver)});
  return token;
}

SubscriptionToken ChangeNotifier::Subscribe(std::string field, Observer observer) {
  std::lock_guard lock(mutex_);
  const auto token = next_token_++;
  observers_.push_back({token, std::move(field), std::move(observer)});
  return token;
}

SubscriptionToken ChangeNotifier::SubscribeAll(Observer observer) {
  return Subscribe(std::string(), std::move(observer));
}

bool ChangeNotifier::Unsubscribe(SubscriptionToken token) {
  std::lock_guard lock(mutex_);

  auto by_token = [token](const auto& entry) { return entry.token == token; };

  if (auto it = std::find_if(observers_.begin(), observers_.end(), by_token); it != observers_.end()) {
    observers_.erase(it);
    removed_during_dispatch_.push_back(token);
    return true;
  }
  if (auto it = std::find_if(derivers_.begin(), derivers_.end(), by_token); it != derivers_.end()) {
    derivers_.erase(it);
    return true;
  }
  return false;
}

void ChangeNotifier::Notify(ChangeEvent event) {
  if (event.fields.empty()) return;

  std::vector<Entry<Deriver>>  derivers;
  std::vector<Entry<Observer>> observers;
  {
    std::lock_guard lock(mutex_);
    derivers  = derivers_;
    observers = observers_;
    removed_during_dispatch_.clear();
  }

  for (auto& entry : derivers) {
    if (Matches(entry.field, event)) entry.callback(event);
  }

  for (auto& entry : observers) {
    if (!Matches(entry.field, event)) continue;

    {
      // An earlier observer in this batch may have unsubscribed this one.
      std::lock_guard lock(mutex_);
      const auto& removed = removed_during_dispatch_;
      if (std::find(removed.begin(), removed.end(), entry.token) != removed.end()) continue;
    }
    entry.callback(event);
  }
}

std::size_t ChangeNotifier::ObserverCount() const {
  std::lock_guard lock(mutex_);
  return observers_.size();
}

} // namespace permit::notify
