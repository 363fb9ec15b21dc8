#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/model/status.hpp"
#include "internal/notify/change_notifier.hpp"

namespace permit::core {

/*
  Derived Status/ErrorCode of one request.

  Update() runs in the same critical section that writes statusCode, so a
  reader never sees a code paired with a stale status. The derived field
  names are held until the statusCode deriver publishes them into the
  batch, ahead of every observer. Not thread-safe; the owner locks.
*/
class StatusView {
 public:
  explicit StatusView(std::shared_ptr<const model::ErrorTaxonomy> taxonomy);

  // Re-decodes status_code and remembers which derived fields changed.
  void Update(std::optional<std::int32_t> status_code);

  // Adds the remembered derived fields to event and forgets them.
  void Publish(notify::ChangeEvent& event);

  const model::DecodedStatus& Current() const {
    return current_;
  }

 private:
  std::shared_ptr<const model::ErrorTaxonomy> taxonomy_;
  model::DecodedStatus                        current_;
  std::vector<std::string_view>               unpublished_;
};

} // namespace permit::core
