#include "internal/core/status_view.hpp"

#include <algorithm>
#include <utility>

#include "internal/model/permission_change.hpp"

namespace permit::core {

StatusView::StatusView(std::shared_ptr<const model::ErrorTaxonomy> taxonomy) : taxonomy_(std::move(taxonomy)) {
}

void StatusView::Update(std::optional<std::int32_t> status_code) {
  const auto next = model::Decode(status_code, *taxonomy_);

  auto remember = [this](std::string_view field) {
    if (std::find(unpublished_.begin(), unpublished_.end(), field) == unpublished_.end()) unpublished_.push_back(field);
  };
  if (next.status != current_.status) remember(model::fields::kStatus);
  if (next.error != current_.error) remember(model::fields::kErrorCode);

  current_ = next;
}

void StatusView::Publish(notify::ChangeEvent& event) {
  for (auto field : unpublished_) event.Add(field);
  unpublished_.clear();
}

} // namespace permit::core
