#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/model/permission_change.hpp"
#include "internal/model/status.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using permit::model::MergeDirective;
using permit::model::PermissionChange;
using permit::model::PermissionSet;
using permit::model::TargetMode;
using permit::util::MalformedRequest;

template <typename Fn>
bool ThrowsMalformed(Fn&& fn) {
  try {
    fn();
  } catch (const MalformedRequest&) {
    return true;
  }
  return false;
}

void TestCreateForUserScenario() {
  auto change = permit::model::CreateForUser("alice", "/shared/calendar", MergeDirective::kGrant);

  assert(change.user_id == "alice");
  assert(change.realm_url == "/shared/calendar");
  assert(change.Mode() == TargetMode::kUser);
  assert(!change.metadata_key.has_value());
  assert(!change.metadata_value.has_value());
  assert(change.may_read == MergeDirective::kGrant);
  assert(change.may_write == MergeDirective::kUnspecified);
  assert(change.may_manage == MergeDirective::kUnspecified);
  assert(!change.status_code.has_value());
  assert(!change.status_message.has_value());
  assert(!change.IsProcessed());
  assert(change.created_at == change.updated_at);
  assert(permit::util::IsCanonical(change.id));

  const auto decoded = permit::model::Decode(change.status_code);
  assert(decoded.status == permit::model::ProcessingStatus::kNotProcessed);
  assert(!decoded.error.has_value());
}

void TestCreateForMetadataClearsUser() {
  auto change = permit::model::CreateForMetadata("team", "blue", "*", MergeDirective::kGrant, MergeDirective::kGrant);

  assert(change.Mode() == TargetMode::kMetadata);
  assert(change.user_id.empty());
  assert(change.metadata_key == std::string("team"));
  assert(change.metadata_value == std::string("blue"));
  assert(change.realm_url == permit::model::kAllRealms);
  assert(change.may_manage == MergeDirective::kUnspecified);
}

void TestWildcardsAreAccepted() {
  auto change = permit::model::CreateForUser(std::string(permit::model::kAllUsers), std::string(permit::model::kAllRealms),
                                             MergeDirective::kUnspecified, MergeDirective::kUnspecified, MergeDirective::kRevoke);
  assert(change.user_id == "*");
  assert(change.realm_url == "*");
}

void TestExactlyOneTargetingMode() {
  assert(ThrowsMalformed([] { (void)permit::model::CreateForUser("", "/r"); }));
  assert(ThrowsMalformed([] { (void)permit::model::CreateForMetadata("", "v", "/r"); }));
  assert(ThrowsMalformed([] { (void)permit::model::CreateForMetadata("k", "", "/r"); }));

  auto both           = permit::model::CreateForUser("bob", "/r");
  both.metadata_key   = "k";
  both.metadata_value = "v";
  assert(ThrowsMalformed([&] { permit::model::Validate(both); }));

  auto neither    = permit::model::CreateForUser("bob", "/r");
  neither.user_id = "";
  assert(ThrowsMalformed([&] { permit::model::Validate(neither); }));

  auto half = permit::model::CreateForMetadata("k", "v", "/r");
  half.metadata_value.reset();
  assert(ThrowsMalformed([&] { permit::model::Validate(half); }));
}

void TestRealmAndIdAreRequired() {
  assert(ThrowsMalformed([] { (void)permit::model::CreateForUser("bob", ""); }));

  auto change = permit::model::CreateForUser("bob", "/r");
  change.id   = "not-a-uuid";
  assert(ThrowsMalformed([&] { permit::model::Validate(change); }));

  change.id = permit::util::NewId();
  permit::model::Validate(change);
  assert(permit::util::ToString(permit::util::FromString(change.id)) == change.id);
}

void TestIdsAreDistinct() {
  constexpr int         kCount = 1000;
  std::set<std::string> ids;
  for (int i = 0; i < kCount; ++i) {
    ids.insert(permit::model::CreateForUser("u" + std::to_string(i), "/r").id);
  }
  assert(ids.size() == static_cast<size_t>(kCount));
}

void TestUnspecifiedIsNotRevoke() {
  auto change = permit::model::CreateForUser("carol", "/r", MergeDirective::kGrant, MergeDirective::kUnspecified, MergeDirective::kRevoke);
  assert(change.may_write == MergeDirective::kUnspecified);
  assert(change.may_write != MergeDirective::kRevoke);
  assert(!permit::model::ToOptional(change.may_write).has_value());
  assert(permit::model::ToOptional(change.may_manage) == std::optional<bool>(false));
}

void TestMergeInto() {
  auto change = permit::model::CreateForUser("dave", "/r", MergeDirective::kGrant, MergeDirective::kUnspecified, MergeDirective::kRevoke);

  const PermissionSet existing{.may_read = false, .may_write = true, .may_manage = true};
  const auto          merged = permit::model::MergeInto(existing, change);
  assert(merged.may_read);
  assert(merged.may_write);
  assert(!merged.may_manage);

  // Unspecified materializes the default for a user with no prior permission.
  const auto fresh = permit::model::MergeInto(PermissionSet{}, change);
  assert((fresh == PermissionSet{.may_read = true, .may_write = false, .may_manage = false}));
}

void TestDirectiveNames() {
  assert(permit::model::ParseMergeDirective("grant") == MergeDirective::kGrant);
  assert(permit::model::ParseMergeDirective("false") == MergeDirective::kRevoke);
  assert(permit::model::ParseMergeDirective("unspecified") == MergeDirective::kUnspecified);
  assert(!permit::model::ParseMergeDirective("maybe").has_value());
  assert(permit::model::ToString(MergeDirective::kRevoke) == "revoke");
  assert(permit::model::FromOptional(std::nullopt) == MergeDirective::kUnspecified);
  assert(permit::model::FromOptional(true) == MergeDirective::kGrant);
}

} // namespace

int main() {
  TestCreateForUserScenario();
  TestCreateForMetadataClearsUser();
  TestWildcardsAreAccepted();
  TestExactlyOneTargetingMode();
  TestRealmAndIdAreRequired();
  TestIdsAreDistinct();
  TestUnspecifiedIsNotRevoke();
  TestMergeInto();
  TestDirectiveNames();

  std::cout << "permit_unit_permission_change: pass\n";
  return 0;
}
