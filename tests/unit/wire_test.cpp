#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/model/permission_change.hpp"
#include "internal/transport/loopback_transport.hpp"
#include "internal/transport/wire.hpp"
#include "internal/util/errors.hpp"

namespace {

using permit::model::MergeDirective;
using permit::transport::LoopbackTransport;
using permit::transport::StatusUpdate;

void TestDirectivesSurviveTheWire() {
  auto change = permit::model::CreateForUser("alice", "/shared/calendar", MergeDirective::kGrant, MergeDirective::kUnspecified,
                                             MergeDirective::kRevoke);

  auto message = permit::transport::ToProto(change);
  assert(message.has_user());
  assert(message.may_read() == permit::v1::MERGE_DIRECTIVE_GRANT);
  assert(message.may_write() == permit::v1::MERGE_DIRECTIVE_UNSPECIFIED);
  assert(message.may_manage() == permit::v1::MERGE_DIRECTIVE_REVOKE);

  std::string bytes;
  assert(message.SerializeToString(&bytes));
  permit::v1::PermissionChange parsed;
  assert(parsed.ParseFromString(bytes));

  auto decoded = permit::transport::FromProto(parsed);
  assert(decoded.id == change.id);
  assert(decoded.user_id == "alice");
  assert(decoded.realm_url == "/shared/calendar");
  assert(decoded.may_write == MergeDirective::kUnspecified);
  assert(decoded.may_manage == MergeDirective::kRevoke);
  assert(decoded.created_at == change.created_at);
  assert(!decoded.status_code.has_value());
}

void TestMetadataTarget() {
  auto change  = permit::model::CreateForMetadata("team", "blue", "/r");
  auto message = permit::transport::ToProto(change);
  assert(message.has_metadata());
  assert(!message.has_user());

  auto decoded = permit::transport::FromProto(message);
  assert(decoded.Mode() == permit::model::TargetMode::kMetadata);
  assert(decoded.user_id.empty());
  assert(decoded.metadata_value == std::string("blue"));
}

void TestMissingTargetIsMalformed() {
  auto message = permit::transport::ToProto(permit::model::CreateForUser("bob", "/r"));
  message.clear_user();

  bool threw = false;
  try {
    (void)permit::transport::FromProto(message);
  } catch (const permit::util::MalformedRequest&) {
    threw = true;
  }
  assert(threw);
}

void TestLoopbackQueuesSubmittedRequests() {
  LoopbackTransport transport;
  auto              change = permit::model::CreateForUser("carol", "/r");

  transport.Submit(permit::transport::ToProto(change));
  assert(transport.Pending() == 1);
  assert(transport.SubmittedCount() == 1);

  auto head = transport.Peek();
  assert(head.has_value());
  assert(head->id() == change.id);

  assert(transport.Drain() == 1);
  assert(transport.Pending() == 0);
  assert(!transport.Peek().has_value());
  assert(transport.SubmittedCount() == 1);
}

void TestLoopbackEvaluatesAndDelivers() {
  LoopbackTransport transport([](const permit::v1::PermissionChange& request) {
    return StatusUpdate{request.id(), request.user().user_id() == "mallory" ? 614 : 0, "evaluated"};
  });

  std::vector<StatusUpdate> received;
  transport.SetUpdateHandler([&](const StatusUpdate& update) { received.push_back(update); });

  auto ok     = permit::model::CreateForUser("carol", "/r");
  auto denied = permit::model::CreateForUser("mallory", "/r");
  transport.Submit(permit::transport::ToProto(ok));
  transport.Submit(permit::transport::ToProto(denied));

  assert(transport.DeliverAll() == 2);
  assert(transport.Pending() == 0);
  assert(received.size() == 2);
  assert(received[0].id == ok.id && received[0].status_code == 0);
  assert(received[1].id == denied.id && received[1].status_code == 614);
  assert(received[1].status_message == "evaluated");

  transport.Deliver({"some-id", 619, "late"});
  assert(received.size() == 3);
  assert(received[2].status_code == 619);
}

void TestDeliverAllWithoutEvaluatorKeepsQueue() {
  LoopbackTransport transport;
  transport.Submit(permit::transport::ToProto(permit::model::CreateForUser("dave", "/r")));

  bool threw = false;
  try {
    transport.DeliverAll();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(transport.Pending() == 1);
}

} // namespace

int main() {
  TestDirectivesSurviveTheWire();
  TestMetadataTarget();
  TestMissingTargetIsMalformed();
  TestLoopbackQueuesSubmittedRequests();
  TestLoopbackEvaluatesAndDelivers();
  TestDeliverAllWithoutEvaluatorKeepsQueue();

  std::cout << "permit_unit_wire: pass\n";
  return 0;
}
