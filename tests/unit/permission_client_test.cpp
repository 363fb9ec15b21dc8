#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/permission_client.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/transport/loopback_transport.hpp"
#include "internal/util/errors.hpp"

namespace {

using permit::core::ApplyOutcome;
using permit::core::ClientOptions;
using permit::core::PermissionClient;
using permit::db::Repository;
using permit::db::StatusFilter;
using permit::model::ErrorKind;
using permit::model::MergeDirective;
using permit::model::ProcessingStatus;
using permit::notify::ChangeEvent;
using permit::transport::LoopbackTransport;
using permit::transport::StatusUpdate;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  std::function<void()>                        cleanup;
};

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name            = "memory",
      .make_repository = []() { return std::make_shared<permit::db::memory::MemoryRepository>(); },
      .cleanup         = []() {},
  };
}

// Every fixture gets its own store file; cleanup removes them all.
BackendFactory MakeSqliteFactory() {
  auto paths = std::make_shared<std::vector<std::string>>();
  auto stamp = std::to_string(NowMs());

  return BackendFactory{
      .name            = "sqlite",
      .make_repository = [paths, stamp]() -> std::shared_ptr<Repository> {
        auto path = (std::filesystem::temp_directory_path() /
                     ("permit_unit_client_" + stamp + "_" + std::to_string(paths->size()) + ".db"))
                        .string();
        paths->push_back(path);
        auto db = std::make_shared<permit::db::sqlite::SqliteDB>(path);
        permit::db::sql::RunMigrations(*db, permit::db::sql::PermissionChangeSchema());
        return std::make_shared<permit::db::sqlite::SqliteRepository>(std::move(db));
      },
      .cleanup = [paths]() {
        for (const auto& path : *paths) {
          std::filesystem::remove(path);
          std::filesystem::remove(path + "-wal");
          std::filesystem::remove(path + "-shm");
        }
        paths->clear();
      },
  };
}

struct Fixture {
  explicit Fixture(const BackendFactory& backend) : repository(backend.make_repository()) {
  }

  std::shared_ptr<Repository>                         repository;
  std::shared_ptr<LoopbackTransport>                  transport = std::make_shared<LoopbackTransport>();
  std::shared_ptr<const permit::model::ErrorTaxonomy> taxonomy =
      std::make_shared<permit::model::ErrorTaxonomy>(permit::model::ErrorTaxonomy::Builtin());

  std::unique_ptr<PermissionClient> MakeClient(ClientOptions options = {}) {
    return std::make_unique<PermissionClient>(repository, transport, taxonomy, options);
  }

  std::unique_ptr<PermissionClient> MakeClient(std::shared_ptr<permit::transport::Transport> other) {
    return std::make_unique<PermissionClient>(repository, std::move(other), taxonomy);
  }

  std::optional<permit::model::PermissionChange> Stored(const std::string& id) {
    auto tx     = repository->Begin();
    auto record = repository->GetPermissionChange(*tx, id);
    tx->Rollback();
    return record;
  }
};

void TestCreatePersistsAndSubmits(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client = f.MakeClient();

  auto tracked = client->CreateForUser("alice", "/shared/calendar", MergeDirective::kGrant);
  assert(tracked->Status() == ProcessingStatus::kNotProcessed);
  assert(!tracked->StatusCode().has_value());
  assert(!tracked->Error().has_value());

  auto stored = f.Stored(tracked->Id());
  assert(stored.has_value());
  assert(stored->user_id == "alice");
  assert(stored->may_read == MergeDirective::kGrant);
  assert(stored->may_write == MergeDirective::kUnspecified);
  assert(!stored->status_code.has_value());

  assert(f.transport->Pending() == 1);
  assert(f.transport->Peek()->id() == tracked->Id());
  assert(client->Find(tracked->Id()) == tracked);

  const auto token = tracked->SubscribeAll([](const ChangeEvent&) {});
  assert(tracked->Unsubscribe(token));
  assert(!tracked->Unsubscribe(token));
}

void TestMalformedRequestIsNeverPersisted(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client = f.MakeClient();

  bool threw = false;
  try {
    client->CreateForMetadata("team", "", "/r");
  } catch (const permit::util::MalformedRequest&) {
    threw = true;
  }
  assert(threw);
  assert(client->List().empty());
  assert(f.transport->SubmittedCount() == 0);
}

void TestSubmitRejectsDuplicatesAndProcessed(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client = f.MakeClient();

  auto change = permit::model::CreateForUser("bob", "/r");
  client->Submit(change);

  bool already_exists = false;
  try {
    client->Submit(change);
  } catch (const permit::util::AlreadyExists&) {
    already_exists = true;
  }
  assert(already_exists);

  auto processed        = permit::model::CreateForUser("bob", "/r");
  processed.status_code = 0;
  bool invalid_state    = false;
  try {
    client->Submit(processed);
  } catch (const permit::util::InvalidState&) {
    invalid_state = true;
  }
  assert(invalid_state);
  assert(client->List().size() == 1);
}

void TestSuccessStatus(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client  = f.MakeClient();
  auto    tracked = client->CreateForUser("alice", "/shared/calendar", MergeDirective::kGrant);

  f.transport->Deliver({tracked->Id(), 0, "ok"});

  assert(tracked->Status() == ProcessingStatus::kSuccess);
  assert(!tracked->Error().has_value());
  assert(tracked->StatusMessage() == std::string("ok"));
  assert(f.Stored(tracked->Id())->status_code == 0);
}

void TestUnknownCodeIsSurfaced(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client  = f.MakeClient();
  auto    tracked = client->CreateForUser("alice", "/r");

  assert(client->OnStatusUpdate({tracked->Id(), 619, "new error"}) == ApplyOutcome::kApplied);

  assert(tracked->Status() == ProcessingStatus::kError);
  auto error = tracked->Error();
  assert(error.has_value());
  assert(error->kind == ErrorKind::kUnknown);
  assert(error->raw_code == 619);
}

void TestObserversSeeConsistentStatus(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client  = f.MakeClient();
  auto    tracked = client->CreateForUser("eve", "/r");

  int calls = 0;
  tracked->Subscribe("statusCode", [&](const ChangeEvent& event) {
    ++calls;
    assert(event.object_id == tracked->Id());
    assert(event.Contains("status"));
    assert(event.Contains("errorCode"));
    assert(tracked->StatusCode() == 614);
    assert(tracked->Status() == ProcessingStatus::kError);
    assert(tracked->Error()->kind == ErrorKind::kAccessDenied);
  });

  int status_calls = 0;
  tracked->Subscribe("status", [&](const ChangeEvent&) { ++status_calls; });

  client->OnStatusUpdate({tracked->Id(), 614, "denied"});
  assert(calls == 1);
  assert(status_calls == 1);
}

void TestDuplicateUpdateIsIgnored(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client  = f.MakeClient();
  auto    tracked = client->CreateForUser("frank", "/r");

  int calls = 0;
  tracked->SubscribeAll([&](const ChangeEvent&) { ++calls; });

  assert(client->OnStatusUpdate({tracked->Id(), 617, "first"}) == ApplyOutcome::kApplied);
  assert(client->OnStatusUpdate({tracked->Id(), 617, "again"}) == ApplyOutcome::kDuplicate);

  assert(calls == 1);
  assert(tracked->Error()->kind == ErrorKind::kRealmNotFound);
  assert(tracked->StatusMessage() == std::string("first"));
  assert(f.Stored(tracked->Id())->status_message == std::string("first"));
}

void TestConflictingUpdateKeepsFirstValue(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client  = f.MakeClient();
  auto    tracked = client->CreateForUser("grace", "/r");

  assert(client->OnStatusUpdate({tracked->Id(), 0, "ok"}) == ApplyOutcome::kApplied);
  assert(client->OnStatusUpdate({tracked->Id(), 614, "denied"}) == ApplyOutcome::kConflict);

  assert(tracked->Status() == ProcessingStatus::kSuccess);
  assert(tracked->StatusCode() == 0);
  assert(f.Stored(tracked->Id())->status_code == 0);
}

void TestUpdateForUnknownRequest(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client = f.MakeClient();
  assert(client->OnStatusUpdate({"00000000-0000-4000-8000-000000000000", 0, ""}) == ApplyOutcome::kUnknownRequest);
  assert(client->TrackedCount() == 0);
}

void TestUpdatedAtIsSetOnceByDefault(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client  = f.MakeClient();
  auto    tracked = client->CreateForUser("heidi", "/r");
  const auto created = tracked->Snapshot();

  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  bool saw_updated_at = false;
  tracked->SubscribeAll([&](const ChangeEvent& event) { saw_updated_at = event.Contains("updatedAt"); });
  client->OnStatusUpdate({tracked->Id(), 0, "ok"});

  assert(!saw_updated_at);
  assert(tracked->Snapshot().updated_at == created.updated_at);
  assert(f.Stored(tracked->Id())->updated_at == created.updated_at);
}

void TestUpdatedAtRefreshPolicy(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client  = f.MakeClient({.refresh_updated_at_on_status = true});
  auto    tracked = client->CreateForUser("ivan", "/r");
  const auto created = tracked->Snapshot();

  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  bool saw_updated_at = false;
  tracked->SubscribeAll([&](const ChangeEvent& event) { saw_updated_at = event.Contains("updatedAt"); });
  client->OnStatusUpdate({tracked->Id(), 0, "ok"});

  const auto after = tracked->Snapshot();
  assert(saw_updated_at);
  assert(after.updated_at > created.updated_at);
  assert(after.created_at == created.created_at);
  assert(f.Stored(tracked->Id())->updated_at == after.updated_at);
}

void TestEndToEndWithEvaluator(const BackendFactory& backend) {
  Fixture f(backend);
  f.transport = std::make_shared<LoopbackTransport>([](const permit::v1::PermissionChange& request) {
    if (request.has_metadata()) return StatusUpdate{request.id(), 703, "not shareable"};
    return StatusUpdate{request.id(), 0, "ok"};
  });
  auto client = f.MakeClient();

  auto user = client->CreateForUser("judy", "/r", MergeDirective::kGrant);
  auto meta = client->CreateForMetadata("team", "blue", "/r", MergeDirective::kGrant);
  assert(f.transport->DeliverAll() == 2);

  assert(user->Status() == ProcessingStatus::kSuccess);
  assert(meta->Error()->kind == ErrorKind::kFileMayNotBeShared);
  assert(client->List({permit::db::StatusFilter::kPending, std::nullopt}).empty());
  assert(client->List({permit::db::StatusFilter::kProcessed, std::nullopt}).size() == 2);
}

void TestResumeResubmitsPending(const BackendFactory& backend) {
  Fixture f(backend);
  std::string pending_id;
  {
    auto client = f.MakeClient();
    pending_id  = client->CreateForUser("kate", "/r")->Id();
    auto done   = client->CreateForUser("leo", "/r");
    client->OnStatusUpdate({done->Id(), 0, "ok"});
  }
  f.transport->Drain();

  auto client = f.MakeClient();
  assert(client->TrackedCount() == 0);
  assert(client->Resume() == 1);
  assert(client->TrackedCount() == 1);
  assert(f.transport->Pending() == 1);
  assert(f.transport->Peek()->id() == pending_id);

  f.transport->Deliver({pending_id, 618, "no such user"});
  assert(client->Find(pending_id)->Error()->kind == ErrorKind::kUnknownUser);
}

void TestFindLoadsProcessedRecord(const BackendFactory& backend) {
  Fixture     f(backend);
  std::string id;
  {
    auto client = f.MakeClient();
    id          = client->CreateForUser("mia", "/r")->Id();
    client->OnStatusUpdate({id, 614, "denied"});
  }

  auto client  = f.MakeClient();
  auto tracked = client->Find(id);
  assert(tracked);
  assert(tracked->Status() == ProcessingStatus::kError);
  assert(tracked->Error()->kind == ErrorKind::kAccessDenied);

  // redelivery after restart is still idempotent
  assert(client->OnStatusUpdate({id, 614, "denied"}) == ApplyOutcome::kDuplicate);
  assert(client->OnStatusUpdate({id, 0, "ok"}) == ApplyOutcome::kConflict);

  client->Forget(id);
  assert(client->TrackedCount() == 0);
  assert(!client->Find("00000000-0000-4000-8000-000000000001"));
}

// Accepts everything except requests for one user, like an authority link
// that rejects a single payload.
class RefusingTransport final : public permit::transport::Transport {
 public:
  explicit RefusingTransport(std::string refused_user) : refused_user_(std::move(refused_user)) {
  }

  void Submit(const permit::v1::PermissionChange& request) override {
    if (request.has_user() && request.user().user_id() == refused_user_) {
      throw std::runtime_error("authority rejected payload");
    }
    accepted.push_back(request.id());
  }

  void SetUpdateHandler(UpdateHandler handler) override {
    handler_ = std::move(handler);
  }

  std::vector<std::string> accepted;

 private:
  std::string   refused_user_;
  UpdateHandler handler_;
};

void TestResumeContinuesAfterTransportFailure(const BackendFactory& backend) {
  Fixture f(backend);
  {
    auto client = f.MakeClient();
    client->CreateForUser("kate", "/r");
    client->CreateForUser("nick", "/r");
    client->CreateForUser("leo", "/r");
  }

  auto refusing = std::make_shared<RefusingTransport>("nick");
  auto client   = f.MakeClient(refusing);

  assert(client->Resume() == 2);
  assert(refusing->accepted.size() == 2);
  assert(client->TrackedCount() == 3);
  assert(client->List({StatusFilter::kPending, std::nullopt}).size() == 3);
}

void TestStatusNeverLagsStatusCode(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client = f.MakeClient();

  for (int round = 0; round < 50; ++round) {
    auto tracked = client->CreateForUser("olga", "/r");

    std::atomic<bool> stop{false};
    std::atomic<int>  lagging{0};
    std::thread       reader([&] {
      do {
        const bool has_code = tracked->StatusCode().has_value();
        if (has_code && tracked->Status() == ProcessingStatus::kNotProcessed) ++lagging;
      } while (!stop);
    });

    assert(client->OnStatusUpdate({tracked->Id(), 614, "denied"}) == ApplyOutcome::kApplied);
    stop = true;
    reader.join();
    assert(lagging == 0);
  }
}

void TestConcurrentCreatesUpdatesAndLists(const BackendFactory& backend) {
  Fixture f(backend);
  auto    client = f.MakeClient();

  constexpr int kRequests = 200;

  std::mutex               ids_mutex;
  std::vector<std::string> ids;
  std::atomic<bool>        writer_done{false};
  std::atomic<int>         applied{0};

  std::mutex  error_mutex;
  int         errors = 0;
  std::string first_error;
  auto        record_error = [&](const std::exception& e) {
    std::lock_guard lock(error_mutex);
    if (errors++ == 0) first_error = e.what();
  };

  std::thread writer([&] {
    for (int i = 0; i < kRequests; ++i) {
      try {
        auto tracked = client->CreateForUser("user-" + std::to_string(i), "/concurrent");
        std::lock_guard lock(ids_mutex);
        ids.push_back(tracked->Id());
      } catch (const std::exception& e) {
        record_error(e);
      }
    }
    writer_done = true;
  });

  std::thread updater([&] {
    std::size_t next = 0;
    for (;;) {
      const bool  done = writer_done;
      std::string id;
      {
        std::lock_guard lock(ids_mutex);
        if (next < ids.size()) id = ids[next++];
      }
      if (id.empty()) {
        if (done) break;
        std::this_thread::yield();
        continue;
      }
      try {
        if (client->OnStatusUpdate({id, 0, "ok"}) == ApplyOutcome::kApplied) ++applied;
      } catch (const std::exception& e) {
        record_error(e);
      }
    }
  });

  std::thread lister([&] {
    while (!writer_done) {
      try {
        auto rows = client->List({StatusFilter::kAll, std::string("/concurrent")});
        assert(rows.size() <= static_cast<std::size_t>(kRequests));
      } catch (const std::exception& e) {
        record_error(e);
      }
    }
  });

  writer.join();
  updater.join();
  lister.join();

  if (errors != 0) std::cerr << backend.name << ": " << errors << " errors, first: " << first_error << "\n";
  assert(errors == 0);
  assert(applied == kRequests);
  assert(client->List({StatusFilter::kProcessed, std::string("/concurrent")}).size() == static_cast<std::size_t>(kRequests));
  assert(client->List({StatusFilter::kPending, std::string("/concurrent")}).empty());
}

void RunClientSuite(BackendFactory& backend) {
  std::cout << "running client suite: " << backend.name << "\n";

  TestCreatePersistsAndSubmits(backend);
  TestMalformedRequestIsNeverPersisted(backend);
  TestSubmitRejectsDuplicatesAndProcessed(backend);
  TestSuccessStatus(backend);
  TestUnknownCodeIsSurfaced(backend);
  TestObserversSeeConsistentStatus(backend);
  TestDuplicateUpdateIsIgnored(backend);
  TestConflictingUpdateKeepsFirstValue(backend);
  TestUpdateForUnknownRequest(backend);
  TestUpdatedAtIsSetOnceByDefault(backend);
  TestUpdatedAtRefreshPolicy(backend);
  TestEndToEndWithEvaluator(backend);
  TestResumeResubmitsPending(backend);
  TestResumeContinuesAfterTransportFailure(backend);
  TestFindLoadsProcessedRecord(backend);
  TestStatusNeverLagsStatusCode(backend);
  TestConcurrentCreatesUpdatesAndLists(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunClientSuite(backend);
  }

  std::cout << "permit_unit_permission_client: pass\n";
  return 0;
}
