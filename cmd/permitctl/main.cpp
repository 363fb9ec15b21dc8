#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/merge_directive.hpp"
#include "internal/model/status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transport/loopback_transport.hpp"
#include "internal/util/time.hpp"

using permit::model::MergeDirective;

namespace {

constexpr int kExitUsage   = 1;
constexpr int kExitFailure = 2;

void Usage() {
  std::cout << "Usage:\n"
            << "  permitctl <config.yaml> create-user <user_id> <realm_url> [read=..] [write=..] [manage=..]\n"
            << "  permitctl <config.yaml> create-metadata <key> <value> <realm_url> [read=..] [write=..] [manage=..]\n"
            << "  permitctl <config.yaml> show <id>\n"
            << "  permitctl <config.yaml> list [pending|processed]\n"
            << "  permitctl <config.yaml> apply-status <id> <code> [message]\n"
            << "\n"
            << "  directive values: grant | revoke | unspecified\n";
}

struct Directives {
  MergeDirective may_read   = MergeDirective::kUnspecified;
  MergeDirective may_write  = MergeDirective::kUnspecified;
  MergeDirective may_manage = MergeDirective::kUnspecified;
};

// Parses trailing "read=grant write=revoke ..." arguments.
std::optional<Directives> ParseDirectives(const std::vector<std::string>& args) {
  Directives out;
  for (const auto& arg : args) {
    const auto eq = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "expected name=value, got '" << arg << "'\n";
      return std::nullopt;
    }

    const auto name  = arg.substr(0, eq);
    const auto value = permit::model::ParseMergeDirective(arg.substr(eq + 1));
    if (!value) {
      std::cerr << "unsupported directive: " << arg.substr(eq + 1) << "\n";
      return std::nullopt;
    }

    if (name == "read") {
      out.may_read = *value;
    } else if (name == "write") {
      out.may_write = *value;
    } else if (name == "manage") {
      out.may_manage = *value;
    } else {
      std::cerr << "unsupported permission: " << name << "\n";
      return std::nullopt;
    }
  }
  return out;
}

void Print(const permit::model::PermissionChange& change, const permit::model::ErrorTaxonomy& taxonomy) {
  std::cout << "id:             " << change.id << "\n";
  std::cout << "created_at_ms:  " << permit::util::ToUnixMillis(change.created_at) << "\n";
  std::cout << "updated_at_ms:  " << permit::util::ToUnixMillis(change.updated_at) << "\n";
  if (change.Mode() == permit::model::TargetMode::kMetadata) {
    std::cout << "metadata:       " << *change.metadata_key << "=" << *change.metadata_value << "\n";
  } else {
    std::cout << "user_id:        " << change.user_id << "\n";
  }
  std::cout << "realm_url:      " << change.realm_url << "\n";
  std::cout << "may_read:       " << permit::model::ToString(change.may_read) << "\n";
  std::cout << "may_write:      " << permit::model::ToString(change.may_write) << "\n";
  std::cout << "may_manage:     " << permit::model::ToString(change.may_manage) << "\n";
  if (change.status_code) {
    std::cout << "status_code:    " << *change.status_code << "\n";
    std::cout << "status_message: " << change.status_message.value_or("") << "\n";
  }
  std::cout << "status:         " << permit::model::Describe(permit::model::Decode(change.status_code, taxonomy)) << "\n";
}

void PrintRow(const permit::model::PermissionChange& change, const permit::model::ErrorTaxonomy& taxonomy) {
  const auto target = change.Mode() == permit::model::TargetMode::kMetadata ? *change.metadata_key + "=" + *change.metadata_value
                                                                            : change.user_id;
  std::cout << change.id << "  " << target << "  " << change.realm_url << "  "
            << permit::model::Describe(permit::model::Decode(change.status_code, taxonomy)) << "\n";
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return kExitUsage;
  }

  const std::string              config_path = argv[1];
  const std::string              cmd         = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = permit::config::ConfigLoader::LoadFromYaml(config_path);
    permit::observability::InitializeLogging(config);

    // Nothing leaves the process; requests stay pending until apply-status.
    auto transport = std::make_shared<permit::transport::LoopbackTransport>();
    auto deps      = permit::factory::Build(config, transport);
    auto& client   = *deps.client;

    int rc = 0;

    if (cmd == "create-user" || cmd == "create-metadata") {
      const std::size_t positional = cmd == "create-user" ? 2 : 3;
      if (args.size() < positional) {
        Usage();
        return kExitUsage;
      }

      auto directives = ParseDirectives({args.begin() + static_cast<std::ptrdiff_t>(positional), args.end()});
      if (!directives) return kExitUsage;

      auto tracked = cmd == "create-user"
                         ? client.CreateForUser(args[0], args[1], directives->may_read, directives->may_write, directives->may_manage)
                         : client.CreateForMetadata(args[0], args[1], args[2], directives->may_read, directives->may_write,
                                                    directives->may_manage);
      std::cout << tracked->Id() << "\n";

    } else if (cmd == "show") {
      if (args.size() != 1) {
        Usage();
        return kExitUsage;
      }

      auto tracked = client.Find(args[0]);
      if (!tracked) {
        std::cerr << "permission change not found: " << args[0] << "\n";
        rc = kExitFailure;
      } else {
        Print(tracked->Snapshot(), client.Taxonomy());
      }

    } else if (cmd == "list") {
      permit::db::PermissionChangeFilter filter;
      if (args.size() == 1 && args[0] == "pending") {
        filter.status = permit::db::StatusFilter::kPending;
      } else if (args.size() == 1 && args[0] == "processed") {
        filter.status = permit::db::StatusFilter::kProcessed;
      } else if (!args.empty()) {
        Usage();
        return kExitUsage;
      }

      for (const auto& change : client.List(filter)) {
        PrintRow(change, client.Taxonomy());
      }

    } else if (cmd == "apply-status") {
      if (args.size() < 2 || args.size() > 3) {
        Usage();
        return kExitUsage;
      }

      permit::transport::StatusUpdate update;
      update.id = args[0];
      const auto code = permit::model::ParseStatusCode(args[1]);
      if (!code) {
        std::cerr << "invalid status code: " << args[1] << "\n";
        return kExitUsage;
      }
      update.status_code = *code;
      if (args.size() == 3) update.status_message = args[2];

      const auto outcome = client.OnStatusUpdate(update);
      std::cout << permit::core::ToString(outcome) << "\n";
      if (outcome == permit::core::ApplyOutcome::kConflict || outcome == permit::core::ApplyOutcome::kUnknownRequest) {
        rc = kExitFailure;
      }

    } else {
      Usage();
      return kExitUsage;
    }

    permit::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    PERMIT_LOG_ERROR("Fatal error", {permit::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    permit::observability::ShutdownLogging();
    return kExitFailure;
  }
}
