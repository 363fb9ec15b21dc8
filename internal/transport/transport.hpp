#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "permit/v1.hpp"

namespace permit::transport {

// Authority's terminal answer for one request.
struct StatusUpdate {
  std::string  id;
  std::int32_t status_code = 0;
  std::string  status_message;
};

/*
  Transport collaborator.

  Moves new requests to the authority and status updates back. Delivery is
  at least once; the receiving side must apply updates idempotently.
*/
class Transport {
 public:
  using UpdateHandler = std::function<void(const StatusUpdate&)>;

  virtual ~Transport() = default;

  virtual void Submit(const permit::v1::PermissionChange& request) = 0;

  // Replaces any previous handler. Updates may arrive on any thread.
  virtual void SetUpdateHandler(UpdateHandler handler) = 0;
};

} // namespace permit::transport
