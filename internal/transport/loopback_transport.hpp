#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "internal/transport/transport.hpp"

namespace permit::transport {

/*
  In-process transport.

  Submitted requests are serialized and queued exactly as a network
  transport would carry them. Nothing reaches the client until Deliver*()
  is called, which is how tests (and the CLI) play the authority.
*/
class LoopbackTransport final : public Transport {
 public:
  // Authority stand-in: decides the status for one queued request.
  using Evaluator = std::function<StatusUpdate(const permit::v1::PermissionChange&)>;

  LoopbackTransport() = default;
  explicit LoopbackTransport(Evaluator evaluator);

  void Submit(const permit::v1::PermissionChange& request) override;
  void SetUpdateHandler(UpdateHandler handler) override;

  // Number of serialized requests waiting for the authority.
  std::size_t Pending() const;

  // Oldest queued request, decoded. Empty when the queue is empty.
  std::optional<permit::v1::PermissionChange> Peek() const;

  // Drops every queued request; returns how many were dropped.
  std::size_t Drain();

  // Evaluates and answers every queued request; returns how many were answered.
  std::size_t DeliverAll();

  // Pushes an arbitrary update to the client (duplicates, late or unknown ids).
  void Deliver(const StatusUpdate& update);

  std::size_t SubmittedCount() const;

 private:
  static permit::v1::PermissionChange Decode(const std::string& bytes);

  mutable std::mutex      mutex_;
  Evaluator               evaluator_;
  UpdateHandler           handler_;
  std::deque<std::string> queue_;
  std::size_t             submitted_ = 0;
};

} // namespace permit::transport
