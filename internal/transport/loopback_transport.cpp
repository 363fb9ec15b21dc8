#include "internal/transport/loopback_transport.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/transport/wire.hpp"

namespace permit::transport {

LoopbackTransport::LoopbackTransport(Evaluator evaluator) : evaluator_(std::move(evaluator)) {
}

permit::v1::PermissionChange LoopbackTransport::Decode(const std::string& bytes) {
  permit::v1::PermissionChange message;
  if (!message.ParseFromString(bytes)) {
    throw std::runtime_error("loopback transport: corrupt queued request");
  }
  return message;
}

void LoopbackTransport::Submit(const permit::v1::PermissionChange& request) {
  std::string bytes;
  if (!request.SerializeToString(&bytes)) {
    throw std::runtime_error("loopback transport: failed to serialize request " + request.id());
  }

  std::lock_guard lock(mutex_);
  queue_.push_back(std::move(bytes));
  ++submitted_;
}

void LoopbackTransport::SetUpdateHandler(UpdateHandler handler) {
  std::lock_guard lock(mutex_);
  handler_ = std::move(handler);
}

std::size_t LoopbackTransport::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::optional<permit::v1::PermissionChange> LoopbackTransport::Peek() const {
  std::lock_guard lock(mutex_);
  if (queue_.empty()) return std::nullopt;
  return Decode(queue_.front());
}

std::size_t LoopbackTransport::Drain() {
  std::lock_guard lock(mutex_);
  const auto dropped = queue_.size();
  queue_.clear();
  return dropped;
}

std::size_t LoopbackTransport::DeliverAll() {
  std::deque<std::string> batch;
  Evaluator               evaluator;
  UpdateHandler           handler;
  {
    std::lock_guard lock(mutex_);
    if (!evaluator_) {
      throw std::logic_error("loopback transport: no evaluator configured");
    }
    batch.swap(queue_);
    evaluator = evaluator_;
    handler   = handler_;
  }

  std::size_t answered = 0;
  for (const auto& bytes : batch) {
    const auto update = evaluator(Decode(bytes));
    if (handler) handler(update);
    ++answered;
  }
  return answered;
}

void LoopbackTransport::Deliver(const StatusUpdate& update) {
  // Round trip through the wire message like a remote authority would.
  std::string bytes;
  if (!ToProto(update).SerializeToString(&bytes)) {
    throw std::runtime_error("loopback transport: failed to serialize status update " + update.id);
  }
  permit::v1::StatusUpdate message;
  if (!message.ParseFromString(bytes)) {
    throw std::runtime_error("loopback transport: corrupt status update " + update.id);
  }

  UpdateHandler handler;
  {
    std::lock_guard lock(mutex_);
    handler = handler_;
  }
  if (handler) handler(FromProto(message));
}

std::size_t LoopbackTransport::SubmittedCount() const {
  std::lock_guard lock(mutex_);
  return submitted_;
}

} // namespace permit::transport
