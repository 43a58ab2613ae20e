#pragma once

#include "devpulse/common/context.hpp"
#include "devpulse/common/result.hpp"

#include <string>

namespace devpulse::events {

class IEventPublisher {
public:
  virtual ~IEventPublisher() = default;

  /// Sends payload on subject. An already-cancelled context fails without sending.
  [[nodiscard]] virtual common::Status publish(const common::Context &ctx,
                                               const std::string &subject,
                                               const std::string &payload) = 0;
  [[nodiscard]] virtual bool is_connected() const = 0;
};

/// Serializes a domain event with its to_json overload and publishes it.
template <typename Event>
[[nodiscard]] common::Status publish_event(IEventPublisher &publisher, const common::Context &ctx,
                                           const std::string &subject, const Event &event) {
  return publisher.publish(ctx, subject, to_json(event));
}

} // namespace devpulse::events
