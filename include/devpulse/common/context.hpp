#pragma once

#include "devpulse/common/result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devpulse::common {

inline constexpr const char *kContextCanceled = "context canceled";
inline constexpr const char *kContextDeadlineExceeded = "context deadline exceeded";

/// Cancellation and deadline scope shared by every blocking operation in devpulse.
///
/// Copies share state, so a Context can be handed to worker threads by value. Cancelling a
/// context cancels every context derived from it; a child never outlives its parent's deadline.
class Context {
public:
  using Clock = std::chrono::steady_clock;
  using CallbackId = std::uint64_t;

  /// A context that is never cancelled and has no deadline.
  [[nodiscard]] static Context background();
  [[nodiscard]] static Context with_cancel(const Context &parent);
  [[nodiscard]] static Context with_timeout(const Context &parent,
                                            std::chrono::milliseconds timeout);
  [[nodiscard]] static Context with_deadline(const Context &parent, Clock::time_point deadline);

  void cancel() const;
  [[nodiscard]] bool cancelled() const;
  /// Success while the context is live, otherwise a Cancelled status naming the reason.
  [[nodiscard]] Status error() const;
  [[nodiscard]] std::optional<Clock::time_point> deadline() const;

  /// Sleeps for the given duration unless the context ends first. Returns false when the
  /// wait was cut short by cancellation or deadline.
  [[nodiscard]] bool wait_for(std::chrono::milliseconds duration) const;

  /// Runs callback once on cancellation (immediately if already cancelled). Deadline expiry
  /// only triggers callbacks when observed through cancelled(), error() or wait_for().
  CallbackId on_cancel(std::function<void()> callback) const;
  void remove_callback(CallbackId id) const;

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::string reason;
    std::optional<Clock::time_point> deadline;
    std::vector<std::weak_ptr<State>> children;
    std::unordered_map<CallbackId, std::function<void()>> callbacks;
    CallbackId next_callback = 1;
  };

  explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

  static void finish(const std::shared_ptr<State> &state, const std::string &reason);
  static void check_deadline(const std::shared_ptr<State> &state);

  std::shared_ptr<State> state_;
};

} // namespace devpulse::common
