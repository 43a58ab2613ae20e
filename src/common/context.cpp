#include "devpulse/common/context.hpp"

#include <algorithm>

namespace devpulse::common {

Context Context::background() { return Context(std::make_shared<State>()); }

Context Context::with_cancel(const Context &parent) {
  auto state = std::make_shared<State>();
  std::string inherited_reason;
  {
    std::lock_guard<std::mutex> lock(parent.state_->mutex);
    state->deadline = parent.state_->deadline;
    if (parent.state_->done) {
      inherited_reason = parent.state_->reason;
    } else {
      auto &children = parent.state_->children;
      children.erase(std::remove_if(children.begin(), children.end(),
                                    [](const std::weak_ptr<State> &child) {
                                      return child.expired();
                                    }),
                     children.end());
      children.push_back(state);
    }
  }
  if (!inherited_reason.empty()) {
    finish(state, inherited_reason);
  }
  return Context(std::move(state));
}

Context Context::with_timeout(const Context &parent, const std::chrono::milliseconds timeout) {
  return with_deadline(parent, Clock::now() + timeout);
}

Context Context::with_deadline(const Context &parent, const Clock::time_point deadline) {
  Context child = with_cancel(parent);
  {
    std::lock_guard<std::mutex> lock(child.state_->mutex);
    if (!child.state_->deadline.has_value() || deadline < *child.state_->deadline) {
      child.state_->deadline = deadline;
    }
  }
  check_deadline(child.state_);
  return child;
}

void Context::finish(const std::shared_ptr<State> &state, const std::string &reason) {
  std::vector<std::weak_ptr<State>> children;
  std::unordered_map<CallbackId, std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->done) {
      return;
    }
    state->done = true;
    state->reason = reason;
    children.swap(state->children);
    callbacks.swap(state->callbacks);
  }
  state->cv.notify_all();

  for (auto &[id, callback] : callbacks) {
    (void)id;
    if (callback) {
      callback();
    }
  }
  for (const auto &weak_child : children) {
    if (auto child = weak_child.lock(); child != nullptr) {
      finish(child, reason);
    }
  }
}

void Context::check_deadline(const std::shared_ptr<State> &state) {
  bool expired = false;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    expired = !state->done && state->deadline.has_value() && Clock::now() >= *state->deadline;
  }
  if (expired) {
    finish(state, kContextDeadlineExceeded);
  }
}

void Context::cancel() const { finish(state_, kContextCanceled); }

bool Context::cancelled() const {
  check_deadline(state_);
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->done;
}

Status Context::error() const {
  check_deadline(state_);
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (!state_->done) {
    return Status::success();
  }
  return Status::cancelled(state_->reason);
}

std::optional<Context::Clock::time_point> Context::deadline() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->deadline;
}

bool Context::wait_for(const std::chrono::milliseconds duration) const {
  auto until = Clock::now() + duration;
  bool hit_deadline = false;
  {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->deadline.has_value() && *state_->deadline <= until) {
      until = *state_->deadline;
      hit_deadline = true;
    }
    if (state_->cv.wait_until(lock, until, [this]() { return state_->done; })) {
      return false;
    }
  }
  if (hit_deadline) {
    finish(state_, kContextDeadlineExceeded);
    return false;
  }
  return true;
}

Context::CallbackId Context::on_cancel(std::function<void()> callback) const {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->done) {
      const CallbackId id = state_->next_callback++;
      state_->callbacks.emplace(id, std::move(callback));
      return id;
    }
  }
  if (callback) {
    callback();
  }
  return 0;
}

void Context::remove_callback(const CallbackId id) const {
  if (id == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->callbacks.erase(id);
}

} // namespace devpulse::common
