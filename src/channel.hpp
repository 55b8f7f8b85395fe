#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

// Bounded multi-producer channel. Every Sender copy counts as one producer;
// the channel closes once the last Sender is released, after which the
// receiver drains what is still queued and then sees Closed. Values from one
// producer arrive in the order that producer sent them.
template<typename T>
class BoundedChannel {
  struct State {
    std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<T> queue;
    std::size_t capacity = 1;
    std::size_t senders = 0;
    bool receiver_alive = true;
  };

public:
  enum class RecvStatus { Value, Timeout, Closed };

  class Sender {
  public:
    Sender() = default;

    Sender(const Sender& other) : state_(other.state_) {
      attach();
    }

    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(const Sender& other) {
      if(this != &other) {
        release();
        state_ = other.state_;
        attach();
      }
      return *this;
    }

    Sender& operator=(Sender&& other) noexcept {
      if(this != &other) {
        release();
        state_ = std::move(other.state_);
      }
      return *this;
    }

    ~Sender() { release(); }

    // Blocks while the channel is full. Returns false when the receiver is
    // gone or this sender was released; the value is dropped in that case.
    bool send(T value) {
      if(!state_) return false;
      {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->not_full.wait(lock, [this]{
          return !state_->receiver_alive || state_->queue.size() < state_->capacity;
        });
        if(!state_->receiver_alive) return false;
        state_->queue.push_back(std::move(value));
      }
      state_->not_empty.notify_one();
      return true;
    }

    void release() {
      if(!state_) return;
      bool closed = false;
      {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if(state_->senders > 0) --state_->senders;
        closed = (state_->senders == 0);
      }
      if(closed) state_->not_empty.notify_all();
      state_.reset();
    }

    explicit operator bool() const { return static_cast<bool>(state_); }

  private:
    friend class BoundedChannel;

    explicit Sender(std::shared_ptr<State> state) : state_(std::move(state)) {
      attach();
    }

    void attach() {
      if(!state_) return;
      std::lock_guard<std::mutex> lock(state_->mutex);
      ++state_->senders;
    }

    std::shared_ptr<State> state_;
  };

  class Receiver {
  public:
    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;
    Receiver(Receiver&&) noexcept = default;
    Receiver& operator=(Receiver&&) noexcept = default;

    ~Receiver() { close(); }

    RecvStatus receive(T& out, std::chrono::milliseconds timeout) {
      std::unique_lock<std::mutex> lock(state_->mutex);
      state_->not_empty.wait_for(lock, timeout, [this]{
        return !state_->queue.empty() || state_->senders == 0;
      });
      return pop_locked(out);
    }

    RecvStatus receive(T& out) {
      std::unique_lock<std::mutex> lock(state_->mutex);
      state_->not_empty.wait(lock, [this]{
        return !state_->queue.empty() || state_->senders == 0;
      });
      return pop_locked(out);
    }

    // Senders blocked on a full queue return false from then on.
    void close() {
      if(!state_) return;
      {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->receiver_alive = false;
        state_->queue.clear();
      }
      state_->not_full.notify_all();
    }

    std::size_t pending() const {
      std::lock_guard<std::mutex> lock(state_->mutex);
      return state_->queue.size();
    }

  private:
    friend class BoundedChannel;

    explicit Receiver(std::shared_ptr<State> state) : state_(std::move(state)) {}

    RecvStatus pop_locked(T& out) {
      if(!state_->queue.empty()) {
        out = std::move(state_->queue.front());
        state_->queue.pop_front();
        state_->not_full.notify_one();
        return RecvStatus::Value;
      }
      return state_->senders == 0 ? RecvStatus::Closed : RecvStatus::Timeout;
    }

    std::shared_ptr<State> state_;
  };

  static std::pair<Sender, Receiver> create(std::size_t capacity) {
    auto state = std::make_shared<State>();
    state->capacity = capacity == 0 ? 1 : capacity;
    Sender sender(state);
    return {std::move(sender), Receiver(std::move(state))};
  }
};
