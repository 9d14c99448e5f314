/**
 * @file rendezvous_channel.hpp
 * @brief Unbuffered blocking channel: a send completes only once a receiver
 *        has taken the value.
 *
 * Roles:
 *  - Producer: send() values, close() at end of stream.
 *  - Consumer: receive() until it returns nullopt, or cancel() to walk away.
 *
 * send() also watches a std::stop_token, so the thread owning the producer
 * can stop it even while it is blocked waiting for a receiver.
 *
 * @tparam T Element type. Must be move-constructible.
 */
#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace strata::source {

template <class T>
class RendezvousChannel final {
public:
  /// @brief Outcome of a send.
  enum class SendStatus : std::uint8_t {
    Delivered,  ///< A receiver took the value
    Closed,     ///< Channel already closed; value dropped
    Cancelled   ///< Consumer cancelled or stop requested; value dropped
  };

  RendezvousChannel() = default;
  RendezvousChannel(const RendezvousChannel&)            = delete;
  RendezvousChannel& operator=(const RendezvousChannel&) = delete;

  /**
   * @brief Offer @p v and block until it is received.
   * @param st Stop token of the producing thread.
   */
  SendStatus send(T v, std::stop_token st) {
    std::unique_lock<std::mutex> lk(mu_);
    // Wait for the slot (another producer may still be mid-handoff).
    if (!cv_.wait(lk, st, [&] { return !slot_ || closed_ || cancelled_; })) {
      return SendStatus::Cancelled;
    }
    if (cancelled_) return SendStatus::Cancelled;
    if (closed_)    return SendStatus::Closed;

    slot_.emplace(std::move(v));
    const std::uint64_t ticket = ++offered_;
    cv_.notify_all();

    cv_.wait(lk, st, [&] { return taken_ >= ticket || cancelled_; });
    if (taken_ >= ticket) return SendStatus::Delivered;

    // Nobody came: withdraw the offer so a late receive() does not see it.
    slot_.reset();
    cv_.notify_all();
    return SendStatus::Cancelled;
  }

  /**
   * @brief Block until a value arrives.
   * @return The value, or nullopt once the channel is closed and drained or
   *         has been cancelled.
   */
  std::optional<T> receive() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&] { return slot_.has_value() || closed_ || cancelled_; });
    if (cancelled_ || !slot_) return std::nullopt;

    std::optional<T> out(std::move(slot_));
    slot_.reset();
    ++taken_;
    cv_.notify_all();
    return out;
  }

  /// @brief Producer side: no more values. Pending receivers wake with nullopt.
  void close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    cv_.notify_all();
  }

  /// @brief Consumer side: stop listening. Blocked senders return Cancelled.
  void cancel() {
    std::lock_guard<std::mutex> lk(mu_);
    cancelled_ = true;
    cv_.notify_all();
  }

  /// @brief True after close() or cancel().
  bool done() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_ || cancelled_;
  }

private:
  mutable std::mutex          mu_;
  std::condition_variable_any cv_;
  std::optional<T>            slot_{};      ///< Value on offer
  std::uint64_t               offered_{0};  ///< Values placed in the slot
  std::uint64_t               taken_{0};    ///< Values handed to receivers
  bool                        closed_{false};
  bool                        cancelled_{false};
};

} // namespace strata::source
