#ifndef PTT_DICTATION_AUDIO_CHANNEL_HPP
#define PTT_DICTATION_AUDIO_CHANNEL_HPP

#include <SDL.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace ptt_dictation {

enum class ChannelStatus {
    Ok,
    Empty,        // try_recv found nothing
    Timeout,      // recv_for expired
    Disconnected  // every sender is gone and the queue is drained
};

namespace detail {

// Unbounded multi-producer single-consumer queue. Producers link nodes with a
// single atomic exchange and post an SDL semaphore, so send() never takes a
// lock and never waits on the consumer.
template <typename T>
class ChannelState {
public:
    ChannelState() : head_(new Node), tail_(head_.load()), items_(SDL_CreateSemaphore(0)) {
        if (!items_) {
            delete tail_;
            throw std::runtime_error(std::string("SDL_CreateSemaphore failed: ") + SDL_GetError());
        }
    }

    ~ChannelState() {
        Node* node = tail_;
        while (node) {
            Node* next = node->next.load();
            delete node;
            node = next;
        }
        SDL_DestroySemaphore(items_);
    }

    ChannelState(const ChannelState&) = delete;
    ChannelState& operator=(const ChannelState&) = delete;

    void add_sender() { senders_.fetch_add(1); }

    void release_sender() {
        // Wake a consumer blocked in take() so it can observe the disconnect
        if (senders_.fetch_sub(1) == 1) {
            SDL_SemPost(items_);
        }
    }

    bool push(T value) {
        if (!receiver_alive_.load()) return false;

        Node* node = new Node;
        node->value.emplace(std::move(value));
        Node* prev = head_.exchange(node);
        prev->next.store(node);
        backlog_.fetch_add(1);
        SDL_SemPost(items_);

        // Receiver may have been dropped while we were linking
        return receiver_alive_.load();
    }

    // timeout_ms < 0 blocks, 0 polls
    ChannelStatus take(T& out, int timeout_ms) {
        if (senders_.load() == 0) {
            return pop(out) ? ChannelStatus::Ok : ChannelStatus::Disconnected;
        }

        int rc = 0;
        if (timeout_ms < 0) {
            rc = SDL_SemWait(items_);
        } else if (timeout_ms == 0) {
            rc = SDL_SemTryWait(items_);
        } else {
            rc = SDL_SemWaitTimeout(items_, static_cast<Uint32>(timeout_ms));
        }

        if (rc == SDL_MUTEX_TIMEDOUT) {
            return timeout_ms == 0 ? ChannelStatus::Empty : ChannelStatus::Timeout;
        }
        if (rc < 0) {
            throw std::runtime_error(std::string("SDL semaphore wait failed: ") + SDL_GetError());
        }

        // A token is either a pushed item or the wakeup from the last sender
        for (;;) {
            if (pop(out)) return ChannelStatus::Ok;
            if (senders_.load() == 0) {
                return pop(out) ? ChannelStatus::Ok : ChannelStatus::Disconnected;
            }
            // producer is between exchange and link
            std::this_thread::yield();
        }
    }

    std::size_t backlog() const { return backlog_.load(); }

    void close_receiver() {
        receiver_alive_.store(false);
        T dropped;
        while (pop(dropped)) {
            dropped = T{};
        }
    }

private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;
    };

    // Consumer side only
    bool pop(T& out) {
        Node* next = tail_->next.load();
        if (!next) return false;

        out = std::move(*next->value);
        next->value.reset();
        delete tail_;
        tail_ = next;
        backlog_.fetch_sub(1);
        return true;
    }

    std::atomic<Node*> head_;
    Node* tail_;
    SDL_sem* items_;
    std::atomic<int> senders_{0};
    std::atomic<std::size_t> backlog_{0};
    std::atomic<bool> receiver_alive_{true};
};

} // namespace detail

template <typename T>
class Sender {
public:
    Sender() = default;

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
        if (state_) state_->add_sender();
    }

    Sender(const Sender& other) : state_(other.state_) {
        if (state_) state_->add_sender();
    }

    Sender(Sender&& other) noexcept = default;

    Sender& operator=(Sender other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Sender() {
        if (state_) state_->release_sender();
    }

    // False when the receiver is gone; the value is dropped in that case
    bool send(T value) const {
        return state_ && state_->push(std::move(value));
    }

    // Values sent and not yet taken by the receiver
    std::size_t backlog() const {
        return state_ ? state_->backlog() : 0;
    }

    explicit operator bool() const noexcept { return static_cast<bool>(state_); }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
class Receiver {
public:
    Receiver() = default;

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {}

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver&& other) noexcept = default;

    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Receiver() { close(); }

    ChannelStatus try_recv(T& out) {
        return state_ ? state_->take(out, 0) : ChannelStatus::Disconnected;
    }

    ChannelStatus recv_for(T& out, std::chrono::milliseconds timeout) {
        if (!state_) return ChannelStatus::Disconnected;
        const auto ms = std::max<std::chrono::milliseconds::rep>(1, timeout.count());
        return state_->take(out, static_cast<int>(ms));
    }

    ChannelStatus recv(T& out) {
        return state_ ? state_->take(out, -1) : ChannelStatus::Disconnected;
    }

    explicit operator bool() const noexcept { return static_cast<bool>(state_); }

private:
    // Queued values are destroyed here, so pending replies break immediately
    void close() {
        if (state_) {
            state_->close_receiver();
            state_.reset();
        }
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace ptt_dictation

#endif // PTT_DICTATION_AUDIO_CHANNEL_HPP
