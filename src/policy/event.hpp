// policy/event.hpp
// Event Loop Policy - epoll readiness waits for the transport loops
//
// Each loop thread owns one instance watching its single connection
// descriptor, and only needs to know when to retry a read or a write:
//   - void init()
//   - void add_read(int fd) / void add_write(int fd)
//   - void set_wait_timeout(int ms)
//   - int wait_with_timeout()           // >0 ready, 0 timeout, -1 error
//
// Namespace: sockclient::event_policies

#pragma once

#include <stdexcept>
#include <cstdint>
#include <concepts>

#if defined(__linux__)
    #include <sys/epoll.h>
    #include <unistd.h>
#else
    #error "Unsupported platform for event policy"
#endif

namespace sockclient {
namespace event_policies {

/**
 * EpollPolicy - level-triggered epoll on one descriptor
 *
 * A loop that stops reading before the socket is drained (channel full) is
 * woken again on its next wait. Peer hangup and socket errors also wake
 * the wait; the following read or write reports them.
 *
 * Not thread-safe.
 */
class EpollPolicy {
public:
    EpollPolicy() = default;

    ~EpollPolicy() {
        cleanup();
    }

    EpollPolicy(const EpollPolicy&) = delete;
    EpollPolicy& operator=(const EpollPolicy&) = delete;

    /**
     * Create the epoll instance, replacing any previous one
     *
     * @throws std::runtime_error if epoll_create1() fails
     */
    void init() {
        cleanup();
        epfd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epfd_ < 0) {
            throw std::runtime_error("epoll_create1() failed");
        }
    }

    // @throws std::runtime_error if epoll_ctl() fails
    void add_read(int fd) {
        add(fd, EPOLLIN | EPOLLRDHUP, "epoll_ctl(ADD, EPOLLIN) failed");
    }

    // @throws std::runtime_error if epoll_ctl() fails
    void add_write(int fd) {
        add(fd, EPOLLOUT, "epoll_ctl(ADD, EPOLLOUT) failed");
    }

    // -1 = infinite, 0 = poll
    void set_wait_timeout(int timeout_ms) {
        timeout_ms_ = timeout_ms;
    }

    int wait_with_timeout() {
        struct epoll_event events[MAX_EVENTS];
        int n = epoll_wait(epfd_, events, MAX_EVENTS, timeout_ms_);
        return n < 0 ? -1 : n;
    }

    static constexpr int MAX_EVENTS = 4;

private:
    void add(int fd, uint32_t events, const char* what) {
        struct epoll_event ev = {};
        ev.events = events;
        ev.data.fd = fd;

        if (epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            throw std::runtime_error(what);
        }
    }

    void cleanup() {
        if (epfd_ >= 0) {
            ::close(epfd_);
            epfd_ = -1;
        }
    }

    int epfd_ = -1;
    int timeout_ms_ = -1;
};

/**
 * EventPolicyConcept - what SenderLoop and ReceiverLoop call
 */
template<typename T>
concept EventPolicyConcept = requires(T event, int fd, int timeout) {
    { event.init() } -> std::same_as<void>;
    { event.add_read(fd) } -> std::same_as<void>;
    { event.add_write(fd) } -> std::same_as<void>;
    { event.set_wait_timeout(timeout) } -> std::same_as<void>;
    { event.wait_with_timeout() } -> std::convertible_to<int>;
};

static_assert(EventPolicyConcept<EpollPolicy>);

using DefaultEventPolicy = EpollPolicy;

} // namespace event_policies
} // namespace sockclient
