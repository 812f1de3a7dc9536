// core/byte_channel.hpp
// Bounded single-producer single-consumer byte channel with flow control
//
// A ring buffer with compile-time capacity, extended with the blocking and
// completion semantics a streaming transport needs:
//   - Writer blocks while the buffer is full (back-pressure)
//   - Reader blocks until bytes beyond what it already examined are published
//   - Reader may keep bytes it looked at (look-ahead) and release them later
//   - Writer signals end-of-stream, optionally carrying an error that every
//     subsequent read rethrows
//
// Memory: tries virtual memory mirroring first (two mappings of the same
// pages back to back), so every readable or writable span is contiguous.
// Falls back to cache-line aligned heap memory, where a read may return two
// segments (SplitRegion).
//
// Positions are monotonic 64-bit sequence counters masked by Capacity-1.
// The counters and completion flags are guarded by one mutex; the bytes
// themselves are accessed outside the lock, the writer only touches
// [committed, head + Capacity) and the reader only [head, published).
//
// Writer API:                          Reader API:
//   uint8_t* next_write_region(&len)     ReadResult read()
//   void commit_write(n)                 void advance(consumed)
//   bool flush()                         void advance(consumed, examined)
//   bool write(data, len)                void complete_reader()
//   void complete()
//   void complete(std::exception_ptr)

#pragma once

// For memfd_create on Linux
#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <sys/mman.h>
#include <fcntl.h>
#include <unistd.h>

// Platform-specific cache line size
#if defined(__aarch64__) && defined(__APPLE__)
#define SOCKCLIENT_CACHE_LINE_SIZE 128
#else
#define SOCKCLIENT_CACHE_LINE_SIZE 64
#endif

namespace sockclient {

// Compile-time check: Capacity must be power of 2
template<size_t N>
struct IsPowerOfTwo {
    static constexpr bool value = (N != 0) && ((N & (N - 1)) == 0);
};

/**
 * Readable (or writable) span that may wrap around the end of the buffer
 *
 * ptr2/len2 are only used by the non-mirrored fallback.
 */
struct SplitRegion {
    const uint8_t* ptr1;
    size_t         len1;
    const uint8_t* ptr2;
    size_t         len2;

    constexpr size_t total() const { return len1 + len2; }
    constexpr bool is_split() const { return len2 != 0; }

    // Byte at logical offset i (i < total())
    uint8_t at(size_t i) const {
        return i < len1 ? ptr1[i] : ptr2[i - len1];
    }

    // Copy n bytes starting at logical offset into dst
    void copy_to(uint8_t* dst, size_t offset, size_t n) const {
        if (offset < len1) {
            size_t first = std::min(n, len1 - offset);
            std::memcpy(dst, ptr1 + offset, first);
            dst += first;
            n -= first;
            offset = 0;
        } else {
            offset -= len1;
        }
        if (n > 0) {
            std::memcpy(dst, ptr2 + offset, n);
        }
    }
};

/**
 * Result of ByteChannel::read()
 *
 * completed:   writer called complete(); nothing beyond region will arrive
 * buffer_full: every byte of capacity is published and already examined,
 *              the writer cannot make progress until the reader consumes
 */
struct ReadResult {
    SplitRegion region;
    bool completed;
    bool buffer_full;

    bool is_end_of_stream() const { return completed && region.total() == 0; }
};

template<size_t Capacity>
class ByteChannel {
    static_assert(IsPowerOfTwo<Capacity>::value, "Capacity must be a power of 2");

public:
    static constexpr size_t MASK = Capacity - 1;

    ByteChannel() = default;

    ~ByteChannel() {
        release();
    }

    ByteChannel(const ByteChannel&) = delete;
    ByteChannel& operator=(const ByteChannel&) = delete;

    /**
     * Allocate storage and reset positions
     *
     * @param allow_mirroring Try the mirrored mapping first (default)
     * @throws std::runtime_error if memory cannot be allocated
     */
    void init(bool allow_mirroring = true) {
        release();

        std::lock_guard<std::mutex> lock(mutex_);
        head_ = examined_ = committed_ = published_ = 0;
        completed_ = false;
        reader_done_ = false;
        error_ = nullptr;

        // Mirroring requires page-granular capacity
        long page = sysconf(_SC_PAGESIZE);
        if (allow_mirroring && page > 0 && Capacity % static_cast<size_t>(page) == 0) {
            if (try_create_mirrored_buffer() == 0) {
                return;
            }
        }

        if (posix_memalign(reinterpret_cast<void**>(&buffer_), SOCKCLIENT_CACHE_LINE_SIZE, Capacity) != 0) {
            buffer_ = nullptr;
            throw std::runtime_error("Failed to allocate byte channel");
        }
        is_mirrored_ = false;
    }

    // =====================
    // Writer side
    // =====================

    /**
     * Get pointer to next writable region (zero-copy write)
     *
     * Blocks while the buffer is full. Bytes committed but not yet flushed
     * are published before blocking so the reader can drain them.
     *
     * @param available_len Set to the contiguous writable length
     * @return Writable region, nullptr if the channel is completed or the
     *         reader has stopped
     */
    uint8_t* next_write_region(size_t* available_len) {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (completed_ || reader_done_ || !buffer_) {
                *available_len = 0;
                return nullptr;
            }
            if (committed_ - head_ < Capacity) break;

            if (published_ != committed_) {
                published_ = committed_;
                readable_cv_.notify_one();
            }
            writable_cv_.wait(lock);
        }

        size_t free_space = Capacity - static_cast<size_t>(committed_ - head_);
        size_t offset = static_cast<size_t>(committed_) & MASK;
        if (is_mirrored_) {
            *available_len = free_space;
        } else {
            *available_len = std::min(free_space, Capacity - offset);
        }
        return buffer_ + offset;
    }

    // Commit bytes written into the last region (not yet visible to reader)
    void commit_write(size_t len) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t free_space = Capacity - static_cast<size_t>(committed_ - head_);
        committed_ += std::min(len, free_space);
    }

    /**
     * Publish committed bytes to the reader
     *
     * @return false if the reader has stopped (bytes will never be read)
     */
    bool flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reader_done_) return false;
        if (published_ != committed_) {
            published_ = committed_;
            readable_cv_.notify_one();
        }
        return true;
    }

    /**
     * Copy bytes into the channel with back-pressure, then flush
     *
     * @return false if the channel was completed or the reader stopped
     *         before all bytes were accepted
     */
    bool write(const void* data, size_t len) {
        const uint8_t* src = static_cast<const uint8_t*>(data);
        while (len > 0) {
            size_t avail = 0;
            uint8_t* dst = next_write_region(&avail);
            if (!dst) return false;
            size_t n = std::min(avail, len);
            std::memcpy(dst, src, n);
            commit_write(n);
            src += n;
            len -= n;
        }
        return flush();
    }

    // Signal end-of-stream; pending committed bytes remain readable
    void complete() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_) return;
        published_ = committed_;
        completed_ = true;
        readable_cv_.notify_all();
        writable_cv_.notify_all();
    }

    // Signal abnormal end-of-stream; every subsequent read() rethrows err
    void complete(std::exception_ptr err) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_) return;
        published_ = committed_;
        completed_ = true;
        error_ = err;
        readable_cv_.notify_all();
        writable_cv_.notify_all();
    }

    // =====================
    // Reader side
    // =====================

    /**
     * Wait for readable bytes and return all unconsumed published bytes
     *
     * Returns once there are bytes beyond the examined position, the writer
     * completed, or the buffer is full of examined bytes.
     *
     * @throws the completion error, if complete(err) was called
     */
    ReadResult read() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (error_) std::rethrow_exception(error_);
            if (published_ > examined_ || completed_) break;
            if (published_ - head_ == Capacity) break;
            readable_cv_.wait(lock);
        }

        ReadResult result;
        result.region = region_locked(head_, static_cast<size_t>(published_ - head_));
        result.completed = completed_ && published_ == committed_;
        result.buffer_full = (published_ - head_ == Capacity) && examined_ == published_;
        return result;
    }

    /**
     * Release consumed bytes, marking the same amount as examined
     */
    void advance(size_t consumed) {
        advance(consumed, consumed);
    }

    /**
     * Release consumed bytes and record how far the reader looked
     *
     * Both offsets are relative to the start of the last read() region.
     * The next read() blocks until bytes beyond `examined` arrive.
     */
    void advance(size_t consumed, size_t examined) {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t start = head_;
        size_t readable_now = static_cast<size_t>(published_ - head_);
        if (consumed > readable_now) consumed = readable_now;
        if (examined > readable_now) examined = readable_now;
        if (examined < consumed) examined = consumed;

        head_ = start + consumed;
        examined_ = std::max(examined_, start + examined);
        if (consumed > 0) {
            writable_cv_.notify_one();
        }
    }

    // Reader stops; blocked and future writes fail instead of waiting
    void complete_reader() {
        std::lock_guard<std::mutex> lock(mutex_);
        reader_done_ = true;
        writable_cv_.notify_all();
    }

    // =====================
    // Queries
    // =====================

    size_t readable() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(published_ - head_);
    }

    bool is_completed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    bool is_mirrored() const { return is_mirrored_; }

    constexpr size_t capacity() const { return Capacity; }

private:
    SplitRegion region_locked(uint64_t start, size_t len) const {
        SplitRegion r = {nullptr, 0, nullptr, 0};
        if (!buffer_) return r;
        size_t offset = static_cast<size_t>(start) & MASK;
        r.ptr1 = buffer_ + offset;
        if (is_mirrored_ || len <= Capacity - offset) {
            r.len1 = len;
        } else {
            r.len1 = Capacity - offset;
            r.ptr2 = buffer_;
            r.len2 = len - r.len1;
        }
        return r;
    }

    void release() {
        if (!buffer_) return;
        if (is_mirrored_) {
            munmap(buffer_, 2 * Capacity);
        } else {
            free(buffer_);
        }
        buffer_ = nullptr;
        is_mirrored_ = false;
    }

    // Returns 0 on success, -1 on failure
    int try_create_mirrored_buffer() {
#ifdef __linux__
        void* addr = mmap(nullptr, 2 * Capacity, PROT_NONE,
                          MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (addr == MAP_FAILED) {
            return -1;
        }

        int fd = memfd_create("sockclient_channel", MFD_CLOEXEC);
        if (fd < 0) {
            munmap(addr, 2 * Capacity);
            return -1;
        }

        if (ftruncate(fd, Capacity) != 0) {
            ::close(fd);
            munmap(addr, 2 * Capacity);
            return -1;
        }

        void* addr1 = mmap(addr, Capacity, PROT_READ | PROT_WRITE,
                           MAP_FIXED | MAP_SHARED, fd, 0);
        if (addr1 == MAP_FAILED || addr1 != addr) {
            ::close(fd);
            munmap(addr, 2 * Capacity);
            return -1;
        }

        void* addr2 = mmap(static_cast<uint8_t*>(addr) + Capacity, Capacity,
                           PROT_READ | PROT_WRITE, MAP_FIXED | MAP_SHARED, fd, 0);
        if (addr2 == MAP_FAILED || addr2 != static_cast<uint8_t*>(addr) + Capacity) {
            munmap(addr, 2 * Capacity);
            ::close(fd);
            return -1;
        }

        ::close(fd);
        buffer_ = static_cast<uint8_t*>(addr);
        is_mirrored_ = true;
        return 0;
#else
        return -1;
#endif
    }

    uint8_t* buffer_ = nullptr;
    bool is_mirrored_ = false;

    mutable std::mutex mutex_;
    std::condition_variable readable_cv_;
    std::condition_variable writable_cv_;

    uint64_t head_ = 0;       // first unconsumed byte
    uint64_t examined_ = 0;   // reader has looked at everything before this
    uint64_t committed_ = 0;  // writer has filled everything before this
    uint64_t published_ = 0;  // reader may see everything before this
    bool completed_ = false;
    bool reader_done_ = false;
    std::exception_ptr error_;
};

} // namespace sockclient
