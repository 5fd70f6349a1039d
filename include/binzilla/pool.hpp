/**
 *  @brief  Process-wide pool of scratch buffers, reused across write calls.
 *  @file   pool.hpp
 *
 *  Buffers are grouped into power-of-two size classes, starting at 64 bytes. Every class keeps at most
 *  `BZ_POOL_BUCKET_DEPTH` idle buffers, and classes above `buffer_pool::largest_pooled_k` are never kept,
 *  so the memory held by an idle pool stays bounded.
 *
 *  Checkouts are scoped: `buffer_pool::checkout` returns a move-only `pooled_buffer`, that hands its
 *  memory back in the destructor, also when the stack is unwound by an exception.
 *
 *  @code{.cpp}
 *      binzilla::buffer_pool &pool = binzilla::buffer_pool::shared();
 *      {
 *          binzilla::pooled_buffer scratch = pool.checkout(4096);
 *          std::memset(scratch.data(), 0, scratch.size());
 *      } // returned here
 *      assert(pool.outstanding() == 0);
 *  @endcode
 */
#ifndef BINZILLA_POOL_HPP_
#define BINZILLA_POOL_HPP_

#include "types.hpp"

#include <mutex>     // `std::mutex`, `std::lock_guard`
#include <stdexcept> // `std::length_error`

namespace binzilla {

class buffer_pool;

/**
 *  @brief  Exclusive ownership of one pooled buffer, for the duration of a single operation.
 *          The usable `size` is the requested one, while the `capacity` is the size class it came from.
 */
class pooled_buffer {
    buffer_pool *pool_ = nullptr;
    byte_t *data_ = nullptr;
    size_t size_ = 0;
    size_t capacity_ = 0;

    friend class buffer_pool;
    pooled_buffer(buffer_pool &pool, byte_t *data, size_t size, size_t capacity) noexcept
        : pool_(&pool), data_(data), size_(size), capacity_(capacity) {}

  public:
    pooled_buffer() noexcept = default;
    pooled_buffer(pooled_buffer const &) = delete;
    pooled_buffer &operator=(pooled_buffer const &) = delete;

    pooled_buffer(pooled_buffer &&other) noexcept
        : pool_(other.pool_), data_(other.data_), size_(other.size_), capacity_(other.capacity_) {
        other.pool_ = nullptr, other.data_ = nullptr, other.size_ = 0, other.capacity_ = 0;
    }

    pooled_buffer &operator=(pooled_buffer &&other) noexcept {
        if (this == &other) return *this;
        reset();
        pool_ = other.pool_, data_ = other.data_, size_ = other.size_, capacity_ = other.capacity_;
        other.pool_ = nullptr, other.data_ = nullptr, other.size_ = 0, other.capacity_ = 0;
        return *this;
    }

    ~pooled_buffer() noexcept { reset(); }

    /** @brief Returns the buffer to its pool early. Safe to call repeatedly. */
    inline void reset() noexcept;

    byte_t *data() const noexcept { return data_; }
    size_t size() const noexcept { return size_; }
    size_t capacity() const noexcept { return capacity_; }
    bool empty() const noexcept { return data_ == nullptr; }
};

/**
 *  @brief  Thread-safe pool of byte buffers, drawing memory from a `bz_memory_allocator_t`.
 *          The allocator is injectable, so tests can simulate allocation failures.
 */
class buffer_pool {
  public:
    /** @brief Smallest size class, in bytes. */
    static constexpr size_t smallest_class_k = 64;
    /** @brief Largest size class that is kept for reuse after a checkout ends. */
    static constexpr size_t largest_pooled_k = size_t(1) << 24;
    /** @brief Number of size classes, one per bit of `size_t`. */
    static constexpr size_t classes_k = sizeof(size_t) * 8;

    buffer_pool() noexcept { bz_memory_allocator_init_default(&allocator_); }
    explicit buffer_pool(bz_memory_allocator_t const &allocator) noexcept : allocator_(allocator) {}

    buffer_pool(buffer_pool const &) = delete;
    buffer_pool &operator=(buffer_pool const &) = delete;

    ~buffer_pool() noexcept { trim(); }

    /** @brief The process-wide pool used by writers that aren't given one explicitly. */
    static buffer_pool &shared() noexcept {
        static buffer_pool pool;
        return pool;
    }

    /**
     *  @brief  Checks out a buffer of at least @p size bytes.
     *  @throw  `std::bad_alloc` if the allocator fails, `std::length_error` if no size class can fit @p size.
     */
    pooled_buffer checkout(size_t size) noexcept(false) {
        size_t const class_index = size_class(size);
        size_t const capacity = size_t(1) << class_index;
        byte_t *data = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bucket_t &bucket = buckets_[class_index];
            if (bucket.count) data = bucket.buffers[--bucket.count];
        }
        if (!data) data = static_cast<byte_t *>(allocator_.allocate(capacity, allocator_.handle));
        if (!data) raise(status_t::bad_alloc_k);

        std::lock_guard<std::mutex> lock(mutex_);
        ++outstanding_, ++checkouts_;
        return pooled_buffer(*this, data, size, capacity);
    }

    /** @brief Number of buffers currently checked out. */
    size_t outstanding() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

    /** @brief Number of successful checkouts over the lifetime of the pool. */
    size_t checkouts() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return checkouts_;
    }

    /** @brief Number of idle buffers kept for reuse. */
    size_t idle() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (bucket_t const &bucket : buckets_) count += bucket.count;
        return count;
    }

    /** @brief Frees all idle buffers. Checked out buffers are unaffected. */
    void trim() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t class_index = 0; class_index != classes_k; ++class_index) {
            bucket_t &bucket = buckets_[class_index];
            while (bucket.count)
                allocator_.free(bucket.buffers[--bucket.count], size_t(1) << class_index, allocator_.handle);
        }
    }

    /**
     *  @brief  Index of the power-of-two class that fits @p size bytes.
     *  @throw  `std::length_error` if the size is above the largest power of two representable in `size_t`.
     */
    static size_t size_class(size_t size) noexcept(false) {
        if (size > (BZ_SIZE_MAX >> 1) + 1) raise(status_t::overflow_risk_k);
        size_t class_index = 6; // log2(smallest_class_k)
        while ((size_t(1) << class_index) < size) ++class_index;
        return class_index;
    }

  private:
    friend class pooled_buffer;

    struct bucket_t {
        byte_t *buffers[BZ_POOL_BUCKET_DEPTH] = {};
        size_t count = 0;
    };

    void give_back(byte_t *data, size_t capacity) noexcept {
        size_t const class_index = size_class(capacity);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --outstanding_;
            bucket_t &bucket = buckets_[class_index];
            if (capacity <= largest_pooled_k && bucket.count != BZ_POOL_BUCKET_DEPTH) {
                bucket.buffers[bucket.count++] = data;
                return;
            }
        }
        allocator_.free(data, capacity, allocator_.handle);
    }

    bz_memory_allocator_t allocator_;
    mutable std::mutex mutex_;
    bucket_t buckets_[classes_k];
    size_t outstanding_ = 0;
    size_t checkouts_ = 0;
};

inline void pooled_buffer::reset() noexcept {
    if (!data_) return;
    pool_->give_back(data_, capacity_);
    pool_ = nullptr, data_ = nullptr, size_ = 0, capacity_ = 0;
}

} // namespace binzilla

#endif // BINZILLA_POOL_HPP_
