#ifndef TIMECACHE_CACHE_SEQ_CELL_HPP
#define TIMECACHE_CACHE_SEQ_CELL_HPP
/**
 * @file SeqCell.hpp
 * @brief Sequence-counter protected snapshot cell (seqlock).
 * @note Thread-safe: One writer at a time, any number of concurrent readers.
 *
 * A value wider than one atomic word cannot be published with a single
 * store. SeqCell splits it into 64-bit atomic words and guards them with a
 * sequence counter:
 *  - The writer bumps the counter to odd, stores the words, then bumps it
 *    back to even with release ordering.
 *  - A reader loads the counter, copies the words, and retries if the
 *    counter was odd or moved in the meantime.
 *
 * Every successful load() returns the words of exactly one store(). Readers
 * never lock and never block the writer; a reader racing a publication only
 * spins for the duration of that copy.
 *
 * Usage:
 * @code
 *   struct Pair { std::int64_t a; std::int64_t b; };
 *   SeqCell<Pair> cell;
 *   cell.store(Pair{1, 2});          // writer thread
 *   const Pair P = cell.load();      // any thread
 * @endcode
 */

#include <array>       // std::array
#include <atomic>      // std::atomic, std::atomic_thread_fence
#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint64_t
#include <cstring>     // std::memcpy
#include <type_traits> // std::is_trivially_copyable_v

namespace timecache {

namespace cache {

/* ----------------------------- SeqCell ----------------------------- */

/**
 * @brief Single-writer, many-reader cell for a trivially copyable T.
 * @tparam T Payload type. Copied bytewise.
 *
 * Concurrent store() calls must be serialized by the caller.
 */
template <typename T> class SeqCell {
  static_assert(std::is_trivially_copyable_v<T>, "SeqCell payload must be trivially copyable");
  static_assert(std::is_default_constructible_v<T>, "SeqCell payload must be default constructible");

public:
  /// Number of 64-bit words backing the payload.
  static constexpr std::size_t WORD_COUNT = (sizeof(T) + sizeof(std::uint64_t) - 1) / sizeof(std::uint64_t);

  /// Holds the bytes of a value-initialized T until the first store().
  SeqCell() noexcept { store(T{}); }

  explicit SeqCell(const T& initial) noexcept { store(initial); }

  SeqCell(const SeqCell&) = delete;
  SeqCell& operator=(const SeqCell&) = delete;

  /**
   * @brief Publish a new value.
   * @note RT-SAFE: Fixed number of atomic stores, no allocation.
   */
  void store(const T& value) noexcept {
    std::array<std::uint64_t, WORD_COUNT> raw{};
    std::memcpy(raw.data(), &value, sizeof(T));

    seq_.fetch_add(1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);

    for (std::size_t i = 0; i < WORD_COUNT; ++i) {
      words_[i].store(raw[i], std::memory_order_relaxed);
    }

    seq_.fetch_add(1, std::memory_order_release);
  }

  /**
   * @brief Copy out the most recently published value.
   * @note RT-SAFE: Lock-free. Retries only while a store() is in flight.
   */
  [[nodiscard]] T load() const noexcept {
    std::array<std::uint64_t, WORD_COUNT> raw{};

    for (;;) {
      const std::uint64_t BEFORE = seq_.load(std::memory_order_acquire);
      if ((BEFORE & 1U) != 0) {
        continue; // Writer mid-publish
      }

      for (std::size_t i = 0; i < WORD_COUNT; ++i) {
        raw[i] = words_[i].load(std::memory_order_relaxed);
      }

      std::atomic_thread_fence(std::memory_order_acquire);
      if (seq_.load(std::memory_order_relaxed) == BEFORE) {
        break;
      }
    }

    T out{};
    std::memcpy(&out, raw.data(), sizeof(T));
    return out;
  }

  /// @brief Number of completed store() calls, including the initial one.
  [[nodiscard]] std::uint64_t version() const noexcept { return seq_.load(std::memory_order_acquire) / 2; }

private:
  alignas(64) std::atomic<std::uint64_t> seq_{0};
  std::array<std::atomic<std::uint64_t>, WORD_COUNT> words_{};
};

} // namespace cache

} // namespace timecache

#endif // TIMECACHE_CACHE_SEQ_CELL_HPP
