/**
 * @file sample_ring.hh
 * @brief Fixed-capacity circular queue of float samples
 * @ingroup sdk
 */

#pragma once

#include <audiocore/sdk/buffer.hh>
#include <audiocore/sdk/types.hh>
#include <audiocore/sdk/export_audiocore_sdk.h>

namespace audiocore {

    /**
     * @class sample_ring
     * @brief Circular FIFO of interleaved samples
     *
     * Invariants:
     * - `0 <= size() <= capacity()`
     * - read and write positions stay in `[0, capacity())` and wrap modulo capacity
     * - every transfer is at most two contiguous copies (tail then head)
     *
     * Storage is allocated only by reset(); write() and read() never allocate.
     * The ring is not synchronised: the owner holds its own lock around every
     * call, which keeps the ring usable by value inside other objects.
     *
     * @code
     * sample_ring ring(8);
     * ring.write(in, 6);         // accepted == 6
     * ring.read(out, 4);         // size() == 2
     * ring.write(in, 6);         // wraps, size() == 8
     * @endcode
     */
    class AUDIOCORE_SDK_EXPORT sample_ring {
        public:
            sample_ring() = default;
            explicit sample_ring(std::size_t capacity);

            sample_ring(sample_ring&&) noexcept = default;
            sample_ring& operator=(sample_ring&&) noexcept = default;

            /// Reallocate to @p capacity samples and drop all content
            void reset(std::size_t capacity);

            /// Drop all content, keeping the storage
            void clear() noexcept;

            /**
             * @brief Append up to @p count samples
             * @return Number of samples accepted, `min(count, free_space())`
             */
            std::size_t write(const float* src, std::size_t count) noexcept;

            /**
             * @brief Remove up to @p count samples into @p dst
             * @return Number of samples copied, `min(count, size())`
             */
            std::size_t read(float* dst, std::size_t count) noexcept;

            [[nodiscard]] std::size_t size() const noexcept { return m_count; }
            [[nodiscard]] std::size_t capacity() const noexcept { return m_storage.size(); }
            [[nodiscard]] std::size_t free_space() const noexcept { return m_storage.size() - m_count; }
            [[nodiscard]] bool empty() const noexcept { return m_count == 0; }

            [[nodiscard]] std::size_t read_position() const noexcept { return m_read_pos; }
            [[nodiscard]] std::size_t write_position() const noexcept { return m_write_pos; }

            void swap(sample_ring& other) noexcept;

        private:
            buffer<float> m_storage;
            std::size_t   m_write_pos = 0;
            std::size_t   m_read_pos  = 0;
            std::size_t   m_count     = 0;
    };

} // namespace audiocore
