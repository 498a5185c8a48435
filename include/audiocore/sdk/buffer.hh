/**
 * @file buffer.hh
 * @brief Fixed-size sample storage for the real-time path
 * @ingroup sdk
 */

#pragma once

#include <algorithm>
#include <memory>
#include <type_traits>

namespace audiocore {
    /**
     * @class buffer
     * @brief Heap array whose size only changes on explicit request
     * @tparam T Element type (must be trivially copyable)
     * @ingroup sdk
     *
     * Used for ring storage and for the output mix scratch buffers. It
     * never grows behind the caller's back, so once a real-time object has
     * sized its buffers no further allocation happens on the audio thread.
     *
     * @code
     * buffer<float> mix(1024 * 2);
     * std::fill(mix.begin(), mix.end(), 0.f);
     * @endcode
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        buffer() noexcept = default;

        /**
         * @brief Allocate @p size zero-initialised elements
         */
        explicit buffer(std::size_t size)
            : m_data(size ? std::make_unique<T[]>(size) : nullptr), m_size(size) {
            std::fill_n(m_data.get(), m_size, T{});
        }

        buffer(buffer&&) noexcept = default;
        buffer& operator=(buffer&&) noexcept = default;
        buffer(const buffer&) = delete;
        buffer& operator=(const buffer&) = delete;

        [[nodiscard]] std::size_t size() const noexcept { return m_size; }
        [[nodiscard]] bool empty() const noexcept { return m_size == 0; }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @brief Discard contents and allocate @p new_size zeroed elements
         */
        void reset(std::size_t new_size) {
            m_data = new_size ? std::make_unique<T[]>(new_size) : nullptr;
            m_size = new_size;
            std::fill_n(m_data.get(), m_size, T{});
        }

        void swap(buffer& other) noexcept {
            m_data.swap(other.m_data);
            std::swap(m_size, other.m_size);
        }

        T& operator[](std::size_t pos) noexcept { return m_data[pos]; }
        const T& operator[](std::size_t pos) const noexcept { return m_data[pos]; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + size(); }
        const T* begin() const noexcept { return data(); }
        const T* end() const noexcept { return data() + size(); }

    private:
        std::unique_ptr<T[]> m_data;
        std::size_t m_size = 0;
    };
}
