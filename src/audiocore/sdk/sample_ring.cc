//
// Circular sample FIFO
//

#include <audiocore/sdk/sample_ring.hh>
#include <algorithm>
#include <cstring>
#include <utility>

namespace audiocore {

    sample_ring::sample_ring(std::size_t capacity)
        : m_storage(capacity) {
    }

    void sample_ring::reset(std::size_t capacity) {
        m_storage.reset(capacity);
        clear();
    }

    void sample_ring::clear() noexcept {
        m_write_pos = 0;
        m_read_pos = 0;
        m_count = 0;
    }

    std::size_t sample_ring::write(const float* src, std::size_t count) noexcept {
        const std::size_t cap = m_storage.size();
        const std::size_t n = std::min(count, cap - m_count);
        if (n == 0) {
            return 0;
        }

        const std::size_t first = std::min(n, cap - m_write_pos);
        std::memcpy(m_storage.data() + m_write_pos, src, first * sizeof(float));
        if (n > first) {
            std::memcpy(m_storage.data(), src + first, (n - first) * sizeof(float));
        }

        m_write_pos = (m_write_pos + n) % cap;
        m_count += n;
        return n;
    }

    std::size_t sample_ring::read(float* dst, std::size_t count) noexcept {
        const std::size_t cap = m_storage.size();
        const std::size_t n = std::min(count, m_count);
        if (n == 0) {
            return 0;
        }

        const std::size_t first = std::min(n, cap - m_read_pos);
        std::memcpy(dst, m_storage.data() + m_read_pos, first * sizeof(float));
        if (n > first) {
            std::memcpy(dst + first, m_storage.data(), (n - first) * sizeof(float));
        }

        m_read_pos = (m_read_pos + n) % cap;
        m_count -= n;
        return n;
    }

    void sample_ring::swap(sample_ring& other) noexcept {
        m_storage.swap(other.m_storage);
        std::swap(m_write_pos, other.m_write_pos);
        std::swap(m_read_pos, other.m_read_pos);
        std::swap(m_count, other.m_count);
    }

} // namespace audiocore
