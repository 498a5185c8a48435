#include <audiocore/sdk/audio_format.hh>
#include <audiocore/error.hh>
#include <ostream>
#include <string>

namespace audiocore {

    namespace {
        bool is_integer_width(unsigned bit_depth) {
            // powers of two in [8, 64], plus packed 24-bit
            return bit_depth == 24 ||
                   ((bit_depth & (bit_depth - 1)) == 0 && bit_depth >= 8 && bit_depth <= 64);
        }
    }

    audio_format::audio_format(unsigned bit_depth, sample_type type)
        : m_bit_depth(bit_depth), m_type(type) {
        if (type == sample_type::floating_point) {
            if (bit_depth < 32 || bit_depth > 64) {
                throw out_of_range_error("Bit depth must be 32 bit or 64 bit for floating-point samples, got " +
                                         std::to_string(bit_depth));
            }
            if (bit_depth != 32 && bit_depth != 64) {
                throw configuration_error("Bit depth must be 32 bit or 64 bit for floating-point samples, got " +
                                          std::to_string(bit_depth));
            }
            return;
        }
        if (bit_depth < 8 || bit_depth > 64) {
            throw out_of_range_error("Bit depth must be between 8 bit and 64 bit for integer samples, got " +
                                     std::to_string(bit_depth));
        }
        if (!is_integer_width(bit_depth)) {
            throw configuration_error("Bit depth must be a power of 2, or 24 bit, got " +
                                      std::to_string(bit_depth));
        }
    }

    audio_format audio_format::float32() noexcept {
        return {32, sample_type::floating_point, unchecked_tag{}};
    }

    bool audio_format::is_valid(unsigned bit_depth, sample_type type) noexcept {
        if (type == sample_type::floating_point) {
            return bit_depth == 32 || bit_depth == 64;
        }
        return is_integer_width(bit_depth);
    }

    void validate_stream_params(channels_t channels, sample_rate_t freq) {
        if (channels == 0) {
            throw configuration_error("The number of audio channels must be greater than 0");
        }
        if (freq == 0) {
            throw configuration_error("The sample rate must be greater than 0");
        }
    }

    std::ostream& operator<<(std::ostream& os, sample_type type) {
        switch (type) {
            case sample_type::signed_integer:
                os << "s";
                break;
            case sample_type::unsigned_integer:
                os << "u";
                break;
            case sample_type::floating_point:
                os << "f";
                break;
            default:
                os << "sample_type(" << static_cast<int>(type) << ")";
                break;
        }
        return os;
    }

    std::ostream& operator<<(std::ostream& os, const audio_format& fmt) {
        return os << fmt.type() << fmt.bit_depth();
    }

} // namespace audiocore
