//
// Float <-> PCM conversion
//

#include <audiocore/sdk/pcm_codec.hh>
#include <audiocore/sdk/endian.hh>
#include <audiocore/error.hh>
#include <cmath>
#include <cstring>
#include <string>

namespace audiocore::pcm {
    namespace {
        constexpr double max8 = 127.0;
        constexpr double max16 = 32767.0;
        constexpr double max24 = 8388607.0;
        constexpr double max32 = 2147483647.0;

        // half of 2^n - 1
        constexpr double half8 = 127.5;
        constexpr double half16 = 32767.5;
        constexpr double half24 = 8388607.5;
        constexpr double half32 = 2147483647.5;

        inline double clamp_sample(float s) noexcept {
            if (std::isnan(s)) {
                return 0.0;
            }
            return s > 1.f ? 1.0 : (s < -1.f ? -1.0 : static_cast<double>(s));
        }

        inline long long quantize_signed(float s, double max) noexcept {
            return std::llround(clamp_sample(s) * max);
        }

        inline long long quantize_unsigned(float s, double half) noexcept {
            return std::llround((clamp_sample(s) + 1.0) * half);
        }

        // Encoders

        void encode_s8(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                dst[i] = static_cast<uint8_t>(static_cast<int8_t>(quantize_signed(src[i], max8)));
            }
        }

        void encode_u8(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                dst[i] = static_cast<uint8_t>(quantize_unsigned(src[i], half8));
            }
        }

        void encode_s16(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                auto v = static_cast<int16_t>(quantize_signed(src[i], max16));
                store_le16(dst + i * 2, static_cast<uint16_t>(v));
            }
        }

        void encode_u16(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                store_le16(dst + i * 2, static_cast<uint16_t>(quantize_unsigned(src[i], half16)));
            }
        }

        inline void pack24(uint8_t* dst, uint32_t v) noexcept {
            dst[0] = static_cast<uint8_t>(v & 0xFF);
            dst[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
            dst[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
        }

        void encode_s24(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                auto v = static_cast<int32_t>(quantize_signed(src[i], max24));
                pack24(dst + i * 3, static_cast<uint32_t>(v));
            }
        }

        void encode_u24(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                pack24(dst + i * 3, static_cast<uint32_t>(quantize_unsigned(src[i], half24)));
            }
        }

        void encode_s32(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                auto v = static_cast<int32_t>(quantize_signed(src[i], max32));
                store_le32(dst + i * 4, static_cast<uint32_t>(v));
            }
        }

        void encode_u32(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                store_le32(dst + i * 4, static_cast<uint32_t>(quantize_unsigned(src[i], half32)));
            }
        }

        void encode_f32(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                uint32_t bits;
                std::memcpy(&bits, &src[i], sizeof(bits));
                store_le32(dst + i * 4, bits);
            }
        }

        void encode_f64(uint8_t* dst, const float* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                const double d = src[i];
                uint64_t bits;
                std::memcpy(&bits, &d, sizeof(bits));
                store_le64(dst + i * 8, bits);
            }
        }

        // Decoders

        void decode_s8(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                dst[i] = static_cast<float>(static_cast<int8_t>(src[i]) / max8);
            }
        }

        void decode_u8(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                dst[i] = static_cast<float>(src[i] / half8 - 1.0);
            }
        }

        void decode_s16(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                auto v = static_cast<int16_t>(load_le16(src + i * 2));
                dst[i] = static_cast<float>(v / max16);
            }
        }

        void decode_u16(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                dst[i] = static_cast<float>(load_le16(src + i * 2) / half16 - 1.0);
            }
        }

        inline uint32_t unpack24(const uint8_t* src) noexcept {
            return static_cast<uint32_t>(src[0])
                   | (static_cast<uint32_t>(src[1]) << 8)
                   | (static_cast<uint32_t>(src[2]) << 16);
        }

        void decode_s24(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                uint32_t raw = unpack24(src + i * 3);
                if (raw & 0x800000u) {
                    raw |= 0xFF000000u;
                }
                dst[i] = static_cast<float>(static_cast<int32_t>(raw) / max24);
            }
        }

        void decode_u24(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                dst[i] = static_cast<float>(unpack24(src + i * 3) / half24 - 1.0);
            }
        }

        void decode_s32(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                auto v = static_cast<int32_t>(load_le32(src + i * 4));
                dst[i] = static_cast<float>(v / max32);
            }
        }

        void decode_u32(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                dst[i] = static_cast<float>(load_le32(src + i * 4) / half32 - 1.0);
            }
        }

        void decode_f32(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                const uint32_t bits = load_le32(src + i * 4);
                std::memcpy(&dst[i], &bits, sizeof(bits));
            }
        }

        void decode_f64(float* dst, const uint8_t* src, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                const uint64_t bits = load_le64(src + i * 8);
                double d;
                std::memcpy(&d, &bits, sizeof(d));
                dst[i] = static_cast<float>(d);
            }
        }

        void check_depth(unsigned bit_depth, bool floating_point) {
            if (floating_point) {
                if (bit_depth < 32 || bit_depth > 64) {
                    throw out_of_range_error("Floating point bit depth out of range [32, 64]: " +
                                             std::to_string(bit_depth));
                }
                if (bit_depth != 32 && bit_depth != 64) {
                    throw format_error("Unsupported floating point bit depth: " + std::to_string(bit_depth));
                }
            } else {
                if (bit_depth < 8 || bit_depth > 32) {
                    throw out_of_range_error("Integer bit depth out of range [8, 32]: " +
                                             std::to_string(bit_depth));
                }
                if (bit_depth % 8 != 0) {
                    throw format_error("Unsupported integer bit depth: " + std::to_string(bit_depth));
                }
            }
        }
    } // anonymous namespace

    std::size_t bytes_per_sample(unsigned bit_depth, bool floating_point) {
        check_depth(bit_depth, floating_point);
        return bit_depth / 8;
    }

    encoder_func_t get_encoder(unsigned bit_depth, bool is_signed, bool floating_point) {
        check_depth(bit_depth, floating_point);
        if (floating_point) {
            return bit_depth == 32 ? encode_f32 : encode_f64;
        }
        switch (bit_depth) {
            case 8:  return is_signed ? encode_s8 : encode_u8;
            case 16: return is_signed ? encode_s16 : encode_u16;
            case 24: return is_signed ? encode_s24 : encode_u24;
            default: return is_signed ? encode_s32 : encode_u32;
        }
    }

    encoder_func_t get_encoder(const audio_format& fmt) {
        return get_encoder(fmt.bit_depth(), fmt.is_signed(), fmt.is_float());
    }

    decoder_func_t get_decoder(unsigned bit_depth, bool is_signed, bool floating_point) {
        check_depth(bit_depth, floating_point);
        if (floating_point) {
            return bit_depth == 32 ? decode_f32 : decode_f64;
        }
        switch (bit_depth) {
            case 8:  return is_signed ? decode_s8 : decode_u8;
            case 16: return is_signed ? decode_s16 : decode_u16;
            case 24: return is_signed ? decode_s24 : decode_u24;
            default: return is_signed ? decode_s32 : decode_u32;
        }
    }

    decoder_func_t get_decoder(const audio_format& fmt) {
        return get_decoder(fmt.bit_depth(), fmt.is_signed(), fmt.is_float());
    }

    std::vector<uint8_t> to_pcm(const float* samples, std::size_t count,
                                unsigned bit_depth, bool is_signed, bool floating_point) {
        auto encode = get_encoder(bit_depth, is_signed, floating_point);
        std::vector<uint8_t> out(count * (bit_depth / 8));
        if (count > 0) {
            encode(out.data(), samples, count);
        }
        return out;
    }

    std::vector<uint8_t> to_pcm(const std::vector<float>& samples, const audio_format& fmt) {
        return to_pcm(samples.data(), samples.size(), fmt.bit_depth(), fmt.is_signed(), fmt.is_float());
    }

    std::vector<float> from_pcm(const uint8_t* bytes, std::size_t size,
                                unsigned bit_depth, bool is_signed, bool floating_point) {
        auto decode = get_decoder(bit_depth, is_signed, floating_point);
        const std::size_t count = size / (bit_depth / 8);
        std::vector<float> out(count);
        if (count > 0) {
            decode(out.data(), bytes, count);
        }
        return out;
    }

    std::vector<float> from_pcm(const std::vector<uint8_t>& bytes, const audio_format& fmt) {
        return from_pcm(bytes.data(), bytes.size(), fmt.bit_depth(), fmt.is_signed(), fmt.is_float());
    }

    std::vector<uint8_t> to_8bit(const std::vector<float>& samples, bool is_signed) {
        return to_pcm(samples.data(), samples.size(), 8, is_signed);
    }

    std::vector<uint8_t> to_16bit(const std::vector<float>& samples, bool is_signed) {
        return to_pcm(samples.data(), samples.size(), 16, is_signed);
    }

    std::vector<uint8_t> to_24bit(const std::vector<float>& samples, bool is_signed) {
        return to_pcm(samples.data(), samples.size(), 24, is_signed);
    }

    std::vector<uint8_t> to_32bit(const std::vector<float>& samples, bool is_signed) {
        return to_pcm(samples.data(), samples.size(), 32, is_signed);
    }

    std::vector<uint8_t> to_float(const std::vector<float>& samples) {
        return to_pcm(samples.data(), samples.size(), 32, true, true);
    }

    std::vector<uint8_t> to_double(const std::vector<float>& samples) {
        return to_pcm(samples.data(), samples.size(), 64, true, true);
    }

    std::vector<float> from_8bit(const std::vector<uint8_t>& bytes, bool is_signed) {
        return from_pcm(bytes.data(), bytes.size(), 8, is_signed);
    }

    std::vector<float> from_16bit(const std::vector<uint8_t>& bytes, bool is_signed) {
        return from_pcm(bytes.data(), bytes.size(), 16, is_signed);
    }

    std::vector<float> from_24bit(const std::vector<uint8_t>& bytes, bool is_signed) {
        return from_pcm(bytes.data(), bytes.size(), 24, is_signed);
    }

    std::vector<float> from_32bit(const std::vector<uint8_t>& bytes, bool is_signed) {
        return from_pcm(bytes.data(), bytes.size(), 32, is_signed);
    }

    std::vector<float> from_float(const std::vector<uint8_t>& bytes) {
        return from_pcm(bytes.data(), bytes.size(), 32, true, true);
    }

    std::vector<float> from_double(const std::vector<uint8_t>& bytes) {
        return from_pcm(bytes.data(), bytes.size(), 64, true, true);
    }
}
