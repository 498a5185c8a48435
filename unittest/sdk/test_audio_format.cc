#include <doctest/doctest.h>
#include <audiocore/sdk/audio_format.hh>
#include <audiocore/sdk/endian.hh>
#include <audiocore/playback_state.hh>
#include <audiocore/error.hh>
#include <sstream>

using namespace audiocore;

TEST_SUITE("SDK::AudioFormat") {
    TEST_CASE("valid formats") {
        for (unsigned depth : {8u, 16u, 24u, 32u, 64u}) {
            CHECK_NOTHROW(audio_format(depth, sample_type::signed_integer));
            CHECK_NOTHROW(audio_format(depth, sample_type::unsigned_integer));
            CHECK(audio_format::is_valid(depth, sample_type::signed_integer));
        }
        CHECK_NOTHROW(audio_format(32, sample_type::floating_point));
        CHECK_NOTHROW(audio_format(64, sample_type::floating_point));
    }

    TEST_CASE("invalid formats fail at construction") {
        SUBCASE("integer width not a power of two") {
            CHECK_THROWS_AS(audio_format(12, sample_type::signed_integer), configuration_error);
            CHECK_THROWS_AS(audio_format(48, sample_type::unsigned_integer), configuration_error);
            CHECK_FALSE(audio_format::is_valid(12, sample_type::signed_integer));
        }

        SUBCASE("integer width out of range") {
            CHECK_THROWS_AS(audio_format(4, sample_type::signed_integer), out_of_range_error);
            CHECK_THROWS_AS(audio_format(128, sample_type::signed_integer), out_of_range_error);
        }

        SUBCASE("float width") {
            CHECK_THROWS_AS(audio_format(16, sample_type::floating_point), out_of_range_error);
            CHECK_THROWS_AS(audio_format(48, sample_type::floating_point), configuration_error);
            CHECK_FALSE(audio_format::is_valid(24, sample_type::floating_point));
        }
    }

    TEST_CASE("format properties") {
        audio_format s24(24, sample_type::signed_integer);
        CHECK(s24.bit_depth() == 24);
        CHECK(s24.bytes_per_sample() == 3);
        CHECK(s24.is_signed());
        CHECK_FALSE(s24.is_float());

        audio_format u8(8, sample_type::unsigned_integer);
        CHECK_FALSE(u8.is_signed());

        auto f = audio_format::float32();
        CHECK(f.is_float());
        CHECK(f.bytes_per_sample() == 4);
        CHECK(f == audio_format(32, sample_type::floating_point));
        CHECK(f != s24);
    }

    TEST_CASE("format printing") {
        std::ostringstream os;
        os << audio_format(16, sample_type::signed_integer) << ' '
           << audio_format(8, sample_type::unsigned_integer) << ' '
           << audio_format::float32();
        CHECK(os.str() == "s16 u8 f32");
    }

    TEST_CASE("default spec") {
        audio_spec spec;
        CHECK(spec.format == audio_format::float32());
        CHECK(spec.channels == 2);
        CHECK(spec.freq == 44100);
    }

    TEST_CASE("stream parameters") {
        CHECK_NOTHROW(validate_stream_params(1, 8000));
        CHECK_THROWS_AS(validate_stream_params(0, 44100), configuration_error);
        CHECK_THROWS_AS(validate_stream_params(2, 0), configuration_error);
    }

    TEST_CASE("little-endian helpers") {
        uint8_t bytes[8] = {};
        store_le16(bytes, 0x1234);
        CHECK(bytes[0] == 0x34);
        CHECK(bytes[1] == 0x12);
        CHECK(load_le16(bytes) == 0x1234);

        store_le32(bytes, 0xDEADBEEF);
        CHECK(bytes[0] == 0xEF);
        CHECK(bytes[3] == 0xDE);
        CHECK(load_le32(bytes) == 0xDEADBEEF);

        store_le64(bytes, 0x0102030405060708ull);
        CHECK(bytes[0] == 0x08);
        CHECK(bytes[7] == 0x01);
        CHECK(load_le64(bytes) == 0x0102030405060708ull);
    }

    TEST_CASE("playback state names") {
        std::ostringstream os;
        os << playback_state::stopped << ' ' << playback_state::buffering << ' ' << playback_state::playing;
        CHECK(os.str() == "stopped buffering playing");
    }
}
