#include <doctest/doctest.h>
#include <audiocore/test_tone_input.hh>
#include <audiocore/noise_input.hh>
#include <audiocore/error.hh>
#include <cmath>
#include <sstream>
#include <vector>

using namespace audiocore;

namespace {
    std::vector<float> pull(audio_input& input, frames_t frames) {
        std::vector<float> out(frames * input.channels(), 0.0f);
        input.get_frames(out.data(), frames);
        return out;
    }
}

TEST_SUITE("Core::Generators") {
    TEST_CASE("tone starts playing") {
        test_tone_input tone(2, 48000);
        CHECK(tone.state() == playback_state::playing);
        CHECK(tone.frequency() == test_tone_input::default_frequency);
        CHECK(tone.shape() == waveform::sine);
    }

    TEST_CASE("tone frequency must be positive") {
        CHECK_THROWS_AS(test_tone_input(1, 48000, 0), configuration_error);
        test_tone_input tone(1, 48000, 440);
        CHECK_THROWS_AS(tone.set_frequency(0), configuration_error);
        CHECK(tone.frequency() == 440);
        tone.set_frequency(880);
        CHECK(tone.frequency() == 880);
    }

    TEST_CASE("waveform shapes") {
        // one cycle every four frames
        SUBCASE("sine") {
            test_tone_input tone(1, 4, 1, waveform::sine);
            auto out = pull(tone, 4);
            CHECK(out[0] == doctest::Approx(1.0f));
            CHECK(out[1] == doctest::Approx(0.0f));
            CHECK(out[2] == doctest::Approx(-1.0f));
            CHECK(out[3] == doctest::Approx(0.0f));
        }

        SUBCASE("sawtooth") {
            test_tone_input tone(1, 4, 1, waveform::sawtooth);
            auto out = pull(tone, 4);
            CHECK(out[0] == doctest::Approx(-0.5f));
            CHECK(out[1] == doctest::Approx(0.0f));
            CHECK(out[2] == doctest::Approx(0.5f));
            CHECK(out[3] == doctest::Approx(-1.0f));
        }

        SUBCASE("triangle") {
            test_tone_input tone(1, 4, 1, waveform::triangle);
            auto out = pull(tone, 4);
            CHECK(out[0] == doctest::Approx(0.0f));
            CHECK(out[1] == doctest::Approx(1.0f));
            CHECK(out[2] == doctest::Approx(0.0f));
            CHECK(out[3] == doctest::Approx(-1.0f));
        }

        SUBCASE("square") {
            test_tone_input tone(1, 8, 1, waveform::square);
            auto out = pull(tone, 8);
            const float expected[] = {1, 1, 1, -1, -1, -1, -1, 1};
            for (std::size_t i = 0; i < 8; i++) {
                CHECK(out[i] == expected[i]);
            }
        }
    }

    TEST_CASE("frame counter wraps at the sample rate") {
        test_tone_input tone(1, 100, 3, waveform::sawtooth);
        auto first = pull(tone, 100);
        auto second = pull(tone, 100);
        CHECK(first == second);
    }

    TEST_CASE("every channel carries the same value") {
        test_tone_input tone(3, 48000, 997);
        auto out = pull(tone, 64);
        for (std::size_t f = 0; f < 64; f++) {
            CHECK(out[f * 3] == out[f * 3 + 1]);
            CHECK(out[f * 3] == out[f * 3 + 2]);
        }
    }

    TEST_CASE("stopped tone leaves the buffer alone") {
        test_tone_input tone(1, 48000);
        tone.stop();
        auto out = pull(tone, 16);
        for (float s : out) {
            CHECK(s == 0.0f);
        }
    }

    TEST_CASE("tone honours volume") {
        test_tone_input tone(1, 4, 1, waveform::square);
        tone.set_volume(-20);
        auto out = pull(tone, 1);
        CHECK(out[0] == doctest::Approx(0.1f));
    }

    TEST_CASE("seeded noise is reproducible") {
        for (auto type : {noise_type::white, noise_type::pink, noise_type::brown}) {
            INFO("type ", type);
            noise_input a(2, 44100, type, 1234);
            noise_input b(2, 44100, type, 1234);
            CHECK(a.state() == playback_state::playing);
            CHECK(a.type() == type);
            CHECK(pull(a, 256) == pull(b, 256));
        }
    }

    TEST_CASE("noise stays bounded") {
        noise_input white(1, 44100, noise_type::white, 7);
        for (float s : pull(white, 4096)) {
            CHECK(s >= -1.0f);
            CHECK(s <= 1.0f);
        }

        noise_input brown(1, 44100, noise_type::brown, 7);
        for (float s : pull(brown, 4096)) {
            CHECK(std::fabs(s) <= 3.5f);
        }

        noise_input pink(1, 44100, noise_type::pink, 7);
        for (float s : pull(pink, 4096)) {
            CHECK(std::isfinite(s));
        }
    }

    TEST_CASE("noise types differ") {
        noise_input white(1, 44100, noise_type::white, 99);
        noise_input brown(1, 44100, noise_type::brown, 99);
        CHECK(pull(white, 64) != pull(brown, 64));
    }

    TEST_CASE("generator names") {
        std::ostringstream os;
        os << waveform::triangle << ' ' << noise_type::pink;
        CHECK(os.str() == "triangle pink");
    }
}
