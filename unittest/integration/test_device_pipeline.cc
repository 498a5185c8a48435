#include <doctest/doctest.h>
#include <audiocore/backends/null/null_backend.hh>
#include <audiocore/device_input.hh>
#include <audiocore/device_output.hh>
#include <audiocore/sdk/pcm_codec.hh>
#include <audiocore/error.hh>
#include "test_helpers.hh"
#include <memory>
#include <stdexcept>
#include <vector>

using namespace audiocore;
using namespace audiocore::test;

namespace {
    class failing_input : public audio_input {
    public:
        failing_input(channels_t channels, sample_rate_t sample_rate)
            : audio_input(channels, sample_rate) {
            start();
        }

        void get_frames(float*, frames_t) override {
            throw std::runtime_error("input failure");
        }
    };

    audio_spec s16_spec(channels_t channels, sample_rate_t freq) {
        audio_spec spec;
        spec.format = audio_format(16, sample_type::signed_integer);
        spec.channels = channels;
        spec.freq = freq;
        return spec;
    }

    std::shared_ptr<null_backend> make_backend(frames_t buffer_frames) {
        auto backend = std::make_shared<null_backend>();
        backend->init();
        backend->set_buffer_frames(buffer_frames);
        return backend;
    }
}

TEST_SUITE("Integration::DevicePipeline") {
    TEST_CASE("device output encodes the mix") {
        auto backend = make_backend(480);
        device_output out(backend, s16_spec(2, 48000));
        CHECK(out.buffer_size() == 480);
        CHECK(out.latency() == 10);
        CHECK(out.device_spec().channels == 2);

        auto input = std::make_shared<constant_input>(2, 48000, 0.5f);
        input->start();
        out.add_input(input);

        // paused until started
        CHECK(backend->pump(256) == 0);

        out.start();
        CHECK(out.state() == playback_state::playing);
        CHECK(backend->pump(256) == 1);

        auto decoded = pcm::from_16bit(backend->last_output(out.device_handle()));
        REQUIRE(decoded.size() == 512);
        for (float s : decoded) {
            CHECK(s == doctest::Approx(0.5f).epsilon(1e-4));
        }

        out.stop();
        CHECK(backend->pump(256) == 0);
    }

    TEST_CASE("unsigned 8-bit output renders silence at mid scale") {
        auto backend = make_backend(64);
        audio_spec spec;
        spec.format = audio_format(8, sample_type::unsigned_integer);
        spec.channels = 1;
        spec.freq = 8000;
        device_output out(backend, spec);
        out.start();

        CHECK(backend->pump(16) == 1);
        auto bytes = backend->last_output(out.device_handle());
        REQUIRE(bytes.size() == 16);
        for (auto b : bytes) {
            CHECK(b == 128);
        }
    }

    TEST_CASE("render failures become silence") {
        auto backend = make_backend(64);
        device_output out(backend, s16_spec(1, 8000));
        out.add_input(std::make_shared<failing_input>(1, 8000));
        out.start();

        CHECK_NOTHROW(backend->pump(32));
        auto decoded = pcm::from_16bit(backend->last_output(out.device_handle()));
        REQUIRE(decoded.size() == 32);
        for (float s : decoded) {
            CHECK(s == 0.0f);
        }
    }

    TEST_CASE("device output construction failures") {
        auto backend = make_backend(64);

        SUBCASE("unknown device") {
            CHECK_THROWS_AS(device_output(backend, s16_spec(2, 44100), 99), device_error);
            CHECK(backend->open_device_count() == 0);
        }

        SUBCASE("codec cannot encode the format") {
            audio_spec spec = s16_spec(2, 44100);
            spec.format = audio_format(64, sample_type::signed_integer);
            CHECK_THROWS_AS(device_output(backend, spec), out_of_range_error);
        }

        SUBCASE("no backend") {
            CHECK_THROWS_AS(device_output(nullptr, s16_spec(2, 44100)), device_error);
        }

        SUBCASE("backend not initialised") {
            auto idle = std::make_shared<null_backend>();
            CHECK_THROWS_AS(device_output(idle, s16_spec(2, 44100)), std::runtime_error);
        }
    }

    TEST_CASE("device closes with its output") {
        auto backend = make_backend(64);
        {
            device_output out(backend, s16_spec(2, 44100));
            CHECK(backend->open_device_count() == 1);
        }
        CHECK(backend->open_device_count() == 0);
    }

    TEST_CASE("device input buffers captured frames") {
        auto backend = make_backend(256);
        backend->set_capture_source([](float* out, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                out[i] = 0.25f;
            }
        });

        auto dispatcher = std::make_shared<event_dispatcher>();
        device_input mic(backend, s16_spec(1, 44100), default_device_id, dispatcher);
        CHECK(mic.hardware_buffer_size() == 256);
        CHECK(mic.buffer_size() == 256);
        CHECK(mic.latency() == 5);

        // stopped: stream paused, nothing captured
        CHECK(backend->pump(256) == 0);

        mic.start();
        CHECK(mic.state() == playback_state::buffering);
        backend->pump(128);
        CHECK(mic.state() == playback_state::buffering);
        backend->pump(128);
        CHECK(mic.state() == playback_state::playing);
        CHECK(mic.frame_count() == 256);

        std::vector<float> out(256, 0.0f);
        mic.get_frames(out.data(), 256);
        for (float s : out) {
            CHECK(s == doctest::Approx(0.25f).epsilon(1e-4));
        }

        mic.stop();
        CHECK(mic.state() == playback_state::stopped);
        CHECK(mic.sample_count() == 0);
        CHECK(backend->pump(256) == 0);
    }

    TEST_CASE("capture overflow does not reach the backend") {
        auto backend = make_backend(64);
        auto dispatcher = std::make_shared<event_dispatcher>();
        device_input mic(backend, s16_spec(1, 8000), default_device_id, dispatcher);
        mic.set_overflow_policy(overflow_policy::strict);
        mic.start();

        // 64 frame threshold, 128 sample ring
        for (int i = 0; i < 4; i++) {
            CHECK_NOTHROW(backend->pump(64));
        }
        CHECK(mic.sample_count() == 128);
    }

    TEST_CASE("echo pipeline routes capture to playback") {
        auto backend = make_backend(256);
        float phase = 0.0f;
        backend->set_capture_source([&phase](float* out, std::size_t samples) {
            for (std::size_t i = 0; i < samples; i++) {
                out[i] = phase;
                phase = phase >= 0.5f ? -0.5f : phase + 0.01f;
            }
        });

        const audio_spec spec = s16_spec(1, 44100);
        auto dispatcher = std::make_shared<event_dispatcher>();
        device_output speakers(backend, spec);
        auto mic = std::make_shared<device_input>(backend, spec, default_device_id, dispatcher);
        speakers.add_input(mic);

        speakers.start();
        mic->start();

        // playback handle renders before capture in each pump
        backend->pump(256);
        auto first = pcm::from_16bit(backend->last_output(speakers.device_handle()));
        REQUIRE(first.size() == 256);
        for (float s : first) {
            CHECK(s == 0.0f);
        }
        CHECK(mic->state() == playback_state::playing);

        backend->pump(256);
        auto second = pcm::from_16bit(backend->last_output(speakers.device_handle()));
        REQUIRE(second.size() == 256);
        CHECK(second[0] == doctest::Approx(0.0f));
        CHECK(second[1] == doctest::Approx(0.01f).epsilon(0.01));
        CHECK(second[10] == doctest::Approx(0.1f).epsilon(0.01));

        mic->stop();
        speakers.stop();
        speakers.remove_input(mic);
    }

    TEST_CASE("recording requires a recording backend") {
        CHECK_THROWS_AS(device_input(nullptr, s16_spec(1, 44100)), device_error);
    }
}
