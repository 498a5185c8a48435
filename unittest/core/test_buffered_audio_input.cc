#include <doctest/doctest.h>
#include <audiocore/buffered_audio_input.hh>
#include <audiocore/error.hh>
#include "test_helpers.hh"
#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace audiocore;
using namespace audiocore::test;

TEST_SUITE("Core::BufferedInput") {
    TEST_CASE("buffer must be sized before writing") {
        auto dispatcher = std::make_shared<event_dispatcher>();
        push_audio_input input(1, 8000, dispatcher);
        CHECK(input.buffer_size() == 0);
        CHECK(input.capacity() == 0);
        CHECK_THROWS_AS(input.write({1.0f}), usage_error);
        CHECK_THROWS_AS(input.set_buffer_size(0), configuration_error);
    }

    TEST_CASE("capacity holds two buffers of every channel") {
        push_audio_input input(2, 8000);
        input.set_buffer_size(64);
        CHECK(input.buffer_size() == 64);
        CHECK(input.capacity() == 64 * 2 * 2);
        CHECK(input.sample_count() == 0);
    }

    TEST_CASE("threshold crossing starts playback on that write") {
        auto dispatcher = std::make_shared<event_dispatcher>();
        push_audio_input input(2, 8000, dispatcher);
        input.set_buffer_size(4);

        auto recorder = std::make_shared<state_recorder>();
        input.set_state_callback([recorder](audio_input&, playback_state s) { recorder->record(s); });

        input.start();
        CHECK(input.state() == playback_state::buffering);

        input.write(ramp_samples(3));
        CHECK(input.state() == playback_state::buffering);

        input.write(ramp_samples(1, 3.0f));
        CHECK(input.state() == playback_state::playing);
        CHECK(input.frame_count() == 2);

        auto states = recorder->states();
        REQUIRE(states.size() == 2);
        CHECK(states[0] == playback_state::buffering);
        CHECK(states[1] == playback_state::playing);
    }

    TEST_CASE("threshold counts samples regardless of channel count") {
        for (channels_t channels : {channels_t(2), channels_t(6)}) {
            push_audio_input input(channels, 8000);
            input.set_buffer_size(4);
            input.start();

            input.write(std::vector<float>(4, 0.5f));
            CHECK(input.state() == playback_state::playing);
            CHECK(input.capacity() == 4u * channels * 2);
        }
    }

    TEST_CASE("writes while stopped do not start playback") {
        push_audio_input input(1, 8000);
        input.set_buffer_size(2);
        input.write(ramp_samples(4));
        CHECK(input.state() == playback_state::stopped);

        std::vector<float> out(2, -1.0f);
        input.get_frames(out.data(), 2);
        CHECK(out[0] == -1.0f);
    }

    TEST_CASE("underrun falls back to buffering without losing samples") {
        push_audio_input input(1, 8000);
        input.set_buffer_size(4);
        input.start();

        input.write({1.0f, 2.0f, 3.0f, 4.0f});
        REQUIRE(input.state() == playback_state::playing);

        std::vector<float> out(4, 0.0f);
        input.get_frames(out.data(), 4);
        CHECK(out == std::vector<float>{1.0f, 2.0f, 3.0f, 4.0f});

        std::vector<float> silent(4, 0.0f);
        input.get_frames(silent.data(), 4);
        CHECK(input.state() == playback_state::buffering);
        CHECK(silent == std::vector<float>(4, 0.0f));

        input.write({5.0f, 6.0f});
        CHECK(input.state() == playback_state::buffering);
        input.write({7.0f, 8.0f});
        CHECK(input.state() == playback_state::playing);

        std::fill(out.begin(), out.end(), 0.0f);
        input.get_frames(out.data(), 4);
        CHECK(out == std::vector<float>{5.0f, 6.0f, 7.0f, 8.0f});
    }

    TEST_CASE("short read copies what is available") {
        push_audio_input input(1, 8000);
        input.set_buffer_size(2);
        input.start();
        input.write({1.0f, 2.0f, 3.0f});

        std::vector<float> out(5, 0.0f);
        input.get_frames(out.data(), 5);
        CHECK(out == std::vector<float>{1.0f, 2.0f, 3.0f, 0.0f, 0.0f});
        CHECK(input.state() == playback_state::playing);
    }

    TEST_CASE("strict overflow keeps what fitted") {
        // mono, threshold 50 samples, capacity 100
        push_audio_input input(1, 8000);
        input.set_buffer_size(50);
        input.set_overflow_policy(overflow_policy::strict);
        REQUIRE(input.capacity() == 100);
        input.start();

        input.write(ramp_samples(40));
        CHECK(input.state() == playback_state::buffering);

        auto second = ramp_samples(70, 1000.0f);
        CHECK_THROWS_AS(input.write(second), overflow_error);
        CHECK(input.sample_count() == 100);
        CHECK(input.state() == playback_state::playing);

        std::vector<float> out(100, 0.0f);
        input.get_frames(out.data(), 100);
        for (std::size_t i = 0; i < 40; i++) {
            CHECK(out[i] == static_cast<float>(i));
        }
        for (std::size_t i = 0; i < 60; i++) {
            CHECK(out[40 + i] == 1000.0f + static_cast<float>(i));
        }
    }

    TEST_CASE("overflow notifies asynchronously by default") {
        auto dispatcher = std::make_shared<event_dispatcher>();
        push_audio_input input(1, 8000, dispatcher);
        input.set_buffer_size(5);
        CHECK(input.get_overflow_policy() == overflow_policy::notify);

        std::atomic<std::size_t> dropped{0};
        std::atomic<int> overflows{0};
        std::atomic<bool> on_producer_thread{false};
        const auto producer = std::this_thread::get_id();
        input.set_overflow_callback([&](buffered_audio_input&, std::size_t n) {
            dropped += n;
            overflows++;
            if (std::this_thread::get_id() == producer) {
                on_producer_thread = true;
            }
        });

        CHECK_NOTHROW(input.write(ramp_samples(13)));
        CHECK(input.sample_count() == 10);
        CHECK_NOTHROW(input.write(ramp_samples(2)));

        dispatcher->wait_idle();
        CHECK(overflows == 2);
        CHECK(dropped == 5);
        CHECK_FALSE(on_producer_thread);
    }

    TEST_CASE("samples available is posted for accepted writes") {
        auto dispatcher = std::make_shared<event_dispatcher>();
        push_audio_input input(2, 8000, dispatcher);
        input.set_buffer_size(8);

        std::atomic<int> notifications{0};
        std::thread::id handler_thread;
        std::mutex mutex;
        input.set_samples_available_callback([&](buffered_audio_input& self) {
            notifications++;
            std::lock_guard<std::mutex> lk(mutex);
            handler_thread = std::this_thread::get_id();
            CHECK(self.sample_count() > 0);
        });

        input.write(ramp_samples(4));
        input.write(ramp_samples(4));
        dispatcher->wait_idle();

        CHECK(notifications == 2);
        std::lock_guard<std::mutex> lk(mutex);
        CHECK(handler_thread != std::this_thread::get_id());
    }

    TEST_CASE("stop empties the ring") {
        push_audio_input input(1, 8000);
        input.set_buffer_size(2);
        input.start();
        input.write(ramp_samples(3));
        REQUIRE(input.state() == playback_state::playing);

        input.stop();
        CHECK(input.state() == playback_state::stopped);
        CHECK(input.sample_count() == 0);

        input.start();
        CHECK(input.state() == playback_state::buffering);
    }

    TEST_CASE("resizing discards buffered data") {
        push_audio_input input(1, 8000);
        input.set_buffer_size(4);
        input.write(ramp_samples(6));
        input.set_buffer_size(16);
        CHECK(input.sample_count() == 0);
        CHECK(input.capacity() == 32);
    }

    TEST_CASE("gain applies to copied samples") {
        push_audio_input input(1, 8000);
        input.set_buffer_size(2);
        input.set_volume(-20);
        input.start();
        input.write({1.0f, 1.0f});

        std::vector<float> out(4, 0.0f);
        input.get_frames(out.data(), 4);
        CHECK(out[0] == doctest::Approx(0.1f));
        CHECK(out[1] == doctest::Approx(0.1f));
        CHECK(out[2] == 0.0f);
    }

    TEST_CASE("destroying an input drops its pending events") {
        auto dispatcher = std::make_shared<event_dispatcher>();
        std::atomic<bool> release{false};
        dispatcher->post(-1, [&] {
            while (!release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });

        REQUIRE(wait_for([&] { return dispatcher->pending() == 0; }));

        std::atomic<int> calls{0};
        {
            push_audio_input input(1, 8000, dispatcher);
            input.set_buffer_size(4);
            input.set_samples_available_callback([&](buffered_audio_input&) { calls++; });
            input.write({1.0f});
            CHECK(dispatcher->pending() == 1);
        }
        CHECK(dispatcher->pending() == 0);
        release = true;
        dispatcher->wait_idle();
        CHECK(calls == 0);
    }
}
