#include <doctest/doctest.h>
#include <audiocore/audio_output.hh>
#include <audiocore/buffered_audio_input.hh>
#include <audiocore/test_tone_input.hh>
#include "test_helpers.hh"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <memory>
#include <thread>
#include <vector>

using namespace audiocore;
using namespace audiocore::test;

TEST_SUITE("Core::ThreadSafety") {
    TEST_CASE("producer and consumer preserve FIFO order") {
        constexpr std::size_t total = 200000;
        constexpr std::size_t chunk = 7;

        auto dispatcher = std::make_shared<event_dispatcher>();
        push_audio_input input(1, 48000, dispatcher);
        input.set_buffer_size(16);
        input.start();

        std::atomic<bool> done{false};
        std::thread producer([&] {
            std::vector<float> data(chunk);
            std::size_t next = 1;
            // zero padding after the payload flushes the last samples past the threshold
            while (!done) {
                if (input.capacity() - input.sample_count() < chunk) {
                    std::this_thread::yield();
                    continue;
                }
                for (std::size_t i = 0; i < chunk; i++) {
                    data[i] = next <= total ? static_cast<float>(next++) : 0.0f;
                }
                input.write(data);
            }
        });

        std::vector<float> out(13);
        std::size_t expected = 1;
        std::size_t errors = 0;
        while (expected <= total) {
            std::fill(out.begin(), out.end(), 0.0f);
            input.get_frames(out.data(), 13);
            for (float s : out) {
                if (s == 0.0f) {
                    continue;
                }
                if (s != static_cast<float>(expected)) {
                    errors++;
                }
                expected = static_cast<std::size_t>(s) + 1;
            }
        }
        done = true;
        producer.join();

        CHECK(errors == 0);
        CHECK(expected == total + 1);
    }

    TEST_CASE("concurrent writes never exceed capacity") {
        auto dispatcher = std::make_shared<event_dispatcher>();
        push_audio_input input(2, 48000, dispatcher);
        input.set_buffer_size(64);
        input.start();

        std::atomic<std::size_t> dropped{0};
        input.set_overflow_callback([&](buffered_audio_input&, std::size_t n) { dropped += n; });

        std::atomic<bool> done{false};
        std::atomic<bool> over_capacity{false};
        std::thread producer([&] {
            std::vector<float> data(50, 0.5f);
            for (int i = 0; i < 20000; i++) {
                input.write(data);
                if (input.sample_count() > input.capacity()) {
                    over_capacity = true;
                }
            }
            done = true;
        });

        std::vector<float> out(64);
        std::size_t read = 0;
        while (!done) {
            std::fill(out.begin(), out.end(), 0.0f);
            input.get_frames(out.data(), 32);
            for (float s : out) {
                if (s != 0.0f) {
                    read++;
                }
            }
        }
        producer.join();
        dispatcher->wait_idle();

        CHECK_FALSE(over_capacity);
        CHECK(input.sample_count() <= input.capacity());
        // everything written was either read, dropped or is still buffered
        CHECK(read + dropped + input.sample_count() == 20000u * 50u);
    }

    TEST_CASE("last reported state matches the final state") {
        auto dispatcher = std::make_shared<event_dispatcher>();
        push_audio_input input(2, 48000, dispatcher);
        input.set_buffer_size(8);

        auto recorder = std::make_shared<state_recorder>();
        input.set_state_callback([recorder](audio_input&, playback_state s) { recorder->record(s); });

        std::atomic<bool> done{false};
        std::thread producer([&] {
            const std::vector<float> data(8, 0.5f);
            while (!done) {
                input.write(data);
            }
        });
        std::thread consumer([&] {
            std::vector<float> out(32);
            while (!done) {
                input.get_frames(out.data(), 16);
            }
        });

        for (int i = 0; i < 5000; i++) {
            input.start();
            std::this_thread::yield();
            input.stop();
        }
        input.start();
        done = true;
        producer.join();
        consumer.join();

        auto states = recorder->states();
        REQUIRE_FALSE(states.empty());
        CHECK(states.back() == input.state());
    }

    TEST_CASE("control thread changes volume and inputs while rendering") {
        audio_output out(2, 48000);
        auto tone = std::make_shared<test_tone_input>(2, 48000, 440);
        out.add_input(tone);

        std::atomic<bool> done{false};
        std::thread control([&] {
            auto extra = std::make_shared<test_tone_input>(2, 48000, 660);
            for (int i = 0; i < 2000; i++) {
                tone->set_volume(-(i % 40));
                tone->transition_volume(-(i % 20), std::chrono::milliseconds(5));
                if (i % 2 == 0) {
                    out.add_input(extra);
                } else {
                    out.remove_input(extra);
                }
                if (i % 100 == 0) {
                    tone->stop();
                    tone->start();
                }
            }
            done = true;
        });

        bool finite = true;
        while (!done) {
            const float* mix = out.get_input_frames(128);
            for (std::size_t i = 0; i < 256; i++) {
                if (!std::isfinite(mix[i]) || std::fabs(mix[i]) > 2.0f) {
                    finite = false;
                }
            }
        }
        control.join();
        CHECK(finite);
    }
}
