/**
 * @example 02_echo.cc
 * @brief Route the default recording device to the speakers
 *
 * Monitors the microphone for a few seconds, reporting overflows and
 * state changes of the capture buffer.
 */

#include "example_common.hh"
#include <audiocore/device_input.hh>
#include <audiocore/device_output.hh>
#include <audiocore/error.hh>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <chrono>

int main(int argc, char* argv[]) {
    int seconds = 5;
    if (argc == 2) {
        seconds = std::atoi(argv[1]);
    }

    try {
        auto backend = audiocore::examples::create_default_backend();
        if (!backend->supports_recording()) {
            std::cerr << backend->get_name() << " cannot record\n";
            return 1;
        }

        audiocore::audio_spec spec;
        spec.format = audiocore::audio_format(16, audiocore::sample_type::signed_integer);
        spec.channels = 1;
        spec.freq = 44100;

        auto mic = std::make_shared<audiocore::device_input>(backend, spec);
        mic->set_buffer_size(2 * mic->hardware_buffer_size());
        mic->set_state_callback([](audiocore::audio_input&, audiocore::playback_state state) {
            std::cout << "Microphone: " << state << '\n';
        });
        mic->set_overflow_callback([](audiocore::buffered_audio_input&, std::size_t dropped) {
            std::cout << "Overflow, dropped " << dropped << " samples\n";
        });

        audiocore::device_output speakers(backend, spec);
        speakers.add_input(mic);

        speakers.start();
        mic->start();

        std::cout << "Echoing for " << seconds << " seconds\n";
        std::this_thread::sleep_for(std::chrono::seconds(seconds));

        mic->stop();
        speakers.stop();
    } catch (const audiocore::device_error& e) {
        std::cerr << "Device error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
