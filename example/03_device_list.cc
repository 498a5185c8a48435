/**
 * @example 03_device_list.cc
 * @brief Audio device enumeration
 *
 * Lists playback and recording devices and plays a short noise burst on
 * the device selected on the command line.
 */

#include "example_common.hh"
#include <audiocore/device_output.hh>
#include <audiocore/noise_input.hh>
#include <iostream>
#include <string>
#include <thread>
#include <chrono>

namespace {
    void print_devices(const std::vector<audiocore::device_info>& devices) {
        for (size_t i = 0; i < devices.size(); ++i) {
            const auto& info = devices[i];
            std::cout << i << ": " << info.name << " (";
            if (info.channels == 1) {
                std::cout << "Mono";
            } else if (info.channels == 2) {
                std::cout << "Stereo";
            } else {
                std::cout << static_cast<int>(info.channels) << " channels";
            }
            std::cout << ", " << info.sample_rate << " Hz)";
            if (info.is_default) {
                std::cout << " [DEFAULT]";
            }
            std::cout << '\n';
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        auto backend = audiocore::examples::create_default_backend();

        std::cout << "\n=== Playback Devices ===\n";
        auto playback = backend->enumerate_playback_devices();
        print_devices(playback);

        if (backend->supports_recording()) {
            std::cout << "\n=== Recording Devices ===\n";
            print_devices(backend->enumerate_recording_devices());
        }

        if (argc != 2) {
            return 0;
        }

        const auto index = static_cast<size_t>(std::stoul(argv[1]));
        if (index >= playback.size()) {
            std::cerr << "No playback device " << index << '\n';
            return 1;
        }

        const auto& device = playback[index];
        audiocore::audio_spec spec;
        spec.channels = device.channels;
        spec.freq = device.sample_rate;

        audiocore::device_output out(backend, spec, device.id);
        auto noise = std::make_shared<audiocore::noise_input>(spec.channels, spec.freq, audiocore::noise_type::pink);
        noise->set_volume(-20);
        out.add_input(noise);

        std::cout << "\nPlaying pink noise on " << device.name << '\n';
        out.start();
        std::this_thread::sleep_for(std::chrono::seconds(2));
        out.stop();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
