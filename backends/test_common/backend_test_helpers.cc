#include "backend_test_helpers.hh"
#include <doctest/doctest.h>
#include <cstring>
#include <stdexcept>

namespace audiocore::test {

audio_spec make_test_spec() {
    audio_spec spec;
    spec.format = audio_format(16, sample_type::signed_integer);
    spec.channels = 2;
    spec.freq = 44100;
    return spec;
}

void test_backend_initialization(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    CHECK_FALSE(backend->is_initialized());

    CHECK_NOTHROW(backend->init());
    CHECK(backend->is_initialized());

    // Double init should throw
    CHECK_THROWS_AS(backend->init(), std::runtime_error);

    CHECK_NOTHROW(backend->shutdown());
    CHECK_FALSE(backend->is_initialized());

    // Double shutdown should be safe
    CHECK_NOTHROW(backend->shutdown());
}

void test_device_enumeration(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    CHECK_THROWS_AS(backend->enumerate_playback_devices(), std::runtime_error);

    backend->init();

    // At least the default device is always reported
    auto devices = backend->enumerate_playback_devices();
    REQUIRE_FALSE(devices.empty());
    CHECK(devices.front().is_default);

    for (const auto& dev : devices) {
        CHECK_FALSE(dev.name.empty());
        CHECK(dev.channels > 0);
        CHECK(dev.sample_rate > 0);
    }

    auto default_device = backend->get_default_device(device_direction::playback);
    CHECK_FALSE(default_device.name.empty());
    CHECK(default_device.is_default);

    if (backend->supports_recording()) {
        auto recording_devices = backend->enumerate_recording_devices();
        CHECK_FALSE(recording_devices.empty());

        auto default_recording = backend->get_default_device(device_direction::recording);
        CHECK_FALSE(default_recording.name.empty());
        CHECK(default_recording.is_default);
    }

    backend->shutdown();
}

void test_device_open_close(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    backend->init();

    audio_spec obtained_spec;
    uint32_t handle = 0;

    CHECK_NOTHROW(handle = backend->open_device(device_direction::playback, default_device_id,
                                                make_test_spec(), obtained_spec));
    CHECK(handle != 0);

    CHECK(obtained_spec.channels > 0);
    CHECK(obtained_spec.freq > 0);

    CHECK_NOTHROW(backend->get_device_buffer_frames(handle));

    CHECK_NOTHROW(backend->close_device(handle));

    // Accessing a closed device should throw
    CHECK_THROWS_AS(backend->get_device_buffer_frames(handle), std::runtime_error);

    backend->shutdown();
}

void test_device_control(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    backend->init();

    audio_spec obtained_spec;
    uint32_t handle = backend->open_device(device_direction::playback, default_device_id,
                                           make_test_spec(), obtained_spec);

    CHECK(backend->pause_device(handle));
    CHECK(backend->is_device_paused(handle));

    CHECK(backend->resume_device(handle));
    CHECK_FALSE(backend->is_device_paused(handle));

    backend->close_device(handle);
    backend->shutdown();
}

void test_multiple_devices(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    backend->init();

    audio_spec obtained_spec;
    uint32_t first = backend->open_device(device_direction::playback, default_device_id,
                                          make_test_spec(), obtained_spec);
    uint32_t second = backend->open_device(device_direction::playback, default_device_id,
                                           make_test_spec(), obtained_spec);

    CHECK(first != 0);
    CHECK(second != 0);
    CHECK(first != second);

    CHECK_NOTHROW(backend->close_device(first));
    CHECK_NOTHROW(backend->close_device(second));

    backend->shutdown();
}

void test_stream_creation(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    backend->init();

    audio_spec obtained_spec;
    uint32_t handle = backend->open_device(device_direction::playback, default_device_id,
                                           make_test_spec(), obtained_spec);

    auto callback = [](void* /* userdata */, uint8_t* stream, int len) {
        std::memset(stream, 0, static_cast<size_t>(len));
    };

    auto stream = backend->create_stream(handle, make_test_spec(), callback, nullptr);
    REQUIRE(stream != nullptr);

    CHECK(stream->pause());
    CHECK(stream->is_paused());
    CHECK(stream->resume());
    CHECK_FALSE(stream->is_paused());

    stream.reset();
    backend->close_device(handle);
    backend->shutdown();
}

void test_error_conditions(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    // Operations before init
    CHECK_THROWS_AS(backend->enumerate_playback_devices(), std::runtime_error);
    CHECK_THROWS_AS(backend->get_default_device(device_direction::playback), std::runtime_error);

    audio_spec obtained;
    CHECK_THROWS_AS(backend->open_device(device_direction::playback, default_device_id,
                                         make_test_spec(), obtained), std::runtime_error);

    backend->init();

    uint32_t invalid_handle = 999999;
    CHECK_THROWS_AS(backend->get_device_buffer_frames(invalid_handle), std::runtime_error);
    CHECK_THROWS_AS(backend->is_device_paused(invalid_handle), std::runtime_error);
    CHECK_FALSE(backend->pause_device(invalid_handle));
    CHECK_THROWS_AS(backend->create_stream(invalid_handle, make_test_spec(), nullptr, nullptr),
                    std::runtime_error);
    // close_device ignores unknown handles
    CHECK_NOTHROW(backend->close_device(invalid_handle));

    backend->shutdown();
}

} // namespace audiocore::test
