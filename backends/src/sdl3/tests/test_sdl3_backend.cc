#include <doctest/doctest.h>
#include <audiocore_backends/sdl3/sdl3_backend.hh>
#include "../../../test_common/backend_test_helpers.hh"
#include <memory>

TEST_SUITE("SDL3Backend") {
    TEST_CASE("SDL3 backend creation") {
        auto backend = audiocore::create_sdl3_backend();
        CHECK(backend != nullptr);
        CHECK_FALSE(backend->is_initialized());
        CHECK(backend->get_name() == "SDL3");
        CHECK(backend->supports_recording());
    }

    TEST_CASE("SDL3 initialization lifecycle") {
        audiocore::test::test_backend_initialization(audiocore::create_sdl3_backend());
    }

    TEST_CASE("SDL3 device enumeration") {
        audiocore::test::test_device_enumeration(audiocore::create_sdl3_backend());
    }

    TEST_CASE("SDL3 device open and close") {
        audiocore::test::test_device_open_close(audiocore::create_sdl3_backend());
    }

    TEST_CASE("SDL3 device control") {
        audiocore::test::test_device_control(audiocore::create_sdl3_backend());
    }

    TEST_CASE("SDL3 multiple devices") {
        audiocore::test::test_multiple_devices(audiocore::create_sdl3_backend());
    }

    TEST_CASE("SDL3 stream creation") {
        audiocore::test::test_stream_creation(audiocore::create_sdl3_backend());
    }

    TEST_CASE("SDL3 error conditions") {
        audiocore::test::test_error_conditions(audiocore::create_sdl3_backend());
    }
}
