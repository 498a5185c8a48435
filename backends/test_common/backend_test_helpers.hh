#ifndef AUDIOCORE_BACKEND_TEST_HELPERS_HH
#define AUDIOCORE_BACKEND_TEST_HELPERS_HH

#include <audiocore/sdk/audio_backend.hh>
#include <memory>

namespace audiocore::test {

// Conformance checks shared by every backend implementation

void test_backend_initialization(std::unique_ptr<audio_backend> backend);

void test_device_enumeration(std::unique_ptr<audio_backend> backend);

void test_device_open_close(std::unique_ptr<audio_backend> backend);

// pause, resume
void test_device_control(std::unique_ptr<audio_backend> backend);

void test_multiple_devices(std::unique_ptr<audio_backend> backend);

void test_stream_creation(std::unique_ptr<audio_backend> backend);

void test_error_conditions(std::unique_ptr<audio_backend> backend);

// Stereo signed 16-bit at 44.1 kHz
audio_spec make_test_spec();

} // namespace audiocore::test

#endif // AUDIOCORE_BACKEND_TEST_HELPERS_HH
