/**
 * @file audio_backend.hh
 * @brief Platform audio backend interface
 * @ingroup backends
 */

#ifndef AUDIOCORE_SDK_AUDIO_BACKEND_HH
#define AUDIOCORE_SDK_AUDIO_BACKEND_HH

#include <string>
#include <memory>
#include <vector>
#include <ostream>
#include <audiocore/sdk/audio_format.hh>
#include <audiocore/sdk/types.hh>
#include <audiocore/sdk/audio_stream_interface.hh>
#include <audiocore/sdk/export_audiocore_sdk.h>

namespace audiocore {

/**
 * @enum device_direction
 * @brief Which way audio flows through a device
 * @ingroup backends
 */
enum class device_direction {
    playback,   ///< Output: speakers, headphones
    recording   ///< Input: microphones, line in
};

/**
 * @struct device_info
 * @brief Snapshot of one audio endpoint
 * @ingroup backends
 *
 * Plain value returned by device enumeration; nothing is kept open.
 */
struct device_info {
    device_id_t id = default_device_id;  ///< Backend-assigned identifier
    std::string name;                    ///< Human-readable device name
    bool is_default = false;             ///< True for the system default
    channels_t channels = 2;             ///< Native channel count
    sample_rate_t sample_rate = 44100;   ///< Native sample rate in Hz
};

inline std::ostream& operator<<(std::ostream& os, const device_info& info) {
    os << "device_info{"
       << "id=" << info.id << ", "
       << "name=\"" << info.name << "\", "
       << "default=" << (info.is_default ? "true" : "false") << ", "
       << "channels=" << static_cast<int>(info.channels) << ", "
       << "sample_rate=" << info.sample_rate
       << "}";
    return os;
}

/// Render or capture callback: @p len bytes at @p stream in the stream's wire format
using audio_callback_t = void (*)(void* userdata, uint8_t* stream, int len);

/**
 * @class audio_backend
 * @brief Abstract interface for platform audio subsystems
 * @ingroup backends
 *
 * Device enumeration and the hardware sinks and sources sit behind this
 * interface so the pipeline can be composed with any platform API, or with
 * null_backend in tests. The backend is injected into device_output and
 * device_input; nothing in the core reaches for a global backend.
 *
 * ## Implementing a Backend
 *
 * @code
 * class my_backend : public audio_backend {
 * public:
 *     void init() override { ... }
 *     std::vector<device_info> enumerate_devices(device_direction dir) override { ... }
 *     uint32_t open_device(device_direction dir, device_id_t id,
 *                          const audio_spec& spec, audio_spec& obtained) override { ... }
 *     // ...
 * };
 * @endcode
 *
 * ## Thread Safety
 *
 * - init()/shutdown() are called from the main thread
 * - device operations are thread-safe after init()
 * - stream callbacks run on platform threads
 */
class AUDIOCORE_SDK_EXPORT audio_backend {
public:
    virtual ~audio_backend() = default;

    // ========================================================================
    // Initialization and lifecycle management
    // ========================================================================

    /**
     * Initialize the audio subsystem.
     * @throws std::runtime_error if initialization fails
     */
    virtual void init() = 0;

    /**
     * Shut down the audio subsystem, closing every open device.
     */
    virtual void shutdown() = 0;

    /**
     * @return Backend name (e.g. "SDL3", "Null")
     */
    virtual std::string get_name() const = 0;

    virtual bool is_initialized() const = 0;

    // ========================================================================
    // Device enumeration
    // ========================================================================

    /**
     * List the devices available in one direction.
     */
    virtual std::vector<device_info> enumerate_devices(device_direction direction) = 0;

    virtual device_info get_default_device(device_direction direction) = 0;

    // ========================================================================
    // Device management
    // ========================================================================

    /**
     * Open a device.
     * @param direction Playback or recording
     * @param device_id Id from enumerate_devices(), or default_device_id
     * @param spec Desired stream parameters
     * @param obtained_spec Parameters the device actually runs at
     * @return Handle for the other device calls
     * @throws std::runtime_error if the device cannot be opened
     */
    virtual uint32_t open_device(device_direction direction,
                                 device_id_t device_id,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) = 0;

    /**
     * Close a device. Unknown handles are ignored.
     */
    virtual void close_device(uint32_t device_handle) = 0;

    /**
     * Frames the device moves per hardware period.
     */
    virtual frames_t get_device_buffer_frames(uint32_t device_handle) = 0;

    // ========================================================================
    // Device control
    // ========================================================================

    virtual bool pause_device(uint32_t device_handle) = 0;
    virtual bool resume_device(uint32_t device_handle) = 0;
    virtual bool is_device_paused(uint32_t device_handle) = 0;

    // ========================================================================
    // Stream creation
    // ========================================================================

    /**
     * Create the callback stream for an open device.
     *
     * For playback devices @p callback fills the buffer it is given; for
     * recording devices it receives captured bytes. @p spec is the format
     * the callback exchanges; the backend converts to the device format.
     *
     * @throws std::runtime_error if the stream cannot be created
     */
    virtual std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata
    ) = 0;

    // ========================================================================
    // Backend capabilities
    // ========================================================================

    virtual bool supports_recording() const = 0;

    // ========================================================================
    // Convenience wrappers
    // ========================================================================

    std::vector<device_info> enumerate_playback_devices() {
        return enumerate_devices(device_direction::playback);
    }

    std::vector<device_info> enumerate_recording_devices() {
        return enumerate_devices(device_direction::recording);
    }
};

/// Prints "playback" or "recording"
inline std::ostream& operator<<(std::ostream& os, device_direction direction) {
    return os << (direction == device_direction::playback ? "playback" : "recording");
}

} // namespace audiocore

#endif // AUDIOCORE_SDK_AUDIO_BACKEND_HH
