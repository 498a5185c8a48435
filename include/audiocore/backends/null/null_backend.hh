/**
 * @file null_backend.hh
 * @brief Hardware-free backend driven by explicit pump() calls
 * @ingroup backends
 */

#ifndef AUDIOCORE_BACKENDS_NULL_BACKEND_HH
#define AUDIOCORE_BACKENDS_NULL_BACKEND_HH

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <audiocore/sdk/audio_backend.hh>
#include <audiocore/export_audiocore.h>

namespace audiocore {

/**
 * @class null_backend
 * @brief Backend without hardware, for tests and headless runs
 * @ingroup backends
 *
 * Reports one playback and one recording device and accepts any spec.
 * Nothing happens on its own: pump() runs the callbacks of open streams
 * on the calling thread, so tests are deterministic.
 *
 * - playback streams render into a byte buffer readable via last_output()
 * - recording streams receive samples produced by the capture source,
 *   encoded to the stream's wire format
 *
 * @code
 * auto backend = std::make_shared<null_backend>();
 * backend->init();
 * device_output out(backend, spec);
 * out.start();
 * backend->pump(256);          // one render period
 * @endcode
 */
class AUDIOCORE_EXPORT null_backend : public audio_backend {
public:
    /// Fills @p samples interleaved float samples for a recording stream
    using capture_source_t = std::function<void(float* out, std::size_t samples)>;

    static constexpr device_id_t playback_device_id = 1;
    static constexpr device_id_t recording_device_id = 2;

    null_backend();
    ~null_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;

    std::vector<device_info> enumerate_devices(device_direction direction) override;
    device_info get_default_device(device_direction direction) override;

    uint32_t open_device(device_direction direction,
                         device_id_t device_id,
                         const audio_spec& spec,
                         audio_spec& obtained_spec) override;
    void close_device(uint32_t device_handle) override;
    frames_t get_device_buffer_frames(uint32_t device_handle) override;

    bool pause_device(uint32_t device_handle) override;
    bool resume_device(uint32_t device_handle) override;
    bool is_device_paused(uint32_t device_handle) override;

    std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) override;

    bool supports_recording() const override;

    // ========================================================================
    // Test controls
    // ========================================================================

    /// Hardware period reported for devices opened afterwards (default 1024)
    void set_buffer_frames(frames_t frames);

    void set_capture_source(capture_source_t source);

    /**
     * Run every unpaused stream on an unpaused device for @p frames frames.
     * @return Number of callbacks invoked
     */
    std::size_t pump(frames_t frames);

    /// Bytes produced by the last playback callback of @p device_handle
    std::vector<uint8_t> last_output(uint32_t device_handle) const;

    [[nodiscard]] std::size_t open_device_count() const;

    struct stream_state;

private:
    struct device_state {
        device_direction direction = device_direction::playback;
        audio_spec spec;
        frames_t buffer_frames = 1024;
        bool paused = false;
        std::vector<std::weak_ptr<stream_state>> streams;
        std::vector<uint8_t> last_output;
    };

    mutable std::mutex m_mutex;
    bool m_initialized = false;
    uint32_t m_next_handle = 1;
    frames_t m_buffer_frames = 1024;
    capture_source_t m_capture_source;
    std::map<uint32_t, device_state> m_devices;
};

} // namespace audiocore

#endif // AUDIOCORE_BACKENDS_NULL_BACKEND_HH
