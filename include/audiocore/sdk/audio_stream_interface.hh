#ifndef AUDIOCORE_SDK_AUDIO_STREAM_INTERFACE_HH
#define AUDIOCORE_SDK_AUDIO_STREAM_INTERFACE_HH

#include <cstddef>
#include <cstdint>
#include <audiocore/sdk/export_audiocore_sdk.h>

namespace audiocore {

/**
 * Callback-driven data path between a device and the pipeline.
 *
 * A playback stream asks its callback to fill a byte buffer; a recording
 * stream hands captured bytes to its callback.
 */
class AUDIOCORE_SDK_EXPORT audio_stream_interface {
public:
    virtual ~audio_stream_interface() = default;

    /**
     * Drop any data queued inside the stream.
     */
    virtual void clear() = 0;

    /**
     * Pause the stream.
     * @return true on success, false on failure
     */
    virtual bool pause() = 0;

    /**
     * Resume the stream.
     * @return true on success, false on failure
     */
    virtual bool resume() = 0;

    virtual bool is_paused() const = 0;

    /**
     * Attach the stream to its device so callbacks start flowing.
     * @return true on success, false on failure
     */
    virtual bool bind_to_device() = 0;

    virtual void unbind_from_device() = 0;
};

} // namespace audiocore

#endif // AUDIOCORE_SDK_AUDIO_STREAM_INTERFACE_HH
