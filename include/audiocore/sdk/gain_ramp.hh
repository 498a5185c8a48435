/**
 * @file gain_ramp.hh
 * @brief Linear per-frame gain transitions
 * @ingroup sdk
 */

#pragma once

#include <audiocore/sdk/types.hh>
#include <audiocore/sdk/export_audiocore_sdk.h>

namespace audiocore {

    /// Linear gain for a level in dBFS (0 dBFS == 1.0)
    AUDIOCORE_SDK_EXPORT float db_to_gain(int dbfs) noexcept;

    /**
     * @class gain_ramp
     * @brief Linear gain envelope counted in frames
     *
     * start() schedules a ramp from the current gain to a target over a
     * number of frames. Every call to next() consumes one frame. When the
     * last frame is consumed the gain is set to the target exactly, so no
     * accumulated rounding survives the ramp.
     *
     * Not synchronised; the owner serialises access.
     */
    class AUDIOCORE_SDK_EXPORT gain_ramp {
        public:
            gain_ramp() = default;

            /// Jump to @p gain, cancelling any ramp in progress
            void set(float gain) noexcept;

            /**
             * Ramp from the current gain to @p target over @p frames frames.
             * Zero frames behaves like set().
             */
            void start(float target, frames_t frames) noexcept;

            /// Advance one frame and return the gain for that frame
            float next() noexcept;

            [[nodiscard]] float current() const noexcept { return m_gain; }
            [[nodiscard]] float target() const noexcept { return m_target; }
            [[nodiscard]] bool active() const noexcept { return m_remaining > 0; }
            [[nodiscard]] frames_t remaining() const noexcept { return m_remaining; }

        private:
            float    m_gain      = 1.0f;
            float    m_target    = 1.0f;
            float    m_increment = 0.0f;
            frames_t m_remaining = 0;
    };

} // namespace audiocore
