//
// Linear gain ramp
//

#include <audiocore/sdk/gain_ramp.hh>
#include <cmath>

namespace audiocore {

    float db_to_gain(int dbfs) noexcept {
        return static_cast<float>(std::pow(10.0, static_cast<double>(dbfs) / 20.0));
    }

    void gain_ramp::set(float gain) noexcept {
        m_gain = gain;
        m_target = gain;
        m_increment = 0.0f;
        m_remaining = 0;
    }

    void gain_ramp::start(float target, frames_t frames) noexcept {
        if (frames == 0) {
            set(target);
            return;
        }
        m_target = target;
        m_increment = (target - m_gain) / static_cast<float>(frames);
        m_remaining = frames;
    }

    float gain_ramp::next() noexcept {
        if (m_remaining > 0) {
            if (--m_remaining == 0) {
                m_gain = m_target;
            } else {
                m_gain += m_increment;
            }
        }
        return m_gain;
    }

} // namespace audiocore
