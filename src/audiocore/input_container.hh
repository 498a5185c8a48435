//
// Copy-on-write set of inputs attached to an output
//

#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace audiocore {
    class audio_input;

    // Writers build a new vector and publish it; the render thread only
    // copies the published pointer, so it never waits on add/remove work.
    class input_container {
    public:
        using list_t = std::vector<std::shared_ptr<audio_input>>;
        using snapshot_t = std::shared_ptr<const list_t>;

        input_container()
            : m_inputs(std::make_shared<const list_t>()) {}

        input_container(const input_container&) = delete;
        input_container& operator=(const input_container&) = delete;

        // false if already present
        bool add(std::shared_ptr<audio_input> input) {
            std::unique_lock lock(m_mutex);
            if (contains_locked(input.get())) {
                return false;
            }
            auto next = std::make_shared<list_t>(*m_inputs);
            next->push_back(std::move(input));
            m_inputs = std::move(next);
            return true;
        }

        // false if not present
        bool remove(const audio_input* input) {
            std::unique_lock lock(m_mutex);
            if (!contains_locked(input)) {
                return false;
            }
            auto next = std::make_shared<list_t>();
            next->reserve(m_inputs->size());
            for (const auto& p : *m_inputs) {
                if (p.get() != input) {
                    next->push_back(p);
                }
            }
            m_inputs = std::move(next);
            return true;
        }

        bool contains(const audio_input* input) const {
            std::shared_lock lock(m_mutex);
            return contains_locked(input);
        }

        snapshot_t snapshot() const {
            std::shared_lock lock(m_mutex);
            return m_inputs;
        }

        size_t size() const {
            std::shared_lock lock(m_mutex);
            return m_inputs->size();
        }

    private:
        bool contains_locked(const audio_input* input) const {
            return std::any_of(m_inputs->begin(), m_inputs->end(),
                [input](const std::shared_ptr<audio_input>& p) { return p.get() == input; });
        }

        mutable std::shared_mutex m_mutex;
        snapshot_t m_inputs;
    };
}
