#include <audiocore/event_dispatcher.hh>
#include <failsafe/failsafe.hh>
#include <exception>

namespace audiocore {
    event_dispatcher::event_dispatcher()
        : m_worker([this] { run(); }) {
    }

    event_dispatcher::~event_dispatcher() {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            m_stop = true;
        }
        m_wakeup.notify_all();
        if (m_worker.joinable()) {
            m_worker.join();
        }
    }

    std::shared_ptr<event_dispatcher> event_dispatcher::shared() {
        static std::shared_ptr<event_dispatcher> inst = std::make_shared<event_dispatcher>();
        return inst;
    }

    void event_dispatcher::post(token_t token, event_t event) {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            m_queue.emplace_back(token, std::move(event));
        }
        m_wakeup.notify_one();
    }

    void event_dispatcher::cancel(token_t token) {
        std::unique_lock<std::mutex> lk(m_mutex);
        auto it = m_queue.begin();
        while (it != m_queue.end()) {
            if (it->first == token) {
                it = m_queue.erase(it);
            } else {
                ++it;
            }
        }
        if (std::this_thread::get_id() == m_worker.get_id()) {
            return;
        }
        m_idle.wait(lk, [this, token] { return !(m_busy && m_running_token == token); });
    }

    void event_dispatcher::wait_idle() {
        std::unique_lock<std::mutex> lk(m_mutex);
        m_idle.wait(lk, [this] { return m_queue.empty() && !m_busy; });
    }

    std::size_t event_dispatcher::pending() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_queue.size();
    }

    void event_dispatcher::run() {
        std::unique_lock<std::mutex> lk(m_mutex);
        while (true) {
            m_wakeup.wait(lk, [this] { return m_stop || !m_queue.empty(); });
            if (m_stop && m_queue.empty()) {
                break;
            }

            entry_t entry = std::move(m_queue.front());
            m_queue.pop_front();
            m_busy = true;
            m_running_token = entry.first;
            lk.unlock();

            try {
                entry.second();
            } catch (const std::exception& e) {
                LOG_ERROR("event_dispatcher", "Event handler for token", entry.first, "threw:", e.what());
            } catch (...) {
                LOG_ERROR("event_dispatcher", "Event handler for token", entry.first, "threw a non-standard exception");
            }
            // captured owners may call cancel() from their destructor
            entry.second = nullptr;

            lk.lock();
            m_busy = false;
            m_idle.notify_all();
        }
        m_idle.notify_all();
    }
}
