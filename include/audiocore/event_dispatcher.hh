/**
 * @file event_dispatcher.hh
 * @brief Worker thread delivering notifications off the audio threads
 * @ingroup core
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <audiocore/export_audiocore.h>

namespace audiocore {

    /**
     * @class event_dispatcher
     * @brief Runs queued callbacks on a dedicated worker thread
     *
     * Real-time producers and consumers post small closures here instead of
     * calling user handlers directly, so a slow handler never stalls a
     * hardware callback. Every event carries the token of its owner;
     * cancel() removes an owner's pending events, which the owner does from
     * its destructor.
     *
     * Events are delivered in posting order. An exception escaping a
     * handler is logged and the worker carries on.
     *
     * @code
     * auto dispatcher = event_dispatcher::shared();
     * dispatcher->post(my_token, [] { refresh_meter(); });
     * dispatcher->cancel(my_token);
     * @endcode
     */
    class AUDIOCORE_EXPORT event_dispatcher {
        public:
            using token_t = int;
            using event_t = std::function<void()>;

            event_dispatcher();
            ~event_dispatcher();

            event_dispatcher(const event_dispatcher&) = delete;
            event_dispatcher& operator=(const event_dispatcher&) = delete;

            /**
             * Process-wide dispatcher used by inputs that are not given one.
             */
            static std::shared_ptr<event_dispatcher> shared();

            /**
             * Queue an event. Never waits for handlers to run.
             */
            void post(token_t token, event_t event);

            /**
             * Drop pending events of @p token and wait for a running one to
             * finish. Called from a handler it only drops.
             */
            void cancel(token_t token);

            /**
             * Block until the queue is empty and no handler is running.
             */
            void wait_idle();

            [[nodiscard]] std::size_t pending() const;

        private:
            void run();

            using entry_t = std::pair<token_t, event_t>;

            mutable std::mutex       m_mutex;
            std::condition_variable  m_wakeup;
            std::condition_variable  m_idle;
            std::deque<entry_t>      m_queue;
            bool                     m_busy = false;
            token_t                  m_running_token = 0;
            bool                     m_stop = false;
            std::thread              m_worker;
    };

} // namespace audiocore
