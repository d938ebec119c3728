#ifndef WEB_SOCKET_CLIENT_EVENT_LOOP_HPP
#define WEB_SOCKET_CLIENT_EVENT_LOOP_HPP

/**
 * @file EventLoop.hpp
 *
 * This module declares the WebSocketClient::EventLoop class.
 *
 * © 2018 by Richard Walters
 */

#include <functional>
#include <memory>

namespace WebSocketClient {

    /**
     * This runs tasks one at a time, in the order they were posted,
     * on a single worker thread owned by the loop.
     */
    class EventLoop {
        // Types
    public:
        /**
         * This is the type of work posted to the loop.
         */
        typedef std::function< void() > Task;

        // Lifecycle management
    public:
        ~EventLoop() noexcept;
        EventLoop(const EventLoop&) = delete;
        EventLoop(EventLoop&&) noexcept;
        EventLoop& operator=(const EventLoop&) = delete;
        EventLoop& operator=(EventLoop&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  It starts the worker thread.
         */
        EventLoop();

        /**
         * This method queues the given task to run on the worker thread.
         *
         * @param[in] task
         *     This is the task to run.
         *
         * @return
         *     An indication of whether or not the task was queued
         *     is returned.  Tasks are refused once the loop is stopped.
         */
        bool Post(Task task);

        /**
         * This method indicates whether or not the calling thread
         * is the loop's worker thread.
         *
         * @return
         *     An indication of whether or not the calling thread
         *     is the loop's worker thread is returned.
         */
        bool IsInLoopThread() const;

        /**
         * This method stops the loop.  Tasks already queued are run first.
         * Unless called from the worker thread itself, it returns only
         * after the worker thread has exited.
         */
        void Stop();

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::shared_ptr< Impl > impl_;
    };

}

#endif /* WEB_SOCKET_CLIENT_EVENT_LOOP_HPP */
