/**
 * @file EventLoop.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::EventLoop class.
 *
 * © 2018 by Richard Walters
 */

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <WebSocketClient/EventLoop.hpp>

namespace WebSocketClient {

    /**
     * This contains the private properties of an EventLoop instance.
     */
    struct EventLoop::Impl {
        // Properties

        /**
         * This is used to synchronize access to the task queue.
         */
        std::mutex mutex;

        /**
         * This is used to wake up the worker thread when a task
         * is posted or the loop is stopped.
         */
        std::condition_variable wakeCondition;

        /**
         * These are the tasks waiting to run.
         */
        std::deque< Task > tasks;

        /**
         * This flag is set once the loop is told to stop.
         */
        bool stop = false;

        /**
         * This is the worker thread.
         */
        std::thread worker;

        /**
         * This identifies the worker thread.  It's kept apart from
         * the thread object so that it stays valid after joining.
         */
        std::thread::id workerId;

        /**
         * This is used to make sure only one caller joins or
         * detaches the worker thread.
         */
        std::mutex workerMutex;

        /**
         * This flag is set once the worker thread has been joined
         * or detached.
         */
        bool workerReleased = false;

        // Methods

        /**
         * This is the body of the worker thread.  It runs tasks until
         * told to stop and no tasks remain.
         */
        void Worker() {
            std::unique_lock< decltype(mutex) > lock(mutex);
            for (;;) {
                wakeCondition.wait(
                    lock,
                    [this]{ return stop || !tasks.empty(); }
                );
                if (tasks.empty()) {
                    return;
                }
                auto task = std::move(tasks.front());
                tasks.pop_front();
                lock.unlock();
                task();
                task = nullptr;
                lock.lock();
            }
        }
    };

    EventLoop::~EventLoop() noexcept {
        if (impl_ == nullptr) {
            return;
        }
        Stop();
        std::lock_guard< decltype(impl_->workerMutex) > lock(impl_->workerMutex);
        if (!impl_->workerReleased) {
            impl_->workerReleased = true;
            impl_->worker.detach();
        }
    }
    EventLoop::EventLoop(EventLoop&&) noexcept = default;
    EventLoop& EventLoop::operator=(EventLoop&&) noexcept = default;

    EventLoop::EventLoop()
        : impl_(new Impl)
    {
        const auto impl = impl_;
        impl_->worker = std::thread(
            [impl]{
                impl->Worker();
            }
        );
        impl_->workerId = impl_->worker.get_id();
    }

    bool EventLoop::Post(Task task) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->stop) {
            return false;
        }
        impl_->tasks.push_back(std::move(task));
        impl_->wakeCondition.notify_one();
        return true;
    }

    bool EventLoop::IsInLoopThread() const {
        return (std::this_thread::get_id() == impl_->workerId);
    }

    void EventLoop::Stop() {
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->stop = true;
            impl_->wakeCondition.notify_all();
        }
        if (IsInLoopThread()) {
            return;
        }
        std::lock_guard< decltype(impl_->workerMutex) > lock(impl_->workerMutex);
        if (!impl_->workerReleased) {
            impl_->workerReleased = true;
            impl_->worker.join();
        }
    }

}
