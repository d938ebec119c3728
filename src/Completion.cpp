/**
 * @file Completion.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::Completion class.
 *
 * © 2018 by Richard Walters
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <WebSocketClient/Completion.hpp>
#include <WebSocketClient/Error.hpp>

namespace WebSocketClient {

    /**
     * This contains the private properties of a Completion instance.
     */
    struct Completion::Impl {
        /**
         * This is used to synchronize access to the outcome.
         */
        mutable std::mutex mutex;

        /**
         * This is used to wake up threads waiting for the outcome.
         */
        mutable std::condition_variable completed;

        /**
         * This flag is set once the outcome is known.
         */
        bool complete = false;

        /**
         * This is the outcome.
         */
        Error error;

        /**
         * These are the functions to call once the outcome is known.
         */
        std::vector< CompletionDelegate > completionDelegates;

        /**
         * This method sets the outcome, if it hasn't been set already,
         * and then calls the registered functions without holding
         * the mutex.
         *
         * @param[in] outcome
         *     This is the outcome to set.
         *
         * @return
         *     An indication of whether or not the outcome was set
         *     by this call is returned.
         */
        bool Complete(const Error& outcome) {
            std::unique_lock< decltype(mutex) > lock(mutex);
            if (complete) {
                return false;
            }
            complete = true;
            error = outcome;
            decltype(completionDelegates) delegates;
            delegates.swap(completionDelegates);
            completed.notify_all();
            lock.unlock();
            for (const auto& completionDelegate: delegates) {
                completionDelegate(outcome);
            }
            return true;
        }
    };

    Completion::~Completion() noexcept = default;
    Completion::Completion(Completion&&) noexcept = default;
    Completion& Completion::operator=(Completion&&) noexcept = default;

    Completion::Completion()
        : impl_(new Impl)
    {
    }

    std::shared_ptr< Completion > Completion::MakeSucceeded() {
        const auto completion = std::make_shared< Completion >();
        (void)completion->Succeed();
        return completion;
    }

    std::shared_ptr< Completion > Completion::MakeFailed(const Error& error) {
        const auto completion = std::make_shared< Completion >();
        (void)completion->Fail(error);
        return completion;
    }

    bool Completion::Succeed() {
        return impl_->Complete(Error());
    }

    bool Completion::Fail(const Error& error) {
        return impl_->Complete(error);
    }

    bool Completion::IsComplete() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->complete;
    }

    Error Completion::GetError() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->error;
    }

    void Completion::OnComplete(CompletionDelegate completionDelegate) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (!impl_->complete) {
            impl_->completionDelegates.push_back(completionDelegate);
            return;
        }
        const auto error = impl_->error;
        lock.unlock();
        completionDelegate(error);
    }

    bool Completion::Await(const std::chrono::milliseconds& relativeTime) const {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->completed.wait_for(
            lock,
            relativeTime,
            [this]{ return impl_->complete; }
        );
    }

}
