#ifndef WEB_SOCKET_CLIENT_COMPLETION_HPP
#define WEB_SOCKET_CLIENT_COMPLETION_HPP

/**
 * @file Completion.hpp
 *
 * This module declares the WebSocketClient::Completion class.
 *
 * © 2018 by Richard Walters
 */

#include <chrono>
#include <functional>
#include <memory>
#include <WebSocketClient/Error.hpp>

namespace WebSocketClient {

    /**
     * This holds the outcome of an asynchronous operation.  The outcome
     * can be set only once; whichever of Succeed or Fail is called first
     * wins, and later calls have no effect.
     */
    class Completion {
        // Types
    public:
        /**
         * This is the type of function called when the operation
         * completes.
         *
         * @param[in] error
         *     This describes the failure, if any.  Its kind is
         *     Error::Kind::None if the operation succeeded.
         */
        typedef std::function< void(const Error& error) > CompletionDelegate;

        // Lifecycle management
    public:
        ~Completion() noexcept;
        Completion(const Completion&) = delete;
        Completion(Completion&&) noexcept;
        Completion& operator=(const Completion&) = delete;
        Completion& operator=(Completion&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        Completion();

        /**
         * This function makes a completion which has already succeeded.
         *
         * @return
         *     The completion is returned.
         */
        static std::shared_ptr< Completion > MakeSucceeded();

        /**
         * This function makes a completion which has already failed.
         *
         * @param[in] error
         *     This describes the failure.
         *
         * @return
         *     The completion is returned.
         */
        static std::shared_ptr< Completion > MakeFailed(const Error& error);

        /**
         * This method marks the operation as succeeded.
         *
         * @return
         *     An indication of whether or not this call set the outcome
         *     is returned.
         */
        bool Succeed();

        /**
         * This method marks the operation as failed.
         *
         * @param[in] error
         *     This describes the failure.
         *
         * @return
         *     An indication of whether or not this call set the outcome
         *     is returned.
         */
        bool Fail(const Error& error);

        /**
         * This method indicates whether or not the operation has completed.
         *
         * @return
         *     An indication of whether or not the operation has completed
         *     is returned.
         */
        bool IsComplete() const;

        /**
         * This method returns the failure, if any.
         *
         * @return
         *     The failure is returned.  Its kind is Error::Kind::None
         *     if the operation succeeded or hasn't completed yet.
         */
        Error GetError() const;

        /**
         * This method registers a function to call when the operation
         * completes.  If it has already completed, the function is
         * called right away, on the calling thread; otherwise it's
         * called on the thread that completes the operation.
         *
         * @param[in] completionDelegate
         *     This is the function to call when the operation completes.
         */
        void OnComplete(CompletionDelegate completionDelegate);

        /**
         * This method waits for the operation to complete.  It must not be
         * called from the event loop thread that will complete it.
         *
         * @param[in] relativeTime
         *     This is the maximum amount of time to wait.
         *
         * @return
         *     An indication of whether or not the operation completed
         *     in time is returned.
         */
        bool Await(const std::chrono::milliseconds& relativeTime) const;

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
        std::unique_ptr< Impl > impl_;
    };

}

#endif /* WEB_SOCKET_CLIENT_COMPLETION_HPP */
