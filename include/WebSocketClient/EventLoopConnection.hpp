#ifndef WEB_SOCKET_CLIENT_EVENT_LOOP_CONNECTION_HPP
#define WEB_SOCKET_CLIENT_EVENT_LOOP_CONNECTION_HPP

/**
 * @file EventLoopConnection.hpp
 *
 * This module declares the WebSocketClient::EventLoopConnection class.
 *
 * © 2018 by Richard Walters
 */

#include <Http/Connection.hpp>
#include <memory>
#include <stdint.h>
#include <string>
#include <vector>
#include <WebSocketClient/EventLoop.hpp>

namespace WebSocketClient {

    /**
     * This wraps a connection so that its data received and broken
     * delegates are called on one particular event loop, in the order
     * the underlying connection reported them.
     *
     * Data which arrives while no data received delegate is set
     * is held, and handed to the next delegate that is set.
     */
    class EventLoopConnection
        : public Http::Connection
    {
        // Lifecycle management
    public:
        ~EventLoopConnection() noexcept;
        EventLoopConnection(const EventLoopConnection&) = delete;
        EventLoopConnection(EventLoopConnection&&) noexcept = delete;
        EventLoopConnection& operator=(const EventLoopConnection&) = delete;
        EventLoopConnection& operator=(EventLoopConnection&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This function binds the given connection to the given loop.
         *
         * @param[in] inner
         *     This is the connection to bind.
         *
         * @param[in] loop
         *     This is the loop on which to call the connection's
         *     delegates.
         *
         * @return
         *     The bound connection is returned.
         */
        static std::shared_ptr< EventLoopConnection > Bind(
            std::shared_ptr< Http::Connection > inner,
            std::shared_ptr< EventLoop > loop
        );

        /**
         * This method returns the loop to which the connection is bound.
         *
         * @return
         *     The loop to which the connection is bound is returned.
         */
        std::shared_ptr< EventLoop > GetLoop() const;

        // Http::Connection
    public:
        virtual std::string GetPeerAddress() override;
        virtual std::string GetPeerId() override;
        virtual void SetDataReceivedDelegate(DataReceivedDelegate newDataReceivedDelegate) override;
        virtual void SetBrokenDelegate(BrokenDelegate newBrokenDelegate) override;
        virtual void SendData(const std::vector< uint8_t >& data) override;
        virtual void Break(bool clean) override;

        // Private methods
    private:
        /**
         * This is the constructor used by Bind.
         */
        EventLoopConnection();

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

#endif /* WEB_SOCKET_CLIENT_EVENT_LOOP_CONNECTION_HPP */
