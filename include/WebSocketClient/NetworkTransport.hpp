#ifndef WEB_SOCKET_CLIENT_NETWORK_TRANSPORT_HPP
#define WEB_SOCKET_CLIENT_NETWORK_TRANSPORT_HPP

/**
 * @file NetworkTransport.hpp
 *
 * This module declares the WebSocketClient::NetworkTransport class.
 *
 * © 2018 by Richard Walters
 */

#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <WebSocketClient/Transport.hpp>

namespace WebSocketClient {

    /**
     * This is the transport which opens TCP connections using
     * SystemAbstractions::NetworkConnection.  Host name resolution and
     * the blocking connect are done on a thread owned by the transport,
     * never on one of the I/O event loops.
     */
    class NetworkTransport
        : public Transport
    {
        // Lifecycle management
    public:
        ~NetworkTransport() noexcept;
        NetworkTransport(const NetworkTransport&) = delete;
        NetworkTransport(NetworkTransport&&) noexcept;
        NetworkTransport& operator=(const NetworkTransport&) = delete;
        NetworkTransport& operator=(NetworkTransport&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        NetworkTransport();

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the transport.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        // Transport
    public:
        virtual void Connect(
            const std::string& host,
            uint16_t port,
            ConnectDelegate connectDelegate
        ) override;

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

#endif /* WEB_SOCKET_CLIENT_NETWORK_TRANSPORT_HPP */
