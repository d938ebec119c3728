#ifndef WEB_SOCKET_CLIENT_TRANSPORT_HPP
#define WEB_SOCKET_CLIENT_TRANSPORT_HPP

/**
 * @file Transport.hpp
 *
 * This module declares the WebSocketClient::Transport interface.
 *
 * © 2018 by Richard Walters
 */

#include <functional>
#include <Http/Connection.hpp>
#include <memory>
#include <stdint.h>
#include <string>
#include <WebSocketClient/Error.hpp>

namespace WebSocketClient {

    /**
     * This is the interface to the object used to open byte-stream
     * connections to servers.
     */
    class Transport {
        // Types
    public:
        /**
         * This is the type of function called when a connection attempt
         * finishes.
         *
         * @param[in] error
         *     This describes the failure, if any.
         *
         * @param[in] connection
         *     This is the new connection, or nullptr if the attempt failed.
         */
        typedef std::function<
            void(
                const Error& error,
                std::shared_ptr< Http::Connection > connection
            )
        > ConnectDelegate;

        // Methods
    public:
        virtual ~Transport() noexcept = default;

        /**
         * This method starts connecting to the given server.  It returns
         * right away; the outcome is reported through the given delegate,
         * which is called exactly once, on a thread of the transport's
         * choosing.
         *
         * @param[in] host
         *     This is the host name or address of the server.
         *
         * @param[in] port
         *     This is the port number of the server.
         *
         * @param[in] connectDelegate
         *     This is the function to call when the attempt finishes.
         */
        virtual void Connect(
            const std::string& host,
            uint16_t port,
            ConnectDelegate connectDelegate
        ) = 0;
    };

}

#endif /* WEB_SOCKET_CLIENT_TRANSPORT_HPP */
