#ifndef WEB_SOCKET_CLIENT_CLIENT_HPP
#define WEB_SOCKET_CLIENT_CLIENT_HPP

/**
 * @file Client.hpp
 *
 * This module declares the WebSocketClient::Client class.
 *
 * © 2018 by Richard Walters
 */

#include <functional>
#include <memory>
#include <MessageHeaders/MessageHeaders.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <WebSocketClient/Completion.hpp>
#include <WebSocketClient/Error.hpp>
#include <WebSocketClient/EventLoopGroup.hpp>
#include <WebSocketClient/Frame.hpp>
#include <WebSocketClient/TlsWrapper.hpp>
#include <WebSocketClient/Transport.hpp>
#include <WebSocketClient/WebSocket.hpp>

namespace WebSocketClient {

    /**
     * This opens WebSocket connections to servers: it connects, secures
     * the connection with TLS for "wss" targets, performs the upgrade
     * handshake, and hands over the resulting WebSocket.
     */
    class Client {
        // Types
    public:
        /**
         * This holds the settings used for every connection made
         * by the client.
         */
        struct Configuration {
            /**
             * These are the TLS settings to use for "wss" connections.
             * If nullptr, the default settings are used.
             */
            std::shared_ptr< TlsConfiguration > tlsConfiguration;

            /**
             * This is the largest frame payload, in octets, that
             * WebSockets made by the client will accept.
             */
            size_t maxFrameSize = DEFAULT_MAX_FRAME_SIZE;
        };

        /**
         * This is the type of function called when a connection has
         * been upgraded to the WebSocket protocol.
         *
         * @param[in] webSocket
         *     This is the new WebSocket.
         */
        typedef std::function< void(std::shared_ptr< WebSocket > webSocket) > UpgradeDelegate;

        // Lifecycle management
    public:
        ~Client() noexcept;
        Client(const Client&) = delete;
        Client(Client&&) noexcept;
        Client& operator=(const Client&) = delete;
        Client& operator=(Client&&) noexcept;

        // Public methods
    public:
        /**
         * This constructs a client which makes and owns its own
         * single-loop event loop group.  SyncShutdown must be called
         * before the client is destroyed.
         *
         * @param[in] configuration
         *     These are the settings to use for every connection.
         */
        explicit Client(const Configuration& configuration = Configuration());

        /**
         * This constructs a client which uses the given event loop group.
         * The group is shared, not owned, so the client never shuts it
         * down.
         *
         * @param[in] group
         *     This is the group of event loops to use.
         *
         * @param[in] configuration
         *     These are the settings to use for every connection.
         */
        explicit Client(
            std::shared_ptr< EventLoopGroup > group,
            const Configuration& configuration = Configuration()
        );

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the class.
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

        /**
         * This method replaces the object used to open connections.
         *
         * @param[in] transport
         *     This is the object to use to open connections.
         */
        void SetTransport(std::shared_ptr< Transport > transport);

        /**
         * This method replaces the object used to secure connections.
         *
         * @param[in] tlsWrapper
         *     This is the object to use to secure connections.
         */
        void SetTlsWrapper(std::shared_ptr< TlsWrapper > tlsWrapper);

        /**
         * This method starts opening a WebSocket to the server
         * identified by the given URL.
         *
         * @param[in] url
         *     This identifies the server and resource.  A missing scheme
         *     means "ws", a missing host means "localhost", a missing port
         *     means the default port of the scheme, and a missing path
         *     means "/".
         *
         * @param[in] headers
         *     These are additional headers to send with the upgrade
         *     request.
         *
         * @param[in] onUpgrade
         *     This is the function to call with the new WebSocket.
         *     It's called before the returned completion succeeds.
         *
         * @return
         *     A completion is returned which succeeds once the WebSocket
         *     is open, or fails if it can't be opened.
         */
        std::shared_ptr< Completion > Connect(
            const std::string& url,
            const MessageHeaders::MessageHeaders& headers,
            UpgradeDelegate onUpgrade
        );

        /**
         * This method starts opening a WebSocket to the given server.
         *
         * @param[in] scheme
         *     This is either "ws" or "wss".
         *
         * @param[in] host
         *     This is the host name or IP address of the server.
         *
         * @param[in] port
         *     This is the port number of the server.
         *
         * @param[in] path
         *     This is the path, and query if any, of the resource.
         *
         * @param[in] headers
         *     These are additional headers to send with the upgrade
         *     request.
         *
         * @param[in] onUpgrade
         *     This is the function to call with the new WebSocket.
         *     It's called before the returned completion succeeds.
         *
         * @return
         *     A completion is returned which succeeds once the WebSocket
         *     is open, or fails if it can't be opened.
         */
        std::shared_ptr< Completion > Connect(
            const std::string& scheme,
            const std::string& host,
            uint16_t port,
            const std::string& path,
            const MessageHeaders::MessageHeaders& headers,
            UpgradeDelegate onUpgrade
        );

        /**
         * This method shuts down the event loop group, if the client
         * owns it, waiting for the loops to stop.
         *
         * @return
         *     The failure, if any, is returned.  Shutting down an owned
         *     group a second time fails with Error::Kind::AlreadyShutDown.
         */
        Error SyncShutdown();

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

#endif /* WEB_SOCKET_CLIENT_CLIENT_HPP */
