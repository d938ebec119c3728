#ifndef WEB_SOCKET_CLIENT_UPGRADE_REQUEST_HANDLER_HPP
#define WEB_SOCKET_CLIENT_UPGRADE_REQUEST_HANDLER_HPP

/**
 * @file UpgradeRequestHandler.hpp
 *
 * This module declares the WebSocketClient::UpgradeRequestHandler class.
 *
 * © 2018 by Richard Walters
 */

#include <functional>
#include <Http/Connection.hpp>
#include <memory>
#include <MessageHeaders/MessageHeaders.hpp>
#include <stddef.h>
#include <string>
#include <WebSocketClient/Completion.hpp>
#include <WebSocketClient/UpgradeOffer.hpp>

namespace WebSocketClient {

    /**
     * This is the maximum number of octets accepted for the head
     * of the response to the upgrade request.
     */
    constexpr size_t MAX_RESPONSE_HEAD_LENGTH = 65536;

    /**
     * This sends the HTTP request asking a server to upgrade a connection
     * to the WebSocket protocol, and waits for the response.  It stays
     * on the connection only until the response head arrives.
     */
    class UpgradeRequestHandler {
        // Types
    public:
        /**
         * This is the type of function called once the server has
         * switched protocols.  By the time it's called, the handler
         * has let go of the connection.
         *
         * @param[in] trailer
         *     These are any octets received after the response head.
         *     They belong to the WebSocket protocol.
         */
        typedef std::function< void(const std::string& trailer) > SwitchDelegate;

        // Lifecycle management
    public:
        ~UpgradeRequestHandler() noexcept;
        UpgradeRequestHandler(const UpgradeRequestHandler&) = delete;
        UpgradeRequestHandler(UpgradeRequestHandler&&) noexcept;
        UpgradeRequestHandler& operator=(const UpgradeRequestHandler&) = delete;
        UpgradeRequestHandler& operator=(UpgradeRequestHandler&&) noexcept;

        // Public methods
    public:
        /**
         * This constructs the handler.
         *
         * @param[in] connection
         *     This is the connection on which to make the request.
         *
         * @param[in] host
         *     This is the value to send in the "Host" header.
         *
         * @param[in] target
         *     This is the path, and query if any, of the resource
         *     to request.
         *
         * @param[in] extraHeaders
         *     These are additional headers to send with the request.
         *
         * @param[in] offer
         *     This is the offer to upgrade the connection.
         *
         * @param[in] completion
         *     This is failed if the upgrade doesn't happen.
         *
         * @param[in] switchDelegate
         *     This is the function to call if the server switches
         *     protocols.
         */
        UpgradeRequestHandler(
            std::shared_ptr< Http::Connection > connection,
            const std::string& host,
            const std::string& target,
            const MessageHeaders::MessageHeaders& extraHeaders,
            const UpgradeOffer& offer,
            std::shared_ptr< Completion > completion,
            SwitchDelegate switchDelegate
        );

        /**
         * This method takes over the connection's delegates and sends
         * the upgrade request.
         */
        void Activate();

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

#endif /* WEB_SOCKET_CLIENT_UPGRADE_REQUEST_HANDLER_HPP */
