#ifndef WEB_SOCKET_CLIENT_WEB_SOCKET_HPP
#define WEB_SOCKET_CLIENT_WEB_SOCKET_HPP

/**
 * @file WebSocket.hpp
 *
 * This module declares the WebSocketClient::WebSocket class.
 *
 * © 2018 by Richard Walters
 */

#include <functional>
#include <Http/Connection.hpp>
#include <memory>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <WebSocketClient/CloseCode.hpp>
#include <WebSocketClient/Completion.hpp>
#include <WebSocketClient/Frame.hpp>
#include <WebSocketClient/Masking.hpp>

namespace WebSocketClient {

    /**
     * This class implements a session of the WebSocket protocol over
     * a connection which has already been upgraded.  The WebSocket
     * protocol is documented in
     * [RFC 6455](https://tools.ietf.org/html/rfc6455).
     *
     * The session must be closed, either by calling Close or by the
     * connection being torn down, before it's destroyed.
     */
    class WebSocket {
        // Types
    public:
        /**
         * This is the type of function used to publish messages received
         * by the WebSocket.
         *
         * @param[in] data
         *     This is the payload data from the received message.
         */
        typedef std::function< void(const std::string& data) > MessageReceivedDelegate;

        /**
         * This is the type of function used to notify the user that
         * the WebSocket has received a close frame or has been
         * closed due to an error.
         *
         * @param[in] code
         *     This is the status code of the closure.
         *
         * @param[in] reason
         *     This is the reason text of the closure.
         */
        typedef std::function<
            void(
                CloseCode code,
                const std::string& reason
            )
        > CloseReceivedDelegate;

        // Lifecycle management
    public:
        ~WebSocket() noexcept;
        WebSocket(const WebSocket&) = delete;
        WebSocket(WebSocket&&) noexcept;
        WebSocket& operator=(const WebSocket&) = delete;
        WebSocket& operator=(WebSocket&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        WebSocket();

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
         * This method sets the largest frame the WebSocket will accept.
         * If a larger frame is received, the WebSocket is closed with
         * the MessageTooBig code.
         *
         * @param[in] maxFrameSize
         *     This is the largest payload, in octets, accepted
         *     in a single frame.
         */
        void SetMaxFrameSize(size_t maxFrameSize);

        /**
         * This method puts the WebSocket into the OPEN state,
         * taking over the given connection.
         *
         * @param[in] connection
         *     This is the connection to use to send and receive frames.
         *
         * @param[in] role
         *     This is the role to play in the connection.
         */
        void Open(
            std::shared_ptr< Http::Connection > connection,
            Role role
        );

        /**
         * This method hands the WebSocket any octets which were received
         * along with the end of the upgrade handshake.
         *
         * @param[in] trailer
         *     These are the octets which followed the handshake.
         */
        void ReceiveTrailer(const std::string& trailer);

        /**
         * This method starts the closing handshake.  If the WebSocket
         * is already closed, nothing is sent.
         *
         * @param[in] code
         *     This is the status code to send in the close frame.
         *
         * @param[in] reason
         *     This is the reason text to send in the close frame.
         *
         * @return
         *     A completion is returned which succeeds once the close
         *     frame is handed to the connection.
         */
        std::shared_ptr< Completion > Close(
            CloseCode code = CloseCode::GoingAway,
            const std::string& reason = ""
        );

        /**
         * This method sends a ping frame.
         *
         * @param[in] data
         *     This is the payload to include in the frame.  It can be
         *     at most 125 octets.
         *
         * @return
         *     A completion is returned which succeeds once the frame
         *     is handed to the connection.
         */
        std::shared_ptr< Completion > Ping(const std::string& data = "");

        /**
         * This method sends a pong frame.
         *
         * @param[in] data
         *     This is the payload to include in the frame.  It can be
         *     at most 125 octets.
         *
         * @return
         *     A completion is returned which succeeds once the frame
         *     is handed to the connection.
         */
        std::shared_ptr< Completion > Pong(const std::string& data = "");

        /**
         * This method sends a text message.
         *
         * @param[in] data
         *     This is the text to send.
         *
         * @return
         *     A completion is returned which succeeds once the frame
         *     is handed to the connection.
         */
        std::shared_ptr< Completion > SendText(const std::string& data);

        /**
         * This method sends a binary message.
         *
         * @param[in] data
         *     This is the data to send.
         *
         * @return
         *     A completion is returned which succeeds once the frame
         *     is handed to the connection.
         */
        std::shared_ptr< Completion > SendBinary(const std::string& data);

        /**
         * This method sends a single frame, which may be part of a
         * fragmented message.
         *
         * @param[in] data
         *     This is the payload of the frame.
         *
         * @param[in] opcode
         *     This is the opcode of the frame.
         *
         * @param[in] fin
         *     This indicates whether or not the frame is the last
         *     one of its message.
         *
         * @return
         *     A completion is returned which succeeds once the frame
         *     is handed to the connection.
         */
        std::shared_ptr< Completion > Send(
            const std::string& data,
            Opcode opcode,
            bool fin = true
        );

        /**
         * This method returns a completion which succeeds once the
         * connection underneath the WebSocket has been torn down.
         *
         * @return
         *     The completion is returned.
         */
        std::shared_ptr< Completion > WhenClosed() const;

        /**
         * This method indicates whether or not the WebSocket is closed,
         * meaning no more messages can be sent.
         *
         * @return
         *     An indication of whether or not the WebSocket is closed
         *     is returned.
         */
        bool IsClosed() const;

        /**
         * This method sets the function to call whenever the WebSocket
         * has received a close frame or has been closed due to an error.
         *
         * @param[in] closeDelegate
         *     This is the function to call whenever the WebSocket
         *     has received a close frame or has been closed due to an error.
         */
        void SetCloseDelegate(CloseReceivedDelegate closeDelegate);

        /**
         * This method sets the function to call whenever a ping message
         * is received by the WebSocket.
         *
         * @param[in] pingDelegate
         *     This is the function to call whenever a ping message
         *     is received by the WebSocket.
         */
        void SetPingDelegate(MessageReceivedDelegate pingDelegate);

        /**
         * This method sets the function to call whenever a pong message
         * is received by the WebSocket.
         *
         * @param[in] pongDelegate
         *     This is the function to call whenever a pong message
         *     is received by the WebSocket.
         */
        void SetPongDelegate(MessageReceivedDelegate pongDelegate);

        /**
         * This method sets the function to call whenever a text message
         * is received by the WebSocket.
         *
         * @param[in] textDelegate
         *     This is the function to call whenever a text message
         *     is received by the WebSocket.
         */
        void SetTextDelegate(MessageReceivedDelegate textDelegate);

        /**
         * This method sets the function to call whenever a binary message
         * is received by the WebSocket.
         *
         * @param[in] binaryDelegate
         *     This is the function to call whenever a binary message
         *     is received by the WebSocket.
         */
        void SetBinaryDelegate(MessageReceivedDelegate binaryDelegate);

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

#endif /* WEB_SOCKET_CLIENT_WEB_SOCKET_HPP */
