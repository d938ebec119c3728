#ifndef WEB_SOCKET_CLIENT_ERROR_HPP
#define WEB_SOCKET_CLIENT_ERROR_HPP

/**
 * @file Error.hpp
 *
 * This module declares the WebSocketClient::Error structure.
 *
 * © 2018 by Richard Walters
 */

#include <Http/Response.hpp>
#include <string>

namespace WebSocketClient {

    /**
     * This describes the outcome of an asynchronous operation
     * which did not succeed.
     */
    struct Error {
        // Types

        /**
         * These are the kinds of failures reported.
         */
        enum class Kind {
            /**
             * There was no failure.
             */
            None,

            /**
             * The target given could not be parsed into
             * scheme, host, port and path.
             */
            InvalidUrl,

            /**
             * The server answered the upgrade request with something
             * other than an acceptable protocol switch.  The response
             * head is in the "response" property.
             */
            UpgradeRefused,

            /**
             * The event loops needed for the operation have already
             * been shut down.
             */
            AlreadyShutDown,

            /**
             * The peer broke the rules of the WebSocket protocol.
             */
            ProtocolViolation,

            /**
             * The connection, or the TLS layer on top of it,
             * failed or was broken.
             */
            TransportFailure,
        };

        // Properties

        /**
         * This is the kind of failure.
         */
        Kind kind = Kind::None;

        /**
         * This is a human-readable description of the failure.
         */
        std::string message;

        /**
         * This is the response received for a refused upgrade.
         */
        Http::Response response;

        // Methods

        /**
         * This is the default constructor, which represents success.
         */
        Error() = default;

        /**
         * This constructs an error of the given kind.
         *
         * @param[in] kind
         *     This is the kind of failure.
         *
         * @param[in] message
         *     This is a human-readable description of the failure.
         */
        Error(
            Kind kind,
            const std::string& message
        );

        /**
         * This constructs an error reporting a refused upgrade.
         *
         * @param[in] response
         *     This is the response the server gave to the
         *     upgrade request.
         *
         * @return
         *     The error is returned.
         */
        static Error UpgradeRefused(const Http::Response& response);

        /**
         * This indicates whether or not there was a failure.
         */
        explicit operator bool() const;
    };

    /**
     * This function returns the name of the given kind of failure.
     *
     * @param[in] kind
     *     This is the kind of failure to name.
     *
     * @return
     *     The name of the kind of failure is returned.
     */
    std::string KindToString(Error::Kind kind);

    /**
     * This function formats the given error for diagnostics.
     *
     * @param[in] error
     *     This is the error to format.
     *
     * @return
     *     A human-readable rendering of the error is returned.
     */
    std::string ToString(const Error& error);

}

#endif /* WEB_SOCKET_CLIENT_ERROR_HPP */
