#ifndef WEB_SOCKET_CLIENT_TLS_WRAPPER_HPP
#define WEB_SOCKET_CLIENT_TLS_WRAPPER_HPP

/**
 * @file TlsWrapper.hpp
 *
 * This module declares the WebSocketClient::TlsWrapper interface
 * and the WebSocketClient::TlsConfiguration structure.
 *
 * @note
 *     Wrapping a connection doesn't block; the handshake runs as
 *     data arrives on the wrapped connection.
 *
 * © 2018 by Richard Walters
 */

#include <functional>
#include <Http/Connection.hpp>
#include <memory>
#include <string>
#include <WebSocketClient/Error.hpp>

namespace WebSocketClient {

    /**
     * This holds the settings used to secure a connection with TLS.
     */
    struct TlsConfiguration {
        /**
         * These are the certificates of the authorities to trust, in PEM
         * format.  If empty, the system's default trust store is used.
         */
        std::string caCertificates;

        /**
         * This indicates whether or not to verify the certificate of
         * the server, including that it matches the server name.
         */
        bool verifyPeer = true;
    };

    /**
     * This is the interface to the object used to secure connections
     * with TLS.
     */
    class TlsWrapper {
        // Types
    public:
        /**
         * This is the type of function called once the TLS handshake
         * finishes.
         *
         * @param[in] error
         *     This describes the failure, if any.
         */
        typedef std::function< void(const Error& error) > HandshakeDelegate;

        // Methods
    public:
        virtual ~TlsWrapper() noexcept = default;

        /**
         * This method wraps the given connection in a TLS client and
         * starts the handshake.
         *
         * @param[in] connection
         *     This is the connection to wrap.  The wrapper takes over
         *     its delegates.
         *
         * @param[in] serverName
         *     This is the name of the server, used for server name
         *     indication and to verify the server's certificate.
         *
         * @param[in] configuration
         *     These are the TLS settings to use.
         *
         * @param[in] handshakeDelegate
         *     This is the function to call exactly once, when the
         *     handshake succeeds or fails.
         *
         * @return
         *     The connection which carries plaintext over TLS is returned.
         *     It's nullptr if the TLS client couldn't be set up, in which
         *     case the handshake delegate has already been called.
         */
        virtual std::shared_ptr< Http::Connection > WrapClient(
            std::shared_ptr< Http::Connection > connection,
            const std::string& serverName,
            const TlsConfiguration& configuration,
            HandshakeDelegate handshakeDelegate
        ) = 0;
    };

}

#endif /* WEB_SOCKET_CLIENT_TLS_WRAPPER_HPP */
