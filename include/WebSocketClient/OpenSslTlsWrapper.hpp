#ifndef WEB_SOCKET_CLIENT_OPEN_SSL_TLS_WRAPPER_HPP
#define WEB_SOCKET_CLIENT_OPEN_SSL_TLS_WRAPPER_HPP

/**
 * @file OpenSslTlsWrapper.hpp
 *
 * This module declares the WebSocketClient::OpenSslTlsWrapper class.
 *
 * © 2018 by Richard Walters
 */

#include <Http/Connection.hpp>
#include <memory>
#include <string>
#include <WebSocketClient/TlsWrapper.hpp>

namespace WebSocketClient {

    /**
     * This secures connections with TLS using OpenSSL.  The TLS engine
     * is given the encrypted stream through memory buffers, so it
     * works on top of any Http::Connection.
     */
    class OpenSslTlsWrapper
        : public TlsWrapper
    {
        // TlsWrapper
    public:
        virtual std::shared_ptr< Http::Connection > WrapClient(
            std::shared_ptr< Http::Connection > connection,
            const std::string& serverName,
            const TlsConfiguration& configuration,
            HandshakeDelegate handshakeDelegate
        ) override;
    };

}

#endif /* WEB_SOCKET_CLIENT_OPEN_SSL_TLS_WRAPPER_HPP */
