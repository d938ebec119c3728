#ifndef WEB_SOCKET_CLIENT_MASKING_HPP
#define WEB_SOCKET_CLIENT_MASKING_HPP

/**
 * @file Masking.hpp
 *
 * This module declares the WebSocketClient::Role type and the
 * masking policy that depends on it.
 *
 * © 2018 by Richard Walters
 */

#include <SystemAbstractions/CryptoRandom.hpp>
#include <WebSocketClient/Frame.hpp>

namespace WebSocketClient {

    /**
     * This identifies which role the local endpoint originally
     * had when the WebSocket was established.
     */
    enum class Role {
        /**
         * In this role, the data for frames sent must be masked.
         */
        Client,

        /**
         * In this role, the data for frames sent must not be masked.
         */
        Server,
    };

    /**
     * This function returns the masking key to use for the next frame
     * sent by an endpoint in the given role.  A fresh random key is drawn
     * for every call in the client role; no key is used in the server role.
     *
     * @param[in] role
     *     This is the role of the endpoint sending the frame.
     *
     * @param[in,out] rng
     *     This is the source of random bytes for the key.
     *
     * @return
     *     The masking key to use is returned.
     */
    MaskingKey MakeMaskingKey(
        Role role,
        SystemAbstractions::CryptoRandom& rng
    );

}

#endif /* WEB_SOCKET_CLIENT_MASKING_HPP */
