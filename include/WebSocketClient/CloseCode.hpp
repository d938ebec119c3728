#ifndef WEB_SOCKET_CLIENT_CLOSE_CODE_HPP
#define WEB_SOCKET_CLIENT_CLOSE_CODE_HPP

/**
 * @file CloseCode.hpp
 *
 * This module declares the WebSocketClient::CloseCode type and the
 * functions used to build and read close frame payloads.
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <string>

namespace WebSocketClient {

    /**
     * These are the status codes exchanged in close frames, as listed in
     * [RFC 6455 section 7.4.1](https://tools.ietf.org/html/rfc6455#section-7.4.1).
     * Other values in the range 1000-4999 may also be carried.
     */
    enum class CloseCode : uint16_t {
        Normal = 1000,
        GoingAway = 1001,
        ProtocolError = 1002,
        UnsupportedData = 1003,

        /**
         * This is never sent; it reports a close frame that had no
         * status code.
         */
        NoStatusReceived = 1005,

        /**
         * This is never sent; it reports a connection that was broken
         * without a close frame.
         */
        AbnormalClosure = 1006,

        InvalidFramePayloadData = 1007,
        PolicyViolation = 1008,
        MessageTooBig = 1009,
        MandatoryExtension = 1010,
        InternalError = 1011,
    };

    /**
     * This function indicates whether or not the given status code
     * may be carried in a close frame.
     *
     * @param[in] code
     *     This is the status code to check.
     *
     * @return
     *     An indication of whether or not the status code may be
     *     carried in a close frame is returned.
     */
    bool IsSendableCloseCode(CloseCode code);

    /**
     * This function builds the payload of a close frame.
     *
     * @param[in] code
     *     This is the status code to put in the payload.
     *
     * @param[in] reason
     *     This is the optional reason text to put after the code.
     *
     * @return
     *     The close frame payload is returned.
     */
    std::string EncodeClosePayload(
        CloseCode code,
        const std::string& reason = ""
    );

    /**
     * This function reads the status code and reason from
     * the payload of a close frame.
     *
     * @param[in] payload
     *     This is the unmasked close frame payload.
     *
     * @param[out] code
     *     This is where to store the status code.
     *
     * @param[out] reason
     *     This is where to store the reason text.
     *
     * @return
     *     An indication of whether or not the payload carried
     *     a status code is returned.
     */
    bool DecodeClosePayload(
        const std::string& payload,
        CloseCode& code,
        std::string& reason
    );

}

#endif /* WEB_SOCKET_CLIENT_CLOSE_CODE_HPP */
