/**
 * @file CloseCode.cpp
 *
 * This module contains the implementation of the close frame
 * payload functions.
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <string>
#include <WebSocketClient/CloseCode.hpp>

namespace WebSocketClient {

    bool IsSendableCloseCode(CloseCode code) {
        const auto value = (unsigned int)code;
        return (
            ((value >= 1000) && (value <= 1003))
            || ((value >= 1007) && (value <= 1014))
            || ((value >= 3000) && (value <= 4999))
        );
    }

    std::string EncodeClosePayload(
        CloseCode code,
        const std::string& reason
    ) {
        const auto value = (uint16_t)code;
        std::string data;
        data.push_back((char)(uint8_t)(value >> 8));
        data.push_back((char)(uint8_t)(value & 0xFF));
        data += reason;
        return data;
    }

    bool DecodeClosePayload(
        const std::string& payload,
        CloseCode& code,
        std::string& reason
    ) {
        if (payload.length() < 2) {
            return false;
        }
        code = (CloseCode)(
            (((unsigned int)payload[0] << 8) & 0xFF00)
            + ((unsigned int)payload[1] & 0x00FF)
        );
        reason = payload.substr(2);
        return true;
    }

}
