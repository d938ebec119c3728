/**
 * @file Masking.cpp
 *
 * This module contains the implementation of the WebSocketClient
 * masking policy.
 *
 * © 2018 by Richard Walters
 */

#include <SystemAbstractions/CryptoRandom.hpp>
#include <WebSocketClient/Frame.hpp>
#include <WebSocketClient/Masking.hpp>

namespace WebSocketClient {

    MaskingKey MakeMaskingKey(
        Role role,
        SystemAbstractions::CryptoRandom& rng
    ) {
        MaskingKey maskingKey;
        switch (role) {
            case Role::Client: {
                maskingKey.present = true;
                rng.Generate(maskingKey.bytes, sizeof(maskingKey.bytes));
            } break;

            case Role::Server:
            default: {
            } break;
        }
        return maskingKey;
    }

}
