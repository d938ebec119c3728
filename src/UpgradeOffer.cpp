/**
 * @file UpgradeOffer.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::UpgradeOffer class and the server-side
 * upgrade functions.
 *
 * © 2018 by Richard Walters
 */

#include <Base64/Base64.hpp>
#include <Hash/Sha1.hpp>
#include <Hash/Templates.hpp>
#include <Http/Request.hpp>
#include <Http/Response.hpp>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/CryptoRandom.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <WebSocketClient/UpgradeOffer.hpp>

namespace {

    /**
     * This is the version of the WebSocket protocol that this class supports.
     */
    const std::string CURRENTLY_SUPPORTED_WEBSOCKET_VERSION = "13";

    /**
     * This is the required length of the Base64 decoding of the
     * "Sec-WebSocket-Key" header in HTTP requests that initiate a WebSocket
     * opening handshake.
     */
    constexpr size_t REQUIRED_WEBSOCKET_KEY_LENGTH = 16;

    /**
     * This is the string added to the "Sec-WebSocket-Key" before computing
     * the SHA-1 hash and Base64 encoding the result to form the
     * corresponding "Sec-WebSocket-Accept" value.
     */
    const std::string WEBSOCKET_KEY_SALT = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

    /**
     * This function sets up the given response to reject the request
     * as malformed.
     *
     * @param[out] response
     *     This is the response to set up.
     */
    void BadRequest(Http::Response& response) {
        response.statusCode = 400;
        response.reasonPhrase = "Bad Request";
    }

}

namespace WebSocketClient {

    UpgradeOffer::UpgradeOffer(SystemAbstractions::CryptoRandom& rng) {
        char nonce[REQUIRED_WEBSOCKET_KEY_LENGTH];
        rng.Generate(nonce, sizeof(nonce));
        key_ = Base64::Encode(
            std::string(nonce, sizeof(nonce))
        );
    }

    UpgradeOffer::UpgradeOffer(const std::string& key)
        : key_(key)
    {
    }

    const std::string& UpgradeOffer::GetKey() const {
        return key_;
    }

    void UpgradeOffer::Apply(Http::Request& request) const {
        request.headers.SetHeader("Sec-WebSocket-Version", CURRENTLY_SUPPORTED_WEBSOCKET_VERSION);
        request.headers.SetHeader("Sec-WebSocket-Key", key_);
        request.headers.SetHeader("Upgrade", "websocket");
        auto connectionTokens = request.headers.GetHeaderTokens("Connection");
        connectionTokens.push_back("upgrade");
        request.headers.SetHeader("Connection", connectionTokens, true);
    }

    bool UpgradeOffer::Accepts(const Http::Response& response) const {
        if (response.statusCode != 101) {
            return false;
        }
        if (!response.headers.HasHeaderToken("Connection", "upgrade")) {
            return false;
        }
        if (SystemAbstractions::ToLower(response.headers.GetHeaderValue("Upgrade")) != "websocket") {
            return false;
        }
        if (response.headers.GetHeaderValue("Sec-WebSocket-Accept") != ComputeKeyAnswer(key_)) {
            return false;
        }
        if (!response.headers.GetHeaderTokens("Sec-WebSocket-Extensions").empty()) {
            return false;
        }
        if (!response.headers.GetHeaderTokens("Sec-WebSocket-Protocol").empty()) {
            return false;
        }
        return true;
    }

    std::string ComputeKeyAnswer(const std::string& key) {
        return Base64::Encode(
            Hash::StringToBytes< Hash::Sha1 >(key + WEBSOCKET_KEY_SALT)
        );
    }

    bool AnswerUpgrade(
        const Http::Request& request,
        Http::Response& response,
        const std::string& trailer
    ) {
        if (request.method != "GET") {
            return false;
        }
        if (!request.headers.HasHeaderToken("Connection", "upgrade")) {
            return false;
        }
        if (SystemAbstractions::ToLower(request.headers.GetHeaderValue("Upgrade")) != "websocket") {
            return false;
        }
        if (request.headers.GetHeaderValue("Sec-WebSocket-Version") != CURRENTLY_SUPPORTED_WEBSOCKET_VERSION) {
            BadRequest(response);
            return false;
        }
        if (!trailer.empty()) {
            BadRequest(response);
            return false;
        }
        const auto key = request.headers.GetHeaderValue("Sec-WebSocket-Key");
        if (Base64::Decode(key).length() != REQUIRED_WEBSOCKET_KEY_LENGTH) {
            BadRequest(response);
            return false;
        }
        auto connectionTokens = response.headers.GetHeaderTokens("Connection");
        connectionTokens.push_back("upgrade");
        response.statusCode = 101;
        response.reasonPhrase = "Switching Protocols";
        response.headers.SetHeader("Connection", connectionTokens, true);
        response.headers.SetHeader("Upgrade", "websocket");
        response.headers.SetHeader("Sec-WebSocket-Accept", ComputeKeyAnswer(key));
        return true;
    }

}
