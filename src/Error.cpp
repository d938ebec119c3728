/**
 * @file Error.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::Error structure.
 *
 * © 2018 by Richard Walters
 */

#include <Http/Response.hpp>
#include <string>
#include <SystemAbstractions/StringExtensions.hpp>
#include <WebSocketClient/Error.hpp>

namespace WebSocketClient {

    Error::Error(
        Kind kind,
        const std::string& message
    )
        : kind(kind)
        , message(message)
    {
    }

    Error Error::UpgradeRefused(const Http::Response& response) {
        Error error(
            Kind::UpgradeRefused,
            SystemAbstractions::sprintf(
                "invalid response status: %u %s",
                response.statusCode,
                response.reasonPhrase.c_str()
            )
        );
        error.response = response;
        return error;
    }

    Error::operator bool() const {
        return (kind != Kind::None);
    }

    std::string KindToString(Error::Kind kind) {
        switch (kind) {
            case Error::Kind::None: return "None";
            case Error::Kind::InvalidUrl: return "InvalidUrl";
            case Error::Kind::UpgradeRefused: return "UpgradeRefused";
            case Error::Kind::AlreadyShutDown: return "AlreadyShutDown";
            case Error::Kind::ProtocolViolation: return "ProtocolViolation";
            case Error::Kind::TransportFailure: return "TransportFailure";
            default: return "???";
        }
    }

    std::string ToString(const Error& error) {
        if (error.message.empty()) {
            return KindToString(error.kind);
        }
        return KindToString(error.kind) + ": " + error.message;
    }

}
