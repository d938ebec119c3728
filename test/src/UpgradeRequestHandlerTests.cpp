/**
 * @file UpgradeRequestHandlerTests.cpp
 *
 * This module contains the unit tests of the
 * WebSocketClient::UpgradeRequestHandler class.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <Http/Connection.hpp>
#include <memory>
#include <MessageHeaders/MessageHeaders.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include <WebSocketClient/Completion.hpp>
#include <WebSocketClient/Error.hpp>
#include <WebSocketClient/UpgradeOffer.hpp>
#include <WebSocketClient/UpgradeRequestHandler.hpp>

namespace {

    /**
     * This is the key offered in every upgrade request made in these tests.
     */
    const std::string TEST_KEY = "dGhlIHNhbXBsZSBub25jZQ==";

    /**
     * This is a fake connection which is used to test the handler.
     */
    struct MockConnection
        : public Http::Connection
    {
        // Properties

        DataReceivedDelegate dataReceivedDelegate;
        BrokenDelegate brokenDelegate;
        std::string output;
        bool broken = false;

        // Methods

        void Receive(const std::string& data) {
            const auto dataReceivedDelegateCopy = dataReceivedDelegate;
            if (dataReceivedDelegateCopy != nullptr) {
                dataReceivedDelegateCopy({data.begin(), data.end()});
            }
        }

        void BreakFromPeer() {
            const auto brokenDelegateCopy = brokenDelegate;
            if (brokenDelegateCopy != nullptr) {
                brokenDelegateCopy(false);
            }
        }

        // Http::Connection

        virtual std::string GetPeerAddress() override {
            return "mock-server";
        }

        virtual std::string GetPeerId() override {
            return "mock-server:80";
        }

        virtual void SetDataReceivedDelegate(DataReceivedDelegate newDataReceivedDelegate) override {
            dataReceivedDelegate = newDataReceivedDelegate;
        }

        virtual void SetBrokenDelegate(BrokenDelegate newBrokenDelegate) override {
            brokenDelegate = newBrokenDelegate;
        }

        virtual void SendData(const std::vector< uint8_t >& data) override {
            (void)output.insert(
                output.end(),
                data.begin(),
                data.end()
            );
        }

        virtual void Break(bool clean) override {
            broken = true;
        }
    };

}

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct UpgradeRequestHandlerTests
    : public ::testing::Test
{
    // Properties

    std::shared_ptr< MockConnection > connection = std::make_shared< MockConnection >();
    std::shared_ptr< WebSocketClient::Completion > completion = std::make_shared< WebSocketClient::Completion >();
    std::vector< std::string > switches;

    // Methods

    /**
     * This method makes and activates a handler which asks for
     * the given resource.
     *
     * @param[in] target
     *     This is the path and query of the resource.
     *
     * @param[in] extraHeaders
     *     These are additional headers to send with the request.
     */
    void Activate(
        const std::string& target = "/chat",
        const MessageHeaders::MessageHeaders& extraHeaders = MessageHeaders::MessageHeaders()
    ) {
        WebSocketClient::UpgradeRequestHandler handler(
            connection,
            "example.com",
            target,
            extraHeaders,
            WebSocketClient::UpgradeOffer(TEST_KEY),
            completion,
            [this](const std::string& trailer){
                switches.push_back(trailer);
            }
        );
        handler.Activate();
    }

    /**
     * This method returns a response which accepts the upgrade.
     *
     * @return
     *     The raw response is returned.
     */
    static std::string AcceptingResponse() {
        return (
            "HTTP/1.1 101 Switching Protocols\r\n"
            "Upgrade: websocket\r\n"
            "Connection: upgrade\r\n"
            "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"
            "\r\n"
        );
    }
};

TEST_F(UpgradeRequestHandlerTests, RequestFormat) {
    MessageHeaders::MessageHeaders extraHeaders;
    extraHeaders.SetHeader("Authorization", "Bearer token");
    Activate("/chat?room=1", extraHeaders);
    const auto& request = connection->output;
    EXPECT_EQ("GET /chat?room=1 HTTP/1.1\r\n", request.substr(0, 27));
    EXPECT_NE(std::string::npos, request.find("\r\nHost: example.com\r\n"));
    EXPECT_NE(std::string::npos, request.find("\r\nContent-Length: 0\r\n"));
    EXPECT_NE(std::string::npos, request.find("\r\nContent-Type: text/plain; charset=utf-8\r\n"));
    EXPECT_NE(std::string::npos, request.find("\r\nAuthorization: Bearer token\r\n"));
    EXPECT_NE(std::string::npos, request.find("\r\nSec-WebSocket-Version: 13\r\n"));
    EXPECT_NE(std::string::npos, request.find("\r\nSec-WebSocket-Key: " + TEST_KEY + "\r\n"));
    EXPECT_NE(std::string::npos, request.find("\r\nUpgrade: websocket\r\n"));
    EXPECT_EQ("\r\n\r\n", request.substr(request.length() - 4));
    EXPECT_FALSE(completion->IsComplete());
}

TEST_F(UpgradeRequestHandlerTests, SwitchOnAcceptingResponse) {
    Activate();
    connection->Receive(AcceptingResponse());
    EXPECT_EQ(
        (std::vector< std::string >{
            "",
        }),
        switches
    );
    EXPECT_FALSE(connection->broken);
    EXPECT_TRUE(connection->dataReceivedDelegate == nullptr);
    EXPECT_TRUE(connection->brokenDelegate == nullptr);
    EXPECT_FALSE(completion->IsComplete());
}

TEST_F(UpgradeRequestHandlerTests, SwitchWithTrailer) {
    Activate();
    connection->Receive(AcceptingResponse() + "\x81\x02" "hi");
    EXPECT_EQ(
        (std::vector< std::string >{
            "\x81\x02" "hi",
        }),
        switches
    );
}

TEST_F(UpgradeRequestHandlerTests, ResponseDeliveredInPieces) {
    Activate();
    const auto response = AcceptingResponse();
    for (size_t i = 0; i < response.length(); ++i) {
        EXPECT_TRUE(switches.empty()) << i;
        connection->Receive(response.substr(i, 1));
    }
    EXPECT_EQ(1, switches.size());
}

TEST_F(UpgradeRequestHandlerTests, RefusedResponse) {
    Activate();
    connection->Receive(
        "HTTP/1.1 404 Not Found\r\n"
        "Content-Length: 0\r\n"
        "\r\n"
    );
    EXPECT_TRUE(switches.empty());
    ASSERT_TRUE(completion->IsComplete());
    const auto error = completion->GetError();
    EXPECT_EQ(WebSocketClient::Error::Kind::UpgradeRefused, error.kind);
    EXPECT_EQ(404, error.response.statusCode);
    EXPECT_EQ("Not Found", error.response.reasonPhrase);
    EXPECT_TRUE(connection->broken);
}

TEST_F(UpgradeRequestHandlerTests, RefusedDueToWrongAccept) {
    Activate();
    connection->Receive(
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: upgrade\r\n"
        "Sec-WebSocket-Accept: bogus\r\n"
        "\r\n"
    );
    EXPECT_TRUE(switches.empty());
    ASSERT_TRUE(completion->IsComplete());
    EXPECT_EQ(WebSocketClient::Error::Kind::UpgradeRefused, completion->GetError().kind);
    EXPECT_EQ(101, completion->GetError().response.statusCode);
    EXPECT_TRUE(connection->broken);
}

TEST_F(UpgradeRequestHandlerTests, MalformedResponse) {
    Activate();
    connection->Receive("SSH-2.0-OpenSSH\r\n\r\n");
    EXPECT_TRUE(switches.empty());
    connection->BreakFromPeer();
    ASSERT_TRUE(completion->IsComplete());
    EXPECT_EQ(WebSocketClient::Error::Kind::TransportFailure, completion->GetError().kind);
    EXPECT_TRUE(switches.empty());
}

TEST_F(UpgradeRequestHandlerTests, ResponseHeadTooLong) {
    Activate();
    connection->Receive("HTTP/1.1 101 Switching Protocols\r\n");
    connection->Receive(std::string(WebSocketClient::MAX_RESPONSE_HEAD_LENGTH, 'x'));
    ASSERT_TRUE(completion->IsComplete());
    EXPECT_EQ(WebSocketClient::Error::Kind::TransportFailure, completion->GetError().kind);
}

TEST_F(UpgradeRequestHandlerTests, ConnectionBrokenBeforeResponse) {
    Activate();
    connection->BreakFromPeer();
    ASSERT_TRUE(completion->IsComplete());
    EXPECT_EQ(WebSocketClient::Error::Kind::TransportFailure, completion->GetError().kind);
    EXPECT_TRUE(switches.empty());
    EXPECT_TRUE(connection->dataReceivedDelegate == nullptr);
}

TEST_F(UpgradeRequestHandlerTests, AcceptingResponseWithExtraHeaders) {
    Activate();
    connection->Receive(
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Server: test\r\n"
        "Upgrade: websocket\r\n"
        "Connection: keep-alive, upgrade\r\n"
        "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"
        "\r\n"
        "\x89\x00"
    );
    EXPECT_EQ(
        (std::vector< std::string >{
            std::string("\x89\x00", 2),
        }),
        switches
    );
    EXPECT_FALSE(completion->IsComplete());
}

TEST_F(UpgradeRequestHandlerTests, RefusedResponseReasonPhraseKept) {
    Activate();
    connection->Receive(
        "HTTP/1.1 403 Go Away Please\r\n"
        "Content-Length: 0\r\n"
        "\r\n"
    );
    ASSERT_TRUE(completion->IsComplete());
    const auto error = completion->GetError();
    EXPECT_EQ(WebSocketClient::Error::Kind::UpgradeRefused, error.kind);
    EXPECT_EQ(403, error.response.statusCode);
    EXPECT_EQ("Go Away Please", error.response.reasonPhrase);
}
