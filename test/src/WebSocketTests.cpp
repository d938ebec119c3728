/**
 * @file WebSocketTests.cpp
 *
 * This module contains the unit tests of the
 * WebSocketClient::WebSocket class.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <Http/Connection.hpp>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <vector>
#include <WebSocketClient/CloseCode.hpp>
#include <WebSocketClient/Completion.hpp>
#include <WebSocketClient/Error.hpp>
#include <WebSocketClient/Frame.hpp>
#include <WebSocketClient/Masking.hpp>
#include <WebSocketClient/WebSocket.hpp>

namespace {

    /**
     * This is a fake connection which is used to test WebSockets.
     */
    struct MockConnection
        : public Http::Connection
    {
        // Properties

        /**
         * This is the delegate to call in order to simulate data coming
         * into the WebSocket from the remote peer.
         */
        DataReceivedDelegate dataReceivedDelegate;

        /**
         * This is the delegate to call in order to simulate closing
         * the connection from the remote peer side.
         */
        BrokenDelegate brokenDelegate;

        /**
         * This holds onto a copy of all data sent by the WebSocket
         * to the remote peer.
         */
        std::string webSocketOutput;

        /**
         * This flag is set if the WebSocket breaks the connection
         * to the remote peer.
         */
        bool brokenByWebSocket = false;

        /**
         * This records whether the WebSocket broke the connection
         * gracefully.
         */
        bool brokenCleanly = false;

        // Methods

        /**
         * This method simulates data coming from the remote peer.
         *
         * @param[in] data
         *     This is the data to deliver.
         */
        void Receive(const std::string& data) {
            const auto dataReceivedDelegateCopy = dataReceivedDelegate;
            if (dataReceivedDelegateCopy != nullptr) {
                dataReceivedDelegateCopy({data.begin(), data.end()});
            }
        }

        /**
         * This method simulates the remote peer breaking the connection.
         */
        void BreakFromPeer() {
            const auto brokenDelegateCopy = brokenDelegate;
            if (brokenDelegateCopy != nullptr) {
                brokenDelegateCopy(false);
            }
        }

        /**
         * This method decodes every frame the WebSocket has sent.
         *
         * @return
         *     The frames sent by the WebSocket are returned.
         */
        std::vector< WebSocketClient::Frame > OutputFrames() const {
            WebSocketClient::FrameDecoder decoder(webSocketOutput.length() + 1);
            decoder.Feed(webSocketOutput);
            std::vector< WebSocketClient::Frame > frames;
            WebSocketClient::Frame frame;
            while (decoder.Next(frame) == WebSocketClient::FrameDecoder::Result::Complete) {
                frames.push_back(frame);
            }
            return frames;
        }

        // Http::Connection

        virtual std::string GetPeerAddress() override {
            return "mock-server";
        }

        virtual std::string GetPeerId() override {
            return "mock-server:5555";
        }

        virtual void SetDataReceivedDelegate(DataReceivedDelegate newDataReceivedDelegate) override {
            dataReceivedDelegate = newDataReceivedDelegate;
        }

        virtual void SetBrokenDelegate(BrokenDelegate newBrokenDelegate) override {
            brokenDelegate = newBrokenDelegate;
        }

        virtual void SendData(const std::vector< uint8_t >& data) override {
            (void)webSocketOutput.insert(
                webSocketOutput.end(),
                data.begin(),
                data.end()
            );
        }

        virtual void Break(bool clean) override {
            brokenByWebSocket = true;
            brokenCleanly = clean;
        }
    };

    /**
     * This function extracts the status code from a close frame.
     *
     * @param[in] frame
     *     This is the close frame.
     *
     * @return
     *     The status code in the close frame is returned.
     */
    unsigned int CloseCodeOf(const WebSocketClient::Frame& frame) {
        WebSocketClient::CloseCode code;
        std::string reason;
        if (!WebSocketClient::DecodeClosePayload(frame.UnmaskedPayload(), code, reason)) {
            return 0;
        }
        return (unsigned int)code;
    }

}

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct WebSocketTests
    : public ::testing::Test
{
    // Properties

    /**
     * This is the unit under test.
     */
    WebSocketClient::WebSocket ws;

    /**
     * This is the fake connection given to the unit under test.
     */
    std::shared_ptr< MockConnection > connection = std::make_shared< MockConnection >();

    /**
     * These are the diagnostic messages that have been
     * received from the unit under test.
     */
    std::vector< std::string > diagnosticMessages;

    /**
     * This is the delegate obtained when subscribing
     * to receive diagnostic messages from the unit under test.
     * It's called to terminate the subscription.
     */
    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate diagnosticsUnsubscribeDelegate;

    /**
     * These are the close codes reported by the unit under test.
     */
    std::vector< unsigned int > closeCodes;

    /**
     * These are the close reasons reported by the unit under test.
     */
    std::vector< std::string > closeReasons;

    // Methods

    /**
     * This method opens the unit under test on the fake connection,
     * recording any close reported.
     *
     * @param[in] role
     *     This is the role the unit under test should play.
     */
    void Open(WebSocketClient::Role role) {
        ws.Open(connection, role);
        ws.SetCloseDelegate(
            [this](
                WebSocketClient::CloseCode code,
                const std::string& reason
            ){
                closeCodes.push_back((unsigned int)code);
                closeReasons.push_back(reason);
            }
        );
    }

    // ::testing::Test

    virtual void SetUp() {
        diagnosticsUnsubscribeDelegate = ws.SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                diagnosticMessages.push_back(
                    SystemAbstractions::sprintf(
                        "%s[%zu]: %s",
                        senderName.c_str(),
                        level,
                        message.c_str()
                    )
                );
            },
            0
        );
    }

    virtual void TearDown() {
        (void)ws.Close();
        diagnosticsUnsubscribeDelegate();
    }
};

TEST_F(WebSocketTests, SendPingNormalWithData) {
    Open(WebSocketClient::Role::Server);
    const auto completion = ws.Ping("Hello");
    EXPECT_TRUE(completion->IsComplete());
    EXPECT_FALSE((bool)completion->GetError());
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ("\x89\x05Hello", connection->webSocketOutput);
}

TEST_F(WebSocketTests, SendPingNormalWithoutData) {
    Open(WebSocketClient::Role::Server);
    (void)ws.Ping();
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ(std::string("\x89\x00", 2), connection->webSocketOutput);
}

TEST_F(WebSocketTests, SendPingAlmostTooMuchData) {
    Open(WebSocketClient::Role::Server);
    (void)ws.Ping(std::string(125, 'x'));
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ("\x89\x7D" + std::string(125, 'x'), connection->webSocketOutput);
}

TEST_F(WebSocketTests, SendPingTooMuchData) {
    Open(WebSocketClient::Role::Server);
    const auto completion = ws.Ping(std::string(126, 'x'));
    ASSERT_TRUE(completion->IsComplete());
    EXPECT_EQ(WebSocketClient::Error::Kind::ProtocolViolation, completion->GetError().kind);
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ("", connection->webSocketOutput);
}

TEST_F(WebSocketTests, ReceivePing) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > pings;
    ws.SetPingDelegate(
        [&pings](
            const std::string& data
        ){
            pings.push_back(data);
        }
    );
    const std::string frame = "\x89\x06World!";
    connection->Receive(frame);
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ(
        (std::vector< std::string >{
            "World!",
        }),
        pings
    );
    ASSERT_EQ(12, connection->webSocketOutput.length());
    ASSERT_EQ("\x8A\x86", connection->webSocketOutput.substr(0, 2));
    for (size_t i = 0; i < 6; ++i) {
        ASSERT_EQ(
            frame[2 + i] ^ connection->webSocketOutput[2 + (i % 4)],
            connection->webSocketOutput[6 + i]
        );
    }
}

TEST_F(WebSocketTests, ReceiveFragmentedPing) {
    Open(WebSocketClient::Role::Client);
    connection->Receive("\x09\x06World!");
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(WebSocketClient::Opcode::Close, frames[0].opcode);
    EXPECT_EQ(1002, CloseCodeOf(frames[0]));
    EXPECT_EQ(
        (std::vector< unsigned int >{
            1002,
        }),
        closeCodes
    );
    EXPECT_TRUE(ws.IsClosed());
}

TEST_F(WebSocketTests, SendPongNormalWithData) {
    Open(WebSocketClient::Role::Server);
    (void)ws.Pong("Hello");
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ("\x8A\x05Hello", connection->webSocketOutput);
}

TEST_F(WebSocketTests, SendPongTooMuchData) {
    Open(WebSocketClient::Role::Server);
    const auto completion = ws.Pong(std::string(126, 'x'));
    EXPECT_TRUE((bool)completion->GetError());
    ASSERT_EQ("", connection->webSocketOutput);
}

TEST_F(WebSocketTests, ReceivePong) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > pongs;
    ws.SetPongDelegate(
        [&pongs](
            const std::string& data
        ){
            pongs.push_back(data);
        }
    );
    connection->Receive("\x8A\x06World!");
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ(
        (std::vector< std::string >{
            "World!",
        }),
        pongs
    );
    ASSERT_EQ("", connection->webSocketOutput);
}

TEST_F(WebSocketTests, SendText) {
    Open(WebSocketClient::Role::Server);
    (void)ws.SendText("Hello, World!");
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ("\x81\x0DHello, World!", connection->webSocketOutput);
}

TEST_F(WebSocketTests, ReceiveText) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    connection->Receive("\x81\x06" "foobar");
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ(
        (std::vector< std::string >{
            "foobar",
        }),
        texts
    );
}

TEST_F(WebSocketTests, SendBinary) {
    Open(WebSocketClient::Role::Server);
    (void)ws.SendBinary("Hello, World!");
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ("\x82\x0DHello, World!", connection->webSocketOutput);
}

TEST_F(WebSocketTests, ReceiveBinary) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > messages;
    ws.SetBinaryDelegate(
        [&messages](
            const std::string& data
        ){
            messages.push_back(data);
        }
    );
    connection->Receive("\x82\x06" "foobar");
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ(
        (std::vector< std::string >{
            "foobar",
        }),
        messages
    );
}

TEST_F(WebSocketTests, SendMasked) {
    Open(WebSocketClient::Role::Client);
    const std::string data = "Hello, World!";
    (void)ws.SendText(data);
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ(19, connection->webSocketOutput.length());
    ASSERT_EQ("\x81\x8D", connection->webSocketOutput.substr(0, 2));
    for (size_t i = 0; i < data.length(); ++i) {
        ASSERT_EQ(
            data[i] ^ connection->webSocketOutput[2 + (i % 4)],
            connection->webSocketOutput[6 + i]
        );
    }
}

TEST_F(WebSocketTests, EveryClientFrameGetsItsOwnMaskingKey) {
    Open(WebSocketClient::Role::Client);
    for (size_t i = 0; i < 8; ++i) {
        (void)ws.SendText("Hello, World!");
    }
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(8, frames.size());
    bool keysDiffer = false;
    for (const auto& frame: frames) {
        ASSERT_TRUE(frame.maskingKey.present);
        EXPECT_EQ("Hello, World!", frame.UnmaskedPayload());
        for (size_t i = 0; i < 4; ++i) {
            if (frame.maskingKey.bytes[i] != frames[0].maskingKey.bytes[i]) {
                keysDiffer = true;
            }
        }
    }
    EXPECT_TRUE(keysDiffer);
}

TEST_F(WebSocketTests, ServerFramesAreNotMasked) {
    Open(WebSocketClient::Role::Server);
    (void)ws.SendText("Hello");
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_FALSE(frames[0].maskingKey.present);
}

TEST_F(WebSocketTests, ReceiveMasked) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    const std::string data = "Hello, World!";
    const char mask[4] = {0x12, 0x34, 0x56, 0x78};
    std::string frame = "\x81\x8D";
    frame += std::string(mask, 4);
    for (size_t i = 0; i < data.length(); ++i) {
        frame.push_back(data[i] ^ mask[i % 4]);
    }
    connection->Receive(frame);
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ(
        (std::vector< std::string >{
            "Hello, World!",
        }),
        texts
    );
}

TEST_F(WebSocketTests, SendFragmentedText) {
    Open(WebSocketClient::Role::Server);
    (void)ws.Send("Hello,", WebSocketClient::Opcode::Text, false);
    (void)ws.Send(" ", WebSocketClient::Opcode::Continuation, false);
    (void)ws.Send("World!", WebSocketClient::Opcode::Continuation, true);
    ASSERT_EQ(
        (
            "\x01\x06Hello,"
            + std::string("\x00\x01", 2) + " "
            + "\x80\x06World!"
        ),
        connection->webSocketOutput
    );
}

TEST_F(WebSocketTests, ReceiveFragmentedText) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    const std::vector< std::string > frames{
        "\x01\x03" "foo",
        std::string("\x00\x01", 2) + "b",
        "\x80\x02" "ar",
    };
    for (const auto& frame: frames) {
        EXPECT_TRUE(texts.empty());
        connection->Receive(frame);
    }
    ASSERT_FALSE(connection->brokenByWebSocket);
    ASSERT_EQ(
        (std::vector< std::string >{
            "foobar",
        }),
        texts
    );
}

TEST_F(WebSocketTests, ReceiveFragmentedBinary) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > messages;
    ws.SetBinaryDelegate(
        [&messages](
            const std::string& data
        ){
            messages.push_back(data);
        }
    );
    const std::vector< std::string > frames{
        "\x02\x04" "abcd",
        std::string("\x00\x04", 2) + "efgh",
        "\x80\x02" "ij",
    };
    for (const auto& frame: frames) {
        connection->Receive(frame);
    }
    ASSERT_EQ(
        (std::vector< std::string >{
            "abcdefghij",
        }),
        messages
    );
}

TEST_F(WebSocketTests, PingBetweenFragmentsDoesNotDisturbMessage) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    connection->Receive("\x01\x03" "foo");
    connection->Receive("\x89\x01" "x");
    connection->Receive("\x80\x03" "bar");
    ASSERT_EQ(
        (std::vector< std::string >{
            "foobar",
        }),
        texts
    );
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(WebSocketClient::Opcode::Pong, frames[0].opcode);
}

TEST_F(WebSocketTests, InitiateCloseThenPeerConfirms) {
    Open(WebSocketClient::Role::Client);
    const auto completion = ws.Close(WebSocketClient::CloseCode::Normal, "Goodbye!");
    EXPECT_TRUE(completion->IsComplete());
    EXPECT_FALSE((bool)completion->GetError());
    EXPECT_TRUE(ws.IsClosed());
    auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(WebSocketClient::Opcode::Close, frames[0].opcode);
    EXPECT_EQ(
        WebSocketClient::EncodeClosePayload(WebSocketClient::CloseCode::Normal, "Goodbye!"),
        frames[0].UnmaskedPayload()
    );
    EXPECT_FALSE(connection->brokenByWebSocket);
    EXPECT_FALSE(ws.WhenClosed()->IsComplete());
    connection->Receive("\x88\x02\x03\xe8");
    EXPECT_TRUE(connection->brokenByWebSocket);
    EXPECT_TRUE(ws.WhenClosed()->IsComplete());
    EXPECT_TRUE(closeCodes.empty());
    frames = connection->OutputFrames();
    EXPECT_EQ(1, frames.size());
}

TEST_F(WebSocketTests, CloseTwiceSendsOnlyOneCloseFrame) {
    Open(WebSocketClient::Role::Server);
    (void)ws.Close(WebSocketClient::CloseCode::Normal);
    const auto secondCompletion = ws.Close(WebSocketClient::CloseCode::GoingAway);
    EXPECT_TRUE(secondCompletion->IsComplete());
    EXPECT_FALSE((bool)secondCompletion->GetError());
    ASSERT_EQ("\x88\x02\x03\xe8", connection->webSocketOutput);
}

TEST_F(WebSocketTests, ReceiveClose) {
    Open(WebSocketClient::Role::Client);
    connection->Receive("\x88\x0C\x03\xe8" "Goodbye!" "!!");
    EXPECT_EQ(
        (std::vector< unsigned int >{
            1000,
        }),
        closeCodes
    );
    EXPECT_EQ(
        (std::vector< std::string >{
            "Goodbye!!!",
        }),
        closeReasons
    );
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(WebSocketClient::Opcode::Close, frames[0].opcode);
    EXPECT_EQ(1000, CloseCodeOf(frames[0]));
    EXPECT_TRUE(connection->brokenByWebSocket);
    EXPECT_TRUE(connection->brokenCleanly);
    EXPECT_TRUE(ws.IsClosed());
    EXPECT_TRUE(ws.WhenClosed()->IsComplete());
}

TEST_F(WebSocketTests, ReceiveCloseWithoutStatusEchoesGoingAway) {
    Open(WebSocketClient::Role::Client);
    connection->Receive(std::string("\x88\x00", 2));
    EXPECT_EQ(
        (std::vector< unsigned int >{
            1001,
        }),
        closeCodes
    );
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(1001, CloseCodeOf(frames[0]));
    EXPECT_TRUE(connection->brokenByWebSocket);
}

TEST_F(WebSocketTests, ReceiveCloseWithReservedStatusEchoesProtocolError) {
    Open(WebSocketClient::Role::Client);
    connection->Receive(std::string("\x88\x02\x03\xed", 4));
    EXPECT_EQ(
        (std::vector< unsigned int >{
            1005,
        }),
        closeCodes
    );
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(WebSocketClient::Opcode::Close, frames[0].opcode);
    EXPECT_EQ(1002, CloseCodeOf(frames[0]));
    EXPECT_TRUE(connection->brokenByWebSocket);
}

TEST_F(WebSocketTests, ReceiveCloseWithApplicationStatusEchoesIt) {
    Open(WebSocketClient::Role::Client);
    connection->Receive(std::string("\x88\x02\x0f\xa0", 4));
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(4000, CloseCodeOf(frames[0]));
}

TEST_F(WebSocketTests, SendAfterCloseFails) {
    Open(WebSocketClient::Role::Server);
    (void)ws.Close(WebSocketClient::CloseCode::Normal);
    const auto outputAfterClose = connection->webSocketOutput;
    const auto completions = std::vector< std::shared_ptr< WebSocketClient::Completion > >{
        ws.SendText("Hello"),
        ws.SendBinary("Hello"),
        ws.Ping("Hello"),
        ws.Pong("Hello"),
    };
    for (const auto& completion: completions) {
        ASSERT_TRUE(completion->IsComplete());
        EXPECT_EQ(WebSocketClient::Error::Kind::TransportFailure, completion->GetError().kind);
    }
    EXPECT_EQ(outputAfterClose, connection->webSocketOutput);
}

TEST_F(WebSocketTests, ViolationReservedBitsSet) {
    Open(WebSocketClient::Role::Client);
    connection->Receive("\x99\x06World!");
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(1002, CloseCodeOf(frames[0]));
    EXPECT_EQ(
        (std::vector< unsigned int >{
            1002,
        }),
        closeCodes
    );
    EXPECT_FALSE(connection->brokenByWebSocket);
}

TEST_F(WebSocketTests, ViolationUnexpectedContinuation) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    connection->Receive("\x80\x06World!");
    EXPECT_TRUE(texts.empty());
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(1002, CloseCodeOf(frames[0]));
}

TEST_F(WebSocketTests, ViolationNewTextMessageDuringFragmentedMessage) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    connection->Receive("\x01\x03" "foo");
    connection->Receive("\x81\x03" "bar");
    connection->Receive("\x80\x03" "baz");
    EXPECT_TRUE(texts.empty());
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(1002, CloseCodeOf(frames[0]));
}

TEST_F(WebSocketTests, ViolationNewBinaryMessageDuringFragmentedMessage) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > messages;
    ws.SetBinaryDelegate(
        [&messages](
            const std::string& data
        ){
            messages.push_back(data);
        }
    );
    connection->Receive("\x02\x03" "foo");
    connection->Receive("\x82\x03" "bar");
    EXPECT_TRUE(messages.empty());
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(1002, CloseCodeOf(frames[0]));
}

TEST_F(WebSocketTests, UnknownOpcodeIgnored) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    connection->Receive("\x83\x03" "foo");
    connection->Receive("\x81\x03" "bar");
    EXPECT_EQ("", connection->webSocketOutput);
    EXPECT_EQ(
        (std::vector< std::string >{
            "bar",
        }),
        texts
    );
}

TEST_F(WebSocketTests, FrameTooBig) {
    Open(WebSocketClient::Role::Client);
    ws.SetMaxFrameSize(4);
    connection->Receive("\x81\x05" "Hello");
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(1009, CloseCodeOf(frames[0]));
    EXPECT_TRUE(connection->brokenByWebSocket);
    EXPECT_TRUE(ws.WhenClosed()->IsComplete());
}

TEST_F(WebSocketTests, ConnectionUnexpectedlyBroken) {
    Open(WebSocketClient::Role::Client);
    connection->BreakFromPeer();
    EXPECT_EQ(
        (std::vector< unsigned int >{
            1006,
        }),
        closeCodes
    );
    EXPECT_EQ(
        (std::vector< std::string >{
            "connection broken by peer",
        }),
        closeReasons
    );
    EXPECT_TRUE(ws.IsClosed());
    EXPECT_TRUE(ws.WhenClosed()->IsComplete());
    EXPECT_EQ("", connection->webSocketOutput);
}

TEST_F(WebSocketTests, BadUtf8InText) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    connection->Receive("\x81\x04\xc0\xaf\xc0\xaf");
    EXPECT_TRUE(texts.empty());
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(1007, CloseCodeOf(frames[0]));
}

TEST_F(WebSocketTests, GoodUtf8InTextSplitIntoFragments) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    // "Hello, World!" in Japanese, split in the middle of a character.
    const std::string message = "\xe3\x81\x93\xe3\x82\x93\xe3\x81\xab\xe3\x81\xa1\xe3\x81\xaf";
    connection->Receive(std::string("\x01\x04", 2) + message.substr(0, 4));
    connection->Receive(std::string("\x80\x0b", 2) + message.substr(4));
    EXPECT_EQ(
        (std::vector< std::string >{
            message,
        }),
        texts
    );
    EXPECT_EQ("", connection->webSocketOutput);
}

TEST_F(WebSocketTests, BadUtf8TruncatedInTextSplitIntoFragments) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    connection->Receive(std::string("\x01\x02", 2) + "\xe3\x81");
    connection->Receive(std::string("\x80\x01", 2) + "x");
    EXPECT_TRUE(texts.empty());
    const auto frames = connection->OutputFrames();
    ASSERT_EQ(1, frames.size());
    EXPECT_EQ(1007, CloseCodeOf(frames[0]));
}

TEST_F(WebSocketTests, FramesAfterViolationIgnored) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    connection->Receive("\x80\x03" "foo" "\x81\x03" "bar");
    EXPECT_TRUE(texts.empty());
    connection->Receive("\x88\x02\x03\xea");
    EXPECT_TRUE(connection->brokenByWebSocket);
}

TEST_F(WebSocketTests, ReceiveTrailer) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    ws.ReceiveTrailer("\x81\x02" "hi" "\x81\x03" "foo");
    EXPECT_EQ(
        (std::vector< std::string >{
            "hi",
            "foo",
        }),
        texts
    );
}

TEST_F(WebSocketTests, LastDelegateRegistrationWins) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > first, second;
    ws.SetTextDelegate(
        [&first](
            const std::string& data
        ){
            first.push_back(data);
        }
    );
    ws.SetTextDelegate(
        [&second](
            const std::string& data
        ){
            second.push_back(data);
        }
    );
    connection->Receive("\x81\x02" "hi");
    EXPECT_TRUE(first.empty());
    EXPECT_EQ(
        (std::vector< std::string >{
            "hi",
        }),
        second
    );
}

TEST_F(WebSocketTests, ReceiveTextAfterMoving) {
    Open(WebSocketClient::Role::Client);
    std::vector< std::string > texts;
    ws.SetTextDelegate(
        [&texts](
            const std::string& data
        ){
            texts.push_back(data);
        }
    );
    WebSocketClient::WebSocket ws2(std::move(ws));
    ws = WebSocketClient::WebSocket();
    connection->Receive("\x81\x03" "foo");
    EXPECT_EQ(
        (std::vector< std::string >{
            "foo",
        }),
        texts
    );
    (void)ws2.Close();
}

TEST_F(WebSocketTests, DiagnosticsReportClose) {
    Open(WebSocketClient::Role::Client);
    diagnosticMessages.clear();
    (void)ws.Close(WebSocketClient::CloseCode::Normal, "bye");
    EXPECT_EQ(
        (std::vector< std::string >{
            "WebSocketClient::WebSocket[1]: Connection to mock-server:5555 closed (1000 bye)",
        }),
        diagnosticMessages
    );
}
