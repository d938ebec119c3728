/**
 * @file WebSocket.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::WebSocket class.
 *
 * © 2018 by Richard Walters
 */

#include <assert.h>
#include <functional>
#include <Http/Connection.hpp>
#include <memory>
#include <mutex>
#include <queue>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/CryptoRandom.hpp>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <vector>
#include <WebSocketClient/CloseCode.hpp>
#include <WebSocketClient/Completion.hpp>
#include <WebSocketClient/Error.hpp>
#include <WebSocketClient/Frame.hpp>
#include <WebSocketClient/FrameSequence.hpp>
#include <WebSocketClient/Masking.hpp>
#include <WebSocketClient/WebSocket.hpp>

namespace WebSocketClient {

    /**
     * This contains the private properties of a WebSocket instance.
     */
    struct WebSocket::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is used to synchronize access to the WebSocket.
         */
        std::recursive_mutex mutex;

        /**
         * This is a queue of functions to be called without holding the mutex,
         * used to call delegates without risking deadlocks.
         */
        std::queue< std::function< void() > > delegateCallQueue;

        /**
         * This is the connection to use to send and receive frames.
         */
        std::shared_ptr< Http::Connection > connection;

        /**
         * This is the role to play in the connection.
         */
        Role role = Role::Client;

        /**
         * This flag indicates whether or not the WebSocket has sent
         * a close frame (or given up on the connection).  Once set,
         * no more messages are sent.
         */
        bool closed = false;

        /**
         * This flag indicates whether or not the WebSocket closed
         * because the peer broke the rules of the protocol.  Once set,
         * frames other than close frames are ignored.
         */
        bool failed = false;

        /**
         * This flag indicates whether or not the connection has
         * been torn down.
         */
        bool tornDown = false;

        /**
         * This is used to put received data back together into frames.
         */
        FrameDecoder frameDecoder;

        /**
         * This is the message currently being received in fragments,
         * if any.
         */
        std::unique_ptr< FrameSequence > frameSequence;

        /**
         * This completes when the connection is torn down.
         */
        std::shared_ptr< Completion > whenClosed = std::make_shared< Completion >();

        /**
         * This is the function to call whenever the WebSocket
         * has received a close frame or has been closed due to an error.
         */
        CloseReceivedDelegate closeDelegate;

        /**
         * This is the function to call whenever a ping message
         * is received by the WebSocket.
         */
        MessageReceivedDelegate pingDelegate;

        /**
         * This is the function to call whenever a pong message
         * is received by the WebSocket.
         */
        MessageReceivedDelegate pongDelegate;

        /**
         * This is the function to call whenever a text message
         * is received by the WebSocket.
         */
        MessageReceivedDelegate textDelegate;

        /**
         * This is the function to call whenever a binary message
         * is received by the WebSocket.
         */
        MessageReceivedDelegate binaryDelegate;

        /**
         * This is used to generate masking keys that have strong entropy.
         */
        SystemAbstractions::CryptoRandom rng;

        // Methods

        /**
         * This is the constructor for the structure.
         */
        Impl()
            : diagnosticsSender("WebSocketClient::WebSocket")
        {
        }

        /**
         * This method safely empties the delegate call queue, calling each
         * queued function in order.
         */
        void ProcessDelegateCallQueue() {
            std::unique_lock< decltype(mutex) > lock(mutex);
            while (!delegateCallQueue.empty()) {
                decltype(delegateCallQueue) delegates;
                delegates.swap(delegateCallQueue);
                lock.unlock();
                while (!delegates.empty()) {
                    delegates.front()();
                    delegates.pop();
                }
                lock.lock();
            }
        }

        /**
         * This method queues a call to the given message delegate.
         *
         * @param[in] delegate
         *     This is the delegate to call.
         *
         * @param[in] message
         *     This is the message to give to the delegate.
         */
        void QueueMessage(
            const MessageReceivedDelegate& delegate,
            const std::string& message
        ) {
            if (delegate == nullptr) {
                return;
            }
            auto delegateCopy = delegate;
            delegateCallQueue.push(
                [delegateCopy, message]{
                    delegateCopy(message);
                }
            );
        }

        /**
         * This method queues a call to the close delegate.
         *
         * @param[in] code
         *     This is the status code of the closure.
         *
         * @param[in] reason
         *     This is the reason text of the closure.
         */
        void QueueClose(
            CloseCode code,
            const std::string& reason
        ) {
            if (closeDelegate == nullptr) {
                return;
            }
            auto closeDelegateCopy = closeDelegate;
            delegateCallQueue.push(
                [closeDelegateCopy, code, reason]{
                    closeDelegateCopy(code, reason);
                }
            );
        }

        /**
         * This method constructs and sends a frame from the WebSocket,
         * masking it if required by the role.
         *
         * @param[in] fin
         *     This indicates whether or not to set the FIN bit in the frame.
         *
         * @param[in] opcode
         *     This is the opcode to set in the frame.
         *
         * @param[in] payload
         *     This is the payload to include in the frame.
         */
        void SendFrame(
            bool fin,
            Opcode opcode,
            const std::string& payload
        ) {
            const auto frame = Frame::Make(
                fin,
                opcode,
                payload,
                MakeMaskingKey(role, rng)
            );
            connection->SendData(EncodeFrame(frame));
        }

        /**
         * This method sends an application frame, unless the WebSocket
         * is closed.
         *
         * @param[in] fin
         *     This indicates whether or not to set the FIN bit in the frame.
         *
         * @param[in] opcode
         *     This is the opcode to set in the frame.
         *
         * @param[in] payload
         *     This is the payload to include in the frame.
         *
         * @return
         *     A completion is returned which succeeds once the frame
         *     is handed to the connection.
         */
        std::shared_ptr< Completion > SendApplicationFrame(
            bool fin,
            Opcode opcode,
            const std::string& payload
        ) {
            if (connection == nullptr) {
                return Completion::MakeFailed(
                    Error(Error::Kind::TransportFailure, "WebSocket not open")
                );
            }
            if (closed) {
                return Completion::MakeFailed(
                    Error(Error::Kind::TransportFailure, "WebSocket closed")
                );
            }
            SendFrame(fin, opcode, payload);
            return Completion::MakeSucceeded();
        }

        /**
         * This method lets go of the connection, completing the
         * whenClosed completion.
         *
         * @param[in] clean
         *     This indicates whether or not to close the connection
         *     gracefully.
         */
        void TearDown(bool clean) {
            if (tornDown) {
                return;
            }
            tornDown = true;
            closed = true;
            frameSequence = nullptr;
            connection->Break(clean);
            const auto whenClosedCopy = whenClosed;
            delegateCallQueue.push(
                [whenClosedCopy]{
                    (void)whenClosedCopy->Succeed();
                }
            );
        }

        /**
         * This method initiates the closing of the WebSocket,
         * sending a close frame with the given status code and reason.
         *
         * @param[in] code
         *     This is the status code to send in the close frame.
         *
         * @param[in] reason
         *     This is the reason text to send in the close frame.
         *
         * @return
         *     A completion is returned which succeeds once the close
         *     frame is handed to the connection.
         */
        std::shared_ptr< Completion > Close(
            CloseCode code,
            const std::string& reason
        ) {
            if (closed) {
                return Completion::MakeSucceeded();
            }
            closed = true;
            SendFrame(true, Opcode::Close, EncodeClosePayload(code, reason));
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Connection to %s closed (%u %s)",
                connection->GetPeerId().c_str(),
                (unsigned int)code,
                reason.c_str()
            );
            return Completion::MakeSucceeded();
        }

        /**
         * This method closes the WebSocket because the peer broke the
         * rules of the protocol, notifying the user.
         *
         * @param[in] code
         *     This is the status code to send in the close frame.
         *
         * @param[in] reason
         *     This is the reason text to send in the close frame.
         */
        void Fail(
            CloseCode code,
            const std::string& reason
        ) {
            frameSequence = nullptr;
            if (failed) {
                return;
            }
            failed = true;
            diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Protocol violation by %s: %s",
                connection->GetPeerId().c_str(),
                reason.c_str()
            );
            if (closed) {
                return;
            }
            QueueClose(code, reason);
            (void)Close(code, reason);
        }

        /**
         * This method is called when a close frame is received.
         *
         * @param[in] payload
         *     This is the payload of the close frame.
         */
        void ReceiveClose(const std::string& payload) {
            if (closed) {
                TearDown(true);
                return;
            }
            CloseCode code;
            std::string reason;
            if (!DecodeClosePayload(payload, code, reason)) {
                code = CloseCode::GoingAway;
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Connection to %s closed by peer (%u)",
                connection->GetPeerId().c_str(),
                (unsigned int)code
            );
            QueueClose(code, reason);
            if (!IsSendableCloseCode(code)) {
                code = CloseCode::ProtocolError;
            }
            (void)Close(code, "");
            TearDown(true);
        }

        /**
         * This method adds a data frame to the message being received.
         *
         * @param[in] frame
         *     This is the frame to add.
         */
        void ReceiveDataFrame(const Frame& frame) {
            switch (frame.opcode) {
                case Opcode::Text:
                case Opcode::Binary: {
                    if (frameSequence != nullptr) {
                        Fail(CloseCode::ProtocolError, "last message incomplete");
                        return;
                    }
                    frameSequence.reset(
                        new FrameSequence(
                            (frame.opcode == Opcode::Text)
                            ? FrameSequence::Type::Text
                            : FrameSequence::Type::Binary
                        )
                    );
                } break;

                default: {
                    if (frameSequence == nullptr) {
                        Fail(CloseCode::ProtocolError, "unexpected continuation frame");
                        return;
                    }
                } break;
            }
            if (!frameSequence->Append(frame)) {
                Fail(CloseCode::InvalidFramePayloadData, "invalid UTF-8 encoding in text message");
                return;
            }
            if (!frame.fin) {
                return;
            }
            if (!frameSequence->Finish()) {
                Fail(CloseCode::InvalidFramePayloadData, "invalid UTF-8 encoding in text message");
                return;
            }
            switch (frameSequence->GetType()) {
                case FrameSequence::Type::Text: {
                    QueueMessage(textDelegate, frameSequence->GetTextBuffer());
                } break;

                case FrameSequence::Type::Binary: {
                    QueueMessage(binaryDelegate, frameSequence->GetBinaryBuffer());
                } break;

                default: {
                } break;
            }
            frameSequence = nullptr;
        }

        /**
         * This method is called whenever the WebSocket has reassembled
         * a complete frame received from the remote peer.
         *
         * @param[in] frame
         *     This is the frame received.
         */
        void ReceiveFrame(const Frame& frame) {
            if (frame.opcode == Opcode::Close) {
                ReceiveClose(frame.UnmaskedPayload());
                return;
            }
            if (failed) {
                return;
            }
            if (frame.reservedBits != 0) {
                Fail(CloseCode::ProtocolError, "reserved bits set");
                return;
            }
            switch (frame.opcode) {
                case Opcode::Ping: {
                    if (!frame.fin) {
                        Fail(CloseCode::ProtocolError, "fragmented ping");
                        return;
                    }
                    const auto data = frame.UnmaskedPayload();
                    QueueMessage(pingDelegate, data);
                    if (!closed) {
                        SendFrame(true, Opcode::Pong, data);
                    }
                } break;

                case Opcode::Pong: {
                    QueueMessage(pongDelegate, frame.UnmaskedPayload());
                } break;

                case Opcode::Text:
                case Opcode::Binary:
                case Opcode::Continuation: {
                    ReceiveDataFrame(frame);
                } break;

                default: {
                } break;
            }
        }

        /**
         * This method is called whenever the WebSocket receives data from
         * the remote peer.
         *
         * @param[in] data
         *     This is the data received from the remote peer.
         */
        void ReceiveData(const std::vector< uint8_t >& data) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (
                (connection == nullptr)
                || tornDown
            ) {
                return;
            }
            frameDecoder.Feed(data);
            while (!tornDown) {
                Frame frame;
                switch (frameDecoder.Next(frame)) {
                    case FrameDecoder::Result::Complete: {
                        ReceiveFrame(frame);
                    } break;

                    case FrameDecoder::Result::TooBig: {
                        Fail(CloseCode::MessageTooBig, "frame too large");
                        TearDown(false);
                        return;
                    } break;

                    default: {
                        return;
                    } break;
                }
            }
        }

        /**
         * This method is called if the connection is broken by
         * the remote peer.
         */
        void ConnectionBroken() {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (
                (connection == nullptr)
                || tornDown
            ) {
                return;
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Connection to %s broken by peer",
                connection->GetPeerId().c_str()
            );
            if (!closed) {
                QueueClose(CloseCode::AbnormalClosure, "connection broken by peer");
            }
            TearDown(false);
        }
    };

    WebSocket::~WebSocket() noexcept {
        if (impl_ == nullptr) {
            return;
        }
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->connection != nullptr) {
            assert(impl_->closed);
            impl_->connection->SetDataReceivedDelegate(nullptr);
            impl_->connection->SetBrokenDelegate(nullptr);
            auto connection = impl_->connection;
            impl_->connection = nullptr;
            const auto tornDown = impl_->tornDown;
            lock.unlock();
            if (!tornDown) {
                connection->Break(false);
            }
        }
    }
    WebSocket::WebSocket(WebSocket&&) noexcept = default;
    WebSocket& WebSocket::operator=(WebSocket&&) noexcept = default;

    WebSocket::WebSocket()
        : impl_(new Impl)
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate WebSocket::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void WebSocket::SetMaxFrameSize(size_t maxFrameSize) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->frameDecoder.SetMaxFrameSize(maxFrameSize);
    }

    void WebSocket::Open(
        std::shared_ptr< Http::Connection > connection,
        Role role
    ) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->connection = connection;
        impl_->role = role;
        std::weak_ptr< Impl > implWeak(impl_);
        impl_->connection->SetDataReceivedDelegate(
            [implWeak](const std::vector< uint8_t >& data){
                const auto impl = implWeak.lock();
                if (impl) {
                    impl->ReceiveData(data);
                    impl->ProcessDelegateCallQueue();
                }
            }
        );
        impl_->connection->SetBrokenDelegate(
            [implWeak](bool){
                const auto impl = implWeak.lock();
                if (impl) {
                    impl->ConnectionBroken();
                    impl->ProcessDelegateCallQueue();
                }
            }
        );
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Connection to %s opened",
            connection->GetPeerId().c_str()
        );
    }

    void WebSocket::ReceiveTrailer(const std::string& trailer) {
        if (trailer.empty()) {
            return;
        }
        impl_->ReceiveData(
            std::vector< uint8_t >(
                trailer.begin(),
                trailer.end()
            )
        );
        impl_->ProcessDelegateCallQueue();
    }

    std::shared_ptr< Completion > WebSocket::Close(
        CloseCode code,
        const std::string& reason
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->connection == nullptr) {
            return Completion::MakeFailed(
                Error(Error::Kind::TransportFailure, "WebSocket not open")
            );
        }
        return impl_->Close(code, reason);
    }

    std::shared_ptr< Completion > WebSocket::Ping(const std::string& data) {
        if (data.length() > MAX_CONTROL_FRAME_DATA_LENGTH) {
            return Completion::MakeFailed(
                Error(Error::Kind::ProtocolViolation, "control frame payload too large")
            );
        }
        return Send(data, Opcode::Ping, true);
    }

    std::shared_ptr< Completion > WebSocket::Pong(const std::string& data) {
        if (data.length() > MAX_CONTROL_FRAME_DATA_LENGTH) {
            return Completion::MakeFailed(
                Error(Error::Kind::ProtocolViolation, "control frame payload too large")
            );
        }
        return Send(data, Opcode::Pong, true);
    }

    std::shared_ptr< Completion > WebSocket::SendText(const std::string& data) {
        return Send(data, Opcode::Text, true);
    }

    std::shared_ptr< Completion > WebSocket::SendBinary(const std::string& data) {
        return Send(data, Opcode::Binary, true);
    }

    std::shared_ptr< Completion > WebSocket::Send(
        const std::string& data,
        Opcode opcode,
        bool fin
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->SendApplicationFrame(fin, opcode, data);
    }

    std::shared_ptr< Completion > WebSocket::WhenClosed() const {
        return impl_->whenClosed;
    }

    bool WebSocket::IsClosed() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->closed;
    }

    void WebSocket::SetCloseDelegate(CloseReceivedDelegate closeDelegate) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->closeDelegate = closeDelegate;
    }

    void WebSocket::SetPingDelegate(MessageReceivedDelegate pingDelegate) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->pingDelegate = pingDelegate;
    }

    void WebSocket::SetPongDelegate(MessageReceivedDelegate pongDelegate) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->pongDelegate = pongDelegate;
    }

    void WebSocket::SetTextDelegate(MessageReceivedDelegate textDelegate) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->textDelegate = textDelegate;
    }

    void WebSocket::SetBinaryDelegate(MessageReceivedDelegate binaryDelegate) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->binaryDelegate = binaryDelegate;
    }

}
