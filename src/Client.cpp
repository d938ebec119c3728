/**
 * @file Client.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::Client class.
 *
 * © 2018 by Richard Walters
 */

#include <assert.h>
#include <atomic>
#include <Http/Connection.hpp>
#include <memory>
#include <mutex>
#include <MessageHeaders/MessageHeaders.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/CryptoRandom.hpp>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <Uri/Uri.hpp>
#include <vector>
#include <WebSocketClient/Client.hpp>
#include <WebSocketClient/CloseCode.hpp>
#include <WebSocketClient/Completion.hpp>
#include <WebSocketClient/Error.hpp>
#include <WebSocketClient/EventLoop.hpp>
#include <WebSocketClient/EventLoopConnection.hpp>
#include <WebSocketClient/EventLoopGroup.hpp>
#include <WebSocketClient/Masking.hpp>
#include <WebSocketClient/NetworkTransport.hpp>
#include <WebSocketClient/OpenSslTlsWrapper.hpp>
#include <WebSocketClient/UpgradeOffer.hpp>
#include <WebSocketClient/UpgradeRequestHandler.hpp>
#include <WebSocketClient/WebSocket.hpp>

namespace {

    /**
     * This is the port used for "ws" targets which don't give one.
     */
    constexpr uint16_t DEFAULT_WS_PORT = 80;

    /**
     * This is the port used for "wss" targets which don't give one.
     */
    constexpr uint16_t DEFAULT_WSS_PORT = 443;

    /**
     * This holds everything needed to carry one connection attempt
     * through to the opened WebSocket.  Each step runs on the event
     * loop to which the connection is bound.
     */
    struct ConnectAttempt
        : public std::enable_shared_from_this< ConnectAttempt >
    {
        // Properties

        /**
         * This is used to publish diagnostic messages.
         */
        std::shared_ptr< SystemAbstractions::DiagnosticsSender > diagnosticsSender;

        /**
         * This is completed once the attempt succeeds or fails.
         */
        std::shared_ptr< WebSocketClient::Completion > completion;

        /**
         * This is the loop on which the connection is handled.
         */
        std::shared_ptr< WebSocketClient::EventLoop > loop;

        /**
         * This is used to secure the connection, for "wss" targets.
         */
        std::shared_ptr< WebSocketClient::TlsWrapper > tlsWrapper;

        /**
         * These are the TLS settings to use, or nullptr for defaults.
         */
        std::shared_ptr< WebSocketClient::TlsConfiguration > tlsConfiguration;

        /**
         * This is the largest frame the WebSocket will accept.
         */
        size_t maxFrameSize = WebSocketClient::DEFAULT_MAX_FRAME_SIZE;

        /**
         * This indicates whether or not to secure the connection.
         */
        bool secure = false;

        /**
         * This is the host name or address of the server.
         */
        std::string host;

        /**
         * This is the path, and query if any, of the resource.
         */
        std::string path;

        /**
         * These are additional headers to send with the upgrade request.
         */
        MessageHeaders::MessageHeaders headers;

        /**
         * This is the function to call with the new WebSocket.
         */
        WebSocketClient::Client::UpgradeDelegate onUpgrade;

        /**
         * This is the connection to the server, once made.
         */
        std::shared_ptr< Http::Connection > connection;

        // Methods

        /**
         * This method fails the attempt and closes the connection.
         *
         * @param[in] error
         *     This describes the failure.
         */
        void Fail(const WebSocketClient::Error& error) {
            (void)completion->Fail(error);
            if (connection != nullptr) {
                connection->Break(false);
                connection = nullptr;
            }
        }

        /**
         * This method is called by the transport once the connection
         * attempt finishes.
         *
         * @param[in] error
         *     This describes the failure, if any.
         *
         * @param[in] newConnection
         *     This is the new connection, if the attempt succeeded.
         */
        void Connected(
            const WebSocketClient::Error& error,
            std::shared_ptr< Http::Connection > newConnection
        ) {
            if (error) {
                (void)completion->Fail(error);
                return;
            }
            const auto boundConnection = WebSocketClient::EventLoopConnection::Bind(newConnection, loop);
            const auto self = shared_from_this();
            const auto posted = loop->Post(
                [self, boundConnection]{
                    self->connection = boundConnection;
                    if (self->secure) {
                        self->Secure();
                    } else {
                        self->StartUpgrade();
                    }
                }
            );
            if (!posted) {
                newConnection->Break(false);
                (void)completion->Fail(
                    WebSocketClient::Error(
                        WebSocketClient::Error::Kind::AlreadyShutDown,
                        "event loop shut down"
                    )
                );
            }
        }

        /**
         * This method starts the TLS handshake.
         */
        void Secure() {
            diagnosticsSender->SendDiagnosticInformationString(
                2,
                "Starting TLS handshake..."
            );
            const auto configuration = (
                (tlsConfiguration == nullptr)
                ? WebSocketClient::TlsConfiguration()
                : *tlsConfiguration
            );
            const auto self = shared_from_this();
            const auto tlsConnection = tlsWrapper->WrapClient(
                connection,
                host,
                configuration,
                [self](const WebSocketClient::Error& error){
                    const auto posted = self->loop->Post(
                        [self, error]{
                            self->Secured(error);
                        }
                    );
                    if (!posted) {
                        (void)self->completion->Fail(
                            WebSocketClient::Error(
                                WebSocketClient::Error::Kind::AlreadyShutDown,
                                "event loop shut down"
                            )
                        );
                    }
                }
            );
            if (tlsConnection == nullptr) {
                connection->Break(false);
                connection = nullptr;
                return;
            }
            connection = tlsConnection;
        }

        /**
         * This method is called once the TLS handshake finishes.
         *
         * @param[in] error
         *     This describes the failure, if any.
         */
        void Secured(const WebSocketClient::Error& error) {
            if (error) {
                Fail(error);
                return;
            }
            if (connection == nullptr) {
                return;
            }
            diagnosticsSender->SendDiagnosticInformationString(
                2,
                "TLS handshake complete."
            );
            StartUpgrade();
        }

        /**
         * This method sends the upgrade request.
         */
        void StartUpgrade() {
            diagnosticsSender->SendDiagnosticInformationFormatted(
                2,
                "Requesting upgrade of %s",
                path.c_str()
            );
            SystemAbstractions::CryptoRandom rng;
            const WebSocketClient::UpgradeOffer offer(rng);
            const auto self = shared_from_this();
            WebSocketClient::UpgradeRequestHandler handler(
                connection,
                host,
                path,
                headers,
                offer,
                completion,
                [self](const std::string& trailer){
                    self->Upgraded(trailer);
                }
            );
            handler.Activate();
        }

        /**
         * This method is called once the server has switched protocols.
         *
         * @param[in] trailer
         *     These are any octets received after the response head.
         */
        void Upgraded(const std::string& trailer) {
            const auto webSocket = std::make_shared< WebSocketClient::WebSocket >();
            webSocket->SetMaxFrameSize(maxFrameSize);
            webSocket->Open(connection, WebSocketClient::Role::Client);
            connection = nullptr;
            diagnosticsSender->SendDiagnosticInformationString(
                2,
                "Connection established."
            );
            if (onUpgrade == nullptr) {
                diagnosticsSender->SendDiagnosticInformationString(
                    2,
                    "No one to take the connection; closing it."
                );
                (void)webSocket->Close(WebSocketClient::CloseCode::GoingAway);
                (void)completion->Succeed();
                return;
            }
            onUpgrade(webSocket);
            (void)completion->Succeed();
            webSocket->ReceiveTrailer(trailer);
        }
    };

    /**
     * This function forms the path of the given URI, with its query,
     * as it appears in the target of an HTTP request.
     *
     * @param[in] uri
     *     This is the URI whose path to form.
     *
     * @return
     *     The path and query are returned.
     */
    std::string PathAndQuery(const Uri::Uri& uri) {
        std::string path;
        bool first = true;
        for (const auto& segment: uri.GetPath()) {
            if (!first) {
                path += '/';
            }
            first = false;
            path += segment;
        }
        if (path.empty()) {
            path = "/";
        }
        if (uri.HasQuery()) {
            path += '?';
            path += uri.GetQuery();
        }
        return path;
    }

}

namespace WebSocketClient {

    /**
     * This contains the private properties of a Client instance.
     */
    struct Client::Impl {
        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        std::shared_ptr< SystemAbstractions::DiagnosticsSender > diagnosticsSender
            = std::make_shared< SystemAbstractions::DiagnosticsSender >("WebSocketClient::Client");

        /**
         * This is used to synchronize access to the transport and
         * TLS wrapper.
         */
        std::mutex mutex;

        /**
         * These are the settings used for every connection.
         */
        Configuration configuration;

        /**
         * This is the group of event loops used for connections.
         */
        std::shared_ptr< EventLoopGroup > group;

        /**
         * This indicates whether or not the client made, and so owns,
         * the event loop group.
         */
        bool ownsGroup = false;

        /**
         * This is set once an owned event loop group is shut down.
         */
        std::atomic< bool > isShutDown{false};

        /**
         * This is used to open connections.
         */
        std::shared_ptr< Transport > transport;

        /**
         * This is used to secure connections.
         */
        std::shared_ptr< TlsWrapper > tlsWrapper;
    };

    Client::~Client() noexcept {
        if (impl_ == nullptr) {
            return;
        }
        if (impl_->ownsGroup) {
            assert(impl_->isShutDown.load());
        }
    }
    Client::Client(Client&&) noexcept = default;
    Client& Client::operator=(Client&&) noexcept = default;

    Client::Client(const Configuration& configuration)
        : impl_(new Impl)
    {
        impl_->configuration = configuration;
        impl_->group = std::make_shared< EventLoopGroup >(1);
        impl_->ownsGroup = true;
        impl_->transport = std::make_shared< NetworkTransport >();
        impl_->tlsWrapper = std::make_shared< OpenSslTlsWrapper >();
    }

    Client::Client(
        std::shared_ptr< EventLoopGroup > group,
        const Configuration& configuration
    )
        : impl_(new Impl)
    {
        impl_->configuration = configuration;
        impl_->group = group;
        impl_->transport = std::make_shared< NetworkTransport >();
        impl_->tlsWrapper = std::make_shared< OpenSslTlsWrapper >();
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Client::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender->SubscribeToDiagnostics(delegate, minLevel);
    }

    void Client::SetTransport(std::shared_ptr< Transport > transport) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->transport = transport;
    }

    void Client::SetTlsWrapper(std::shared_ptr< TlsWrapper > tlsWrapper) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->tlsWrapper = tlsWrapper;
    }

    std::shared_ptr< Completion > Client::Connect(
        const std::string& url,
        const MessageHeaders::MessageHeaders& headers,
        UpgradeDelegate onUpgrade
    ) {
        Uri::Uri uri;
        if (!uri.ParseFromString(url)) {
            impl_->diagnosticsSender->SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "invalid URL '%s'",
                url.c_str()
            );
            return Completion::MakeFailed(
                Error(Error::Kind::InvalidUrl, "invalid URL '" + url + "'")
            );
        }
        auto scheme = SystemAbstractions::ToLower(uri.GetScheme());
        if (scheme.empty()) {
            scheme = "ws";
        }
        auto host = uri.GetHost();
        if (host.empty()) {
            host = "localhost";
        }
        uint16_t port;
        if (uri.HasPort()) {
            port = uri.GetPort();
        } else if (scheme == "wss") {
            port = DEFAULT_WSS_PORT;
        } else {
            port = DEFAULT_WS_PORT;
        }
        return Connect(
            scheme,
            host,
            port,
            PathAndQuery(uri),
            headers,
            onUpgrade
        );
    }

    std::shared_ptr< Completion > Client::Connect(
        const std::string& scheme,
        const std::string& host,
        uint16_t port,
        const std::string& path,
        const MessageHeaders::MessageHeaders& headers,
        UpgradeDelegate onUpgrade
    ) {
        if (
            (scheme != "ws")
            && (scheme != "wss")
        ) {
            impl_->diagnosticsSender->SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "unsupported scheme '%s'",
                scheme.c_str()
            );
            return Completion::MakeFailed(
                Error(Error::Kind::InvalidUrl, "unsupported scheme '" + scheme + "'")
            );
        }
        if (
            impl_->isShutDown.load()
            || impl_->group->IsShutDown()
        ) {
            impl_->diagnosticsSender->SendDiagnosticInformationString(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "client already shut down"
            );
            return Completion::MakeFailed(
                Error(Error::Kind::AlreadyShutDown, "client already shut down")
            );
        }
        const auto attempt = std::make_shared< ConnectAttempt >();
        attempt->diagnosticsSender = impl_->diagnosticsSender;
        attempt->completion = std::make_shared< Completion >();
        attempt->loop = impl_->group->Next();
        attempt->tlsConfiguration = impl_->configuration.tlsConfiguration;
        attempt->maxFrameSize = impl_->configuration.maxFrameSize;
        attempt->secure = (scheme == "wss");
        attempt->host = host;
        attempt->path = (
            ((path.length() > 0) && (path[0] == '/'))
            ? path
            : "/" + path
        );
        attempt->headers = headers;
        attempt->onUpgrade = onUpgrade;
        std::shared_ptr< Transport > transport;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            transport = impl_->transport;
            attempt->tlsWrapper = impl_->tlsWrapper;
        }
        const auto diagnosticsSender = impl_->diagnosticsSender;
        attempt->completion->OnComplete(
            [diagnosticsSender, host, port](const Error& error){
                if (!error) {
                    return;
                }
                switch (error.kind) {
                    case Error::Kind::UpgradeRefused: {
                        diagnosticsSender->SendDiagnosticInformationFormatted(
                            SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                            "Got back response: %u %s",
                            error.response.statusCode,
                            error.response.reasonPhrase.c_str()
                        );
                    } break;

                    case Error::Kind::TransportFailure: {
                        diagnosticsSender->SendDiagnosticInformationFormatted(
                            SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                            "unable to connect to %s:%u (%s)",
                            host.c_str(),
                            (unsigned int)port,
                            error.message.c_str()
                        );
                    } break;

                    case Error::Kind::AlreadyShutDown: {
                        diagnosticsSender->SendDiagnosticInformationFormatted(
                            SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                            "client shut down while connecting to %s:%u",
                            host.c_str(),
                            (unsigned int)port
                        );
                    } break;

                    default: {
                        diagnosticsSender->SendDiagnosticInformationFormatted(
                            SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                            "Unexpected failure connecting to %s:%u (%s)",
                            host.c_str(),
                            (unsigned int)port,
                            ToString(error).c_str()
                        );
                    } break;
                }
            }
        );
        impl_->diagnosticsSender->SendDiagnosticInformationFormatted(
            2,
            "Connecting to %s:%u...",
            host.c_str(),
            (unsigned int)port
        );
        transport->Connect(
            host,
            port,
            [attempt](
                const Error& error,
                std::shared_ptr< Http::Connection > connection
            ){
                attempt->Connected(error, connection);
            }
        );
        return attempt->completion;
    }

    Error Client::SyncShutdown() {
        if (!impl_->ownsGroup) {
            return Error();
        }
        bool expected = false;
        if (!impl_->isShutDown.compare_exchange_strong(expected, true)) {
            impl_->diagnosticsSender->SendDiagnosticInformationString(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "client already shut down"
            );
            return Error(Error::Kind::AlreadyShutDown, "client already shut down");
        }
        (void)impl_->group->SyncShutdownGracefully();
        return Error();
    }

}
