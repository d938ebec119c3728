/**
 * @file NetworkTransport.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::NetworkTransport class.
 *
 * © 2018 by Richard Walters
 */

#include <Http/Connection.hpp>
#include <memory>
#include <mutex>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/NetworkConnection.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <vector>
#include <WebSocketClient/Error.hpp>
#include <WebSocketClient/EventLoop.hpp>
#include <WebSocketClient/NetworkTransport.hpp>

namespace {

    /**
     * This is the state shared between a NetworkConnectionAdapter and the
     * delegates it gives to the network connection.
     */
    struct AdapterState {
        /**
         * This is used to synchronize access to the state.
         */
        std::mutex mutex;

        /**
         * This is the function to call when data is received.
         */
        Http::Connection::DataReceivedDelegate dataReceivedDelegate;

        /**
         * This is the function to call when the connection is broken.
         */
        Http::Connection::BrokenDelegate brokenDelegate;

        /**
         * This holds data received before a data received delegate
         * was set.
         */
        std::vector< uint8_t > heldData;

        /**
         * This flag is set if the connection was broken before a
         * broken delegate was set.
         */
        bool heldBroken = false;

        /**
         * This records whether a held break was graceful.
         */
        bool heldBrokenGraceful = false;
    };

    /**
     * This adapts a SystemAbstractions::NetworkConnection to the
     * Http::Connection interface.
     */
    class NetworkConnectionAdapter
        : public Http::Connection
    {
    public:
        /**
         * This is the constructor.  It starts processing the given
         * connection, which must already be connected.
         *
         * @param[in] networkConnection
         *     This is the connection to adapt.
         *
         * @return
         *     An indication of whether or not processing was started
         *     is returned.
         */
        bool Start(std::shared_ptr< SystemAbstractions::NetworkConnection > networkConnection) {
            networkConnection_ = networkConnection;
            std::weak_ptr< AdapterState > stateWeak(state_);
            return networkConnection_->Process(
                [stateWeak](const std::vector< uint8_t >& message){
                    const auto state = stateWeak.lock();
                    if (state == nullptr) {
                        return;
                    }
                    std::unique_lock< decltype(state->mutex) > lock(state->mutex);
                    if (state->dataReceivedDelegate == nullptr) {
                        (void)state->heldData.insert(
                            state->heldData.end(),
                            message.begin(),
                            message.end()
                        );
                        return;
                    }
                    auto dataReceivedDelegate = state->dataReceivedDelegate;
                    lock.unlock();
                    dataReceivedDelegate(message);
                },
                [stateWeak](bool graceful){
                    const auto state = stateWeak.lock();
                    if (state == nullptr) {
                        return;
                    }
                    std::unique_lock< decltype(state->mutex) > lock(state->mutex);
                    if (state->brokenDelegate == nullptr) {
                        state->heldBroken = true;
                        state->heldBrokenGraceful = graceful;
                        return;
                    }
                    auto brokenDelegate = state->brokenDelegate;
                    lock.unlock();
                    brokenDelegate(graceful);
                }
            );
        }

        // Http::Connection

        virtual std::string GetPeerAddress() override {
            const auto address = networkConnection_->GetPeerAddress();
            return SystemAbstractions::sprintf(
                "%u.%u.%u.%u",
                (unsigned int)((address >> 24) & 0xFF),
                (unsigned int)((address >> 16) & 0xFF),
                (unsigned int)((address >> 8) & 0xFF),
                (unsigned int)(address & 0xFF)
            );
        }

        virtual std::string GetPeerId() override {
            return SystemAbstractions::sprintf(
                "%s:%u",
                GetPeerAddress().c_str(),
                (unsigned int)networkConnection_->GetPeerPort()
            );
        }

        virtual void SetDataReceivedDelegate(DataReceivedDelegate newDataReceivedDelegate) override {
            std::unique_lock< decltype(state_->mutex) > lock(state_->mutex);
            state_->dataReceivedDelegate = newDataReceivedDelegate;
            if (
                (newDataReceivedDelegate == nullptr)
                || state_->heldData.empty()
            ) {
                return;
            }
            std::vector< uint8_t > heldData;
            heldData.swap(state_->heldData);
            lock.unlock();
            newDataReceivedDelegate(heldData);
        }

        virtual void SetBrokenDelegate(BrokenDelegate newBrokenDelegate) override {
            std::unique_lock< decltype(state_->mutex) > lock(state_->mutex);
            state_->brokenDelegate = newBrokenDelegate;
            if (
                (newBrokenDelegate == nullptr)
                || !state_->heldBroken
            ) {
                return;
            }
            state_->heldBroken = false;
            const auto graceful = state_->heldBrokenGraceful;
            lock.unlock();
            newBrokenDelegate(graceful);
        }

        virtual void SendData(const std::vector< uint8_t >& data) override {
            networkConnection_->SendMessage(data);
        }

        virtual void Break(bool clean) override {
            networkConnection_->Close(clean);
        }

    private:
        /**
         * This is the connection being adapted.
         */
        std::shared_ptr< SystemAbstractions::NetworkConnection > networkConnection_;

        /**
         * This is the state shared with the connection's delegates.
         */
        std::shared_ptr< AdapterState > state_ = std::make_shared< AdapterState >();
    };

}

namespace WebSocketClient {

    /**
     * This contains the private properties of a NetworkTransport instance.
     */
    struct NetworkTransport::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is the loop on which host names are resolved and
         * connections are made.
         */
        EventLoop connector;

        // Methods

        /**
         * This is the constructor for the structure.
         */
        Impl()
            : diagnosticsSender("WebSocketClient::NetworkTransport")
        {
        }

        /**
         * This method resolves the given host and connects to it,
         * blocking until the attempt finishes.
         *
         * @param[in] host
         *     This is the host name or address of the server.
         *
         * @param[in] port
         *     This is the port number of the server.
         *
         * @param[in] connectDelegate
         *     This is the function to call when the attempt finishes.
         */
        void ConnectNow(
            const std::string& host,
            uint16_t port,
            ConnectDelegate connectDelegate
        ) {
            const auto address = SystemAbstractions::NetworkConnection::GetAddressOfHost(host);
            if (address == 0) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "unable to resolve host '%s'",
                    host.c_str()
                );
                connectDelegate(
                    Error(
                        Error::Kind::TransportFailure,
                        "unable to resolve host '" + host + "'"
                    ),
                    nullptr
                );
                return;
            }
            const auto networkConnection = std::make_shared< SystemAbstractions::NetworkConnection >();
            (void)networkConnection->SubscribeToDiagnostics(diagnosticsSender.Chain());
            if (!networkConnection->Connect(address, port)) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "unable to connect to %s:%u",
                    host.c_str(),
                    (unsigned int)port
                );
                connectDelegate(
                    Error(
                        Error::Kind::TransportFailure,
                        SystemAbstractions::sprintf(
                            "unable to connect to %s:%u",
                            host.c_str(),
                            (unsigned int)port
                        )
                    ),
                    nullptr
                );
                return;
            }
            const auto connection = std::make_shared< NetworkConnectionAdapter >();
            if (!connection->Start(networkConnection)) {
                diagnosticsSender.SendDiagnosticInformationString(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "unable to process connection"
                );
                networkConnection->Close();
                connectDelegate(
                    Error(
                        Error::Kind::TransportFailure,
                        "unable to process connection"
                    ),
                    nullptr
                );
                return;
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                2,
                "Connected to %s",
                connection->GetPeerId().c_str()
            );
            connectDelegate(Error(), connection);
        }
    };

    NetworkTransport::~NetworkTransport() noexcept {
        if (impl_ == nullptr) {
            return;
        }
        impl_->connector.Stop();
    }
    NetworkTransport::NetworkTransport(NetworkTransport&&) noexcept = default;
    NetworkTransport& NetworkTransport::operator=(NetworkTransport&&) noexcept = default;

    NetworkTransport::NetworkTransport()
        : impl_(new Impl)
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate NetworkTransport::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void NetworkTransport::Connect(
        const std::string& host,
        uint16_t port,
        ConnectDelegate connectDelegate
    ) {
        std::weak_ptr< Impl > implWeak(impl_);
        const auto posted = impl_->connector.Post(
            [implWeak, host, port, connectDelegate]{
                const auto impl = implWeak.lock();
                if (impl == nullptr) {
                    connectDelegate(
                        Error(Error::Kind::TransportFailure, "transport destroyed"),
                        nullptr
                    );
                    return;
                }
                impl->ConnectNow(host, port, connectDelegate);
            }
        );
        if (!posted) {
            connectDelegate(
                Error(Error::Kind::TransportFailure, "transport stopped"),
                nullptr
            );
        }
    }

}
