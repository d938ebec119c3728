/**
 * @file UpgradeRequestHandler.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::UpgradeRequestHandler class.
 *
 * © 2018 by Richard Walters
 */

#include <Http/Client.hpp>
#include <Http/Connection.hpp>
#include <Http/Request.hpp>
#include <Http/Response.hpp>
#include <memory>
#include <mutex>
#include <MessageHeaders/MessageHeaders.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include <WebSocketClient/Completion.hpp>
#include <WebSocketClient/Error.hpp>
#include <WebSocketClient/UpgradeOffer.hpp>
#include <WebSocketClient/UpgradeRequestHandler.hpp>

namespace WebSocketClient {

    /**
     * This contains the private properties of an UpgradeRequestHandler
     * instance.
     */
    struct UpgradeRequestHandler::Impl {
        // Properties

        /**
         * This is used to synchronize access to the handler.
         */
        std::recursive_mutex mutex;

        /**
         * This is the connection on which the request is made.
         * It's released once the handler is done.
         */
        std::shared_ptr< Http::Connection > connection;

        /**
         * This is the request to send.
         */
        Http::Request request;

        /**
         * This is the offer to upgrade the connection.
         */
        UpgradeOffer offer;

        /**
         * This is failed if the upgrade doesn't happen.
         */
        std::shared_ptr< Completion > completion;

        /**
         * This is the function to call if the server switches protocols.
         */
        SwitchDelegate switchDelegate;

        /**
         * This is used to parse the response to the upgrade request.
         */
        Http::Client parser;

        /**
         * This holds the octets of the response received so far.
         */
        std::string responseBuffer;

        // Methods

        /**
         * This is the constructor for the structure.
         *
         * @param[in] offer
         *     This is the offer to upgrade the connection.
         */
        explicit Impl(const UpgradeOffer& offer)
            : offer(offer)
        {
        }

        /**
         * This method lets go of the connection.
         *
         * @return
         *     The connection is returned, or nullptr if the handler
         *     had already let go of it.
         */
        std::shared_ptr< Http::Connection > Detach() {
            const auto detachedConnection = connection;
            if (detachedConnection != nullptr) {
                detachedConnection->SetDataReceivedDelegate(nullptr);
                detachedConnection->SetBrokenDelegate(nullptr);
                connection = nullptr;
            }
            return detachedConnection;
        }

        /**
         * This method gives up on the upgrade.
         *
         * @param[in] error
         *     This describes the failure.
         */
        void Fail(const Error& error) {
            const auto detachedConnection = Detach();
            (void)completion->Fail(error);
            if (detachedConnection != nullptr) {
                detachedConnection->Break(false);
            }
        }

        /**
         * This method is called whenever data is received
         * from the server.
         *
         * @param[in] data
         *     This is the data received from the server.
         */
        void ReceiveData(const std::vector< uint8_t >& data) {
            std::unique_lock< decltype(mutex) > lock(mutex);
            if (connection == nullptr) {
                return;
            }
            (void)responseBuffer.insert(
                responseBuffer.end(),
                data.begin(),
                data.end()
            );
            size_t messageEnd = 0;
            const auto response = parser.ParseResponse(responseBuffer, messageEnd);
            if (
                (response == nullptr)
                || !response->IsCompleteOrError()
            ) {
                if (responseBuffer.length() > MAX_RESPONSE_HEAD_LENGTH) {
                    Fail(
                        Error(
                            Error::Kind::TransportFailure,
                            "response to upgrade request too long"
                        )
                    );
                }
                return;
            }
            if (response->state != Http::Response::State::Complete) {
                Fail(
                    Error(
                        Error::Kind::TransportFailure,
                        "malformed response to upgrade request"
                    )
                );
                return;
            }
            if (!offer.Accepts(*response)) {
                Fail(Error::UpgradeRefused(*response));
                return;
            }
            const auto trailer = responseBuffer.substr(messageEnd);
            (void)Detach();
            const auto switchDelegateCopy = switchDelegate;
            lock.unlock();
            switchDelegateCopy(trailer);
        }

        /**
         * This method is called if the connection is broken before
         * the response arrives.
         */
        void ConnectionBroken() {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (connection == nullptr) {
                return;
            }
            (void)Detach();
            (void)completion->Fail(
                Error(
                    Error::Kind::TransportFailure,
                    "connection broken before upgrade response"
                )
            );
        }
    };

    UpgradeRequestHandler::~UpgradeRequestHandler() noexcept = default;
    UpgradeRequestHandler::UpgradeRequestHandler(UpgradeRequestHandler&&) noexcept = default;
    UpgradeRequestHandler& UpgradeRequestHandler::operator=(UpgradeRequestHandler&&) noexcept = default;

    UpgradeRequestHandler::UpgradeRequestHandler(
        std::shared_ptr< Http::Connection > connection,
        const std::string& host,
        const std::string& target,
        const MessageHeaders::MessageHeaders& extraHeaders,
        const UpgradeOffer& offer,
        std::shared_ptr< Completion > completion,
        SwitchDelegate switchDelegate
    )
        : impl_(std::make_shared< Impl >(offer))
    {
        impl_->connection = connection;
        impl_->completion = completion;
        impl_->switchDelegate = switchDelegate;
        auto& request = impl_->request;
        request.method = "GET";
        (void)request.target.ParseFromString(target);
        request.headers.SetHeader("Content-Type", "text/plain; charset=utf-8");
        request.headers.SetHeader("Content-Length", "0");
        request.headers.SetHeader("Host", host);
        for (const auto& header: extraHeaders.GetAll()) {
            request.headers.AddHeader(header.name, header.value);
        }
        offer.Apply(request);
    }

    void UpgradeRequestHandler::Activate() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->connection == nullptr) {
            return;
        }
        const auto impl = impl_;
        impl_->connection->SetDataReceivedDelegate(
            [impl](const std::vector< uint8_t >& data){
                impl->ReceiveData(data);
            }
        );
        impl_->connection->SetBrokenDelegate(
            [impl](bool){
                impl->ConnectionBroken();
            }
        );
        const auto rawRequest = impl_->request.Generate();
        impl_->connection->SendData(
            std::vector< uint8_t >(
                rawRequest.begin(),
                rawRequest.end()
            )
        );
    }

}
