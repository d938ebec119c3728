/**
 * @file OpenSslTlsWrapper.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::OpenSslTlsWrapper class.
 *
 * © 2018 by Richard Walters
 */

#include <functional>
#include <Http/Connection.hpp>
#include <memory>
#include <mutex>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <queue>
#include <stdint.h>
#include <string>
#include <vector>
#include <WebSocketClient/Error.hpp>
#include <WebSocketClient/OpenSslTlsWrapper.hpp>
#include <WebSocketClient/TlsWrapper.hpp>

namespace {

    /**
     * This is the number of octets to read from the TLS engine at a time.
     */
    constexpr size_t READ_CHUNK_SIZE = 4096;

    /**
     * This is the type of pointer used to own a TLS context.
     */
    typedef std::unique_ptr< SSL_CTX, decltype(&SSL_CTX_free) > SslContextPtr;

    /**
     * This is the type of pointer used to own a TLS session.
     */
    typedef std::unique_ptr< SSL, decltype(&SSL_free) > SslPtr;

    /**
     * This function returns a description of the last error
     * raised by OpenSSL, clearing the error queue.
     *
     * @param[in] what
     *     This describes the operation that failed.
     *
     * @return
     *     The description of the error is returned.
     */
    std::string DescribeSslError(const std::string& what) {
        const auto code = ERR_get_error();
        ERR_clear_error();
        if (code == 0) {
            return what;
        }
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        return what + ": " + buffer;
    }

    /**
     * This function adds the certificates in the given PEM text
     * to the trust store of the given context.
     *
     * @param[in] context
     *     This is the context whose trust store to add to.
     *
     * @param[in] pem
     *     This holds the certificates to add.
     *
     * @return
     *     An indication of whether or not at least one certificate
     *     was added is returned.
     */
    bool LoadCaCertificates(
        SSL_CTX* context,
        const std::string& pem
    ) {
        std::unique_ptr< BIO, decltype(&BIO_free) > bio(
            BIO_new_mem_buf(pem.data(), (int)pem.length()),
            BIO_free
        );
        if (bio == nullptr) {
            return false;
        }
        const auto store = SSL_CTX_get_cert_store(context);
        size_t numAdded = 0;
        for (;;) {
            std::unique_ptr< X509, decltype(&X509_free) > certificate(
                PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr),
                X509_free
            );
            if (certificate == nullptr) {
                break;
            }
            if (X509_STORE_add_cert(store, certificate.get()) == 1) {
                ++numAdded;
            }
        }
        ERR_clear_error();
        return (numAdded > 0);
    }

    /**
     * This holds the state of one TLS client connection.  The encrypted
     * side talks to the wrapped connection; the plaintext side is
     * presented through TlsConnection.
     */
    struct TlsState {
        // Properties

        /**
         * This is used to synchronize access to the state.
         */
        std::recursive_mutex mutex;

        /**
         * This is a queue of functions to be called without holding the
         * mutex, used to call delegates without risking deadlocks.
         */
        std::queue< std::function< void() > > delegateCallQueue;

        /**
         * This is the connection carrying the encrypted stream.
         */
        std::shared_ptr< Http::Connection > inner;

        /**
         * This is the TLS context.
         */
        SslContextPtr context{nullptr, SSL_CTX_free};

        /**
         * This is the TLS session.  It owns both memory buffers.
         */
        SslPtr ssl{nullptr, SSL_free};

        /**
         * This is the buffer through which encrypted data received
         * from the peer is given to the TLS engine.
         */
        BIO* networkToSsl = nullptr;

        /**
         * This is the buffer through which the TLS engine produces
         * encrypted data to send to the peer.
         */
        BIO* sslToNetwork = nullptr;

        /**
         * This is the function to call once the handshake finishes.
         * It's cleared once called.
         */
        WebSocketClient::TlsWrapper::HandshakeDelegate handshakeDelegate;

        /**
         * This flag is set once the handshake has succeeded.
         */
        bool handshakeComplete = false;

        /**
         * This flag is set once the connection has been broken,
         * by either side.
         */
        bool broken = false;

        /**
         * This holds plaintext the application asked to send before
         * the handshake finished.
         */
        std::vector< uint8_t > pendingPlaintext;

        /**
         * This is the function to call when plaintext is received.
         */
        Http::Connection::DataReceivedDelegate dataReceivedDelegate;

        /**
         * This is the function to call when the connection is broken.
         */
        Http::Connection::BrokenDelegate brokenDelegate;

        /**
         * This holds plaintext received while no data received delegate
         * was set.
         */
        std::vector< uint8_t > heldPlaintext;

        /**
         * This flag is set if the connection was broken while no
         * broken delegate was set.
         */
        bool heldBroken = false;

        // Methods

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
         * This method queues a call to the handshake delegate, if it
         * hasn't been called already.
         *
         * @param[in] error
         *     This describes the failure, if any.
         */
        void ReportHandshake(const WebSocketClient::Error& error) {
            if (handshakeDelegate == nullptr) {
                return;
            }
            auto handshakeDelegateCopy = handshakeDelegate;
            handshakeDelegate = nullptr;
            delegateCallQueue.push(
                [handshakeDelegateCopy, error]{
                    handshakeDelegateCopy(error);
                }
            );
        }

        /**
         * This method sends to the peer whatever encrypted data the
         * TLS engine has produced.
         */
        void FlushOutput() {
            std::vector< uint8_t > output;
            uint8_t buffer[READ_CHUNK_SIZE];
            while (BIO_ctrl_pending(sslToNetwork) > 0) {
                const auto amount = BIO_read(sslToNetwork, buffer, sizeof(buffer));
                if (amount <= 0) {
                    break;
                }
                (void)output.insert(output.end(), buffer, buffer + amount);
            }
            if (!output.empty()) {
                inner->SendData(output);
            }
        }

        /**
         * This method gives up on the connection, reporting the failure
         * through the handshake delegate if the handshake is still
         * underway, or the broken delegate otherwise.
         *
         * @param[in] message
         *     This describes the failure.
         */
        void Fail(const std::string& message) {
            if (broken) {
                return;
            }
            broken = true;
            const auto wasHandshakeComplete = handshakeComplete;
            ReportHandshake(WebSocketClient::Error(WebSocketClient::Error::Kind::TransportFailure, message));
            inner->Break(false);
            if (wasHandshakeComplete) {
                ReportBroken();
            }
        }

        /**
         * This method queues a call to the broken delegate, or notes
         * the break for when one is set.
         */
        void ReportBroken() {
            if (brokenDelegate == nullptr) {
                heldBroken = true;
                return;
            }
            auto brokenDelegateCopy = brokenDelegate;
            delegateCallQueue.push(
                [brokenDelegateCopy]{
                    brokenDelegateCopy(false);
                }
            );
        }

        /**
         * This method hands the given plaintext to the TLS engine.
         *
         * @param[in] plaintext
         *     This is the plaintext to encrypt and send.
         */
        void WritePlaintext(const std::vector< uint8_t >& plaintext) {
            if (plaintext.empty()) {
                return;
            }
            const auto amount = SSL_write(ssl.get(), plaintext.data(), (int)plaintext.size());
            if (amount <= 0) {
                Fail(DescribeSslError("TLS write failed"));
                return;
            }
            FlushOutput();
        }

        /**
         * This method drives the TLS handshake forward.
         */
        void ContinueHandshake() {
            const auto result = SSL_do_handshake(ssl.get());
            FlushOutput();
            if (result == 1) {
                handshakeComplete = true;
                ReportHandshake(WebSocketClient::Error());
                std::vector< uint8_t > plaintext;
                plaintext.swap(pendingPlaintext);
                WritePlaintext(plaintext);
                ReadPlaintext();
                return;
            }
            switch (SSL_get_error(ssl.get(), result)) {
                case SSL_ERROR_WANT_READ:
                case SSL_ERROR_WANT_WRITE: {
                } break;

                default: {
                    std::string message = DescribeSslError("TLS handshake failed");
                    const auto verifyResult = SSL_get_verify_result(ssl.get());
                    if (verifyResult != X509_V_OK) {
                        message += " (";
                        message += X509_verify_cert_error_string(verifyResult);
                        message += ")";
                    }
                    Fail(message);
                } break;
            }
        }

        /**
         * This method takes whatever plaintext the TLS engine has
         * decrypted and hands it to the application.
         */
        void ReadPlaintext() {
            std::vector< uint8_t > plaintext;
            uint8_t buffer[READ_CHUNK_SIZE];
            bool peerClosed = false;
            bool failed = false;
            for (;;) {
                const auto amount = SSL_read(ssl.get(), buffer, sizeof(buffer));
                if (amount > 0) {
                    (void)plaintext.insert(plaintext.end(), buffer, buffer + amount);
                    continue;
                }
                switch (SSL_get_error(ssl.get(), amount)) {
                    case SSL_ERROR_WANT_READ:
                    case SSL_ERROR_WANT_WRITE: {
                    } break;

                    case SSL_ERROR_ZERO_RETURN: {
                        peerClosed = true;
                    } break;

                    default: {
                        failed = true;
                    } break;
                }
                break;
            }
            FlushOutput();
            if (!plaintext.empty()) {
                if (dataReceivedDelegate == nullptr) {
                    (void)heldPlaintext.insert(
                        heldPlaintext.end(),
                        plaintext.begin(),
                        plaintext.end()
                    );
                } else {
                    auto dataReceivedDelegateCopy = dataReceivedDelegate;
                    delegateCallQueue.push(
                        [dataReceivedDelegateCopy, plaintext]{
                            dataReceivedDelegateCopy(plaintext);
                        }
                    );
                }
            }
            if (failed) {
                Fail(DescribeSslError("TLS read failed"));
            } else if (peerClosed) {
                broken = true;
                ReportBroken();
            }
        }

        /**
         * This method is called whenever encrypted data is received
         * from the peer.
         *
         * @param[in] data
         *     This is the data received from the peer.
         */
        void ReceiveCiphertext(const std::vector< uint8_t >& data) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (broken) {
                return;
            }
            if (BIO_write(networkToSsl, data.data(), (int)data.size()) != (int)data.size()) {
                Fail("unable to buffer received data for TLS");
                return;
            }
            if (handshakeComplete) {
                ReadPlaintext();
            } else {
                ContinueHandshake();
            }
        }

        /**
         * This method is called if the connection is broken by the peer.
         */
        void ConnectionBroken() {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (broken) {
                return;
            }
            broken = true;
            ReportHandshake(
                WebSocketClient::Error(
                    WebSocketClient::Error::Kind::TransportFailure,
                    "connection broken during TLS handshake"
                )
            );
            ReportBroken();
        }
    };

    /**
     * This is the connection which carries plaintext over TLS.
     */
    class TlsConnection
        : public Http::Connection
    {
    public:
        /**
         * This is the constructor.
         *
         * @param[in] state
         *     This is the state of the TLS client connection.
         */
        explicit TlsConnection(std::shared_ptr< TlsState > state)
            : state_(state)
        {
        }

        ~TlsConnection() noexcept {
            std::lock_guard< decltype(state_->mutex) > lock(state_->mutex);
            state_->inner->SetDataReceivedDelegate(nullptr);
            state_->inner->SetBrokenDelegate(nullptr);
        }

        // Http::Connection

        virtual std::string GetPeerAddress() override {
            return state_->inner->GetPeerAddress();
        }

        virtual std::string GetPeerId() override {
            return state_->inner->GetPeerId();
        }

        virtual void SetDataReceivedDelegate(DataReceivedDelegate newDataReceivedDelegate) override {
            std::unique_lock< decltype(state_->mutex) > lock(state_->mutex);
            state_->dataReceivedDelegate = newDataReceivedDelegate;
            if (
                (newDataReceivedDelegate != nullptr)
                && !state_->heldPlaintext.empty()
            ) {
                std::vector< uint8_t > heldPlaintext;
                heldPlaintext.swap(state_->heldPlaintext);
                state_->delegateCallQueue.push(
                    [newDataReceivedDelegate, heldPlaintext]{
                        newDataReceivedDelegate(heldPlaintext);
                    }
                );
            }
            lock.unlock();
            state_->ProcessDelegateCallQueue();
        }

        virtual void SetBrokenDelegate(BrokenDelegate newBrokenDelegate) override {
            std::unique_lock< decltype(state_->mutex) > lock(state_->mutex);
            state_->brokenDelegate = newBrokenDelegate;
            if (
                (newBrokenDelegate != nullptr)
                && state_->heldBroken
            ) {
                state_->heldBroken = false;
                state_->delegateCallQueue.push(
                    [newBrokenDelegate]{
                        newBrokenDelegate(false);
                    }
                );
            }
            lock.unlock();
            state_->ProcessDelegateCallQueue();
        }

        virtual void SendData(const std::vector< uint8_t >& data) override {
            std::unique_lock< decltype(state_->mutex) > lock(state_->mutex);
            if (state_->broken) {
                return;
            }
            if (state_->handshakeComplete) {
                state_->WritePlaintext(data);
            } else {
                (void)state_->pendingPlaintext.insert(
                    state_->pendingPlaintext.end(),
                    data.begin(),
                    data.end()
                );
            }
            lock.unlock();
            state_->ProcessDelegateCallQueue();
        }

        virtual void Break(bool clean) override {
            std::unique_lock< decltype(state_->mutex) > lock(state_->mutex);
            if (state_->broken) {
                return;
            }
            state_->broken = true;
            if (
                clean
                && state_->handshakeComplete
            ) {
                (void)SSL_shutdown(state_->ssl.get());
                state_->FlushOutput();
            }
            state_->inner->Break(clean);
        }

    private:
        /**
         * This is the state of the TLS client connection.
         */
        std::shared_ptr< TlsState > state_;
    };

}

namespace WebSocketClient {

    std::shared_ptr< Http::Connection > OpenSslTlsWrapper::WrapClient(
        std::shared_ptr< Http::Connection > connection,
        const std::string& serverName,
        const TlsConfiguration& configuration,
        HandshakeDelegate handshakeDelegate
    ) {
        const auto state = std::make_shared< TlsState >();
        state->inner = connection;
        state->context.reset(SSL_CTX_new(TLS_client_method()));
        if (state->context == nullptr) {
            handshakeDelegate(
                Error(
                    Error::Kind::TransportFailure,
                    DescribeSslError("unable to create TLS context")
                )
            );
            return nullptr;
        }
        (void)SSL_CTX_set_min_proto_version(state->context.get(), TLS1_2_VERSION);
        if (configuration.verifyPeer) {
            SSL_CTX_set_verify(state->context.get(), SSL_VERIFY_PEER, nullptr);
            const auto trustLoaded = (
                configuration.caCertificates.empty()
                ? (SSL_CTX_set_default_verify_paths(state->context.get()) == 1)
                : LoadCaCertificates(state->context.get(), configuration.caCertificates)
            );
            if (!trustLoaded) {
                handshakeDelegate(
                    Error(
                        Error::Kind::TransportFailure,
                        DescribeSslError("unable to load trusted certificates")
                    )
                );
                return nullptr;
            }
        } else {
            SSL_CTX_set_verify(state->context.get(), SSL_VERIFY_NONE, nullptr);
        }
        state->ssl.reset(SSL_new(state->context.get()));
        if (state->ssl == nullptr) {
            handshakeDelegate(
                Error(
                    Error::Kind::TransportFailure,
                    DescribeSslError("unable to create TLS session")
                )
            );
            return nullptr;
        }
        (void)SSL_set_tlsext_host_name(state->ssl.get(), serverName.c_str());
        if (configuration.verifyPeer) {
            (void)SSL_set1_host(state->ssl.get(), serverName.c_str());
        }
        state->networkToSsl = BIO_new(BIO_s_mem());
        state->sslToNetwork = BIO_new(BIO_s_mem());
        if (
            (state->networkToSsl == nullptr)
            || (state->sslToNetwork == nullptr)
        ) {
            if (state->networkToSsl != nullptr) {
                BIO_free(state->networkToSsl);
            }
            if (state->sslToNetwork != nullptr) {
                BIO_free(state->sslToNetwork);
            }
            handshakeDelegate(
                Error(
                    Error::Kind::TransportFailure,
                    DescribeSslError("unable to create TLS buffers")
                )
            );
            return nullptr;
        }
        SSL_set_bio(state->ssl.get(), state->networkToSsl, state->sslToNetwork);
        SSL_set_connect_state(state->ssl.get());
        state->handshakeDelegate = handshakeDelegate;
        const auto tlsConnection = std::make_shared< TlsConnection >(state);
        std::weak_ptr< TlsState > stateWeak(state);
        connection->SetDataReceivedDelegate(
            [stateWeak](const std::vector< uint8_t >& data){
                const auto state = stateWeak.lock();
                if (state) {
                    state->ReceiveCiphertext(data);
                    state->ProcessDelegateCallQueue();
                }
            }
        );
        connection->SetBrokenDelegate(
            [stateWeak](bool){
                const auto state = stateWeak.lock();
                if (state) {
                    state->ConnectionBroken();
                    state->ProcessDelegateCallQueue();
                }
            }
        );
        {
            std::lock_guard< decltype(state->mutex) > lock(state->mutex);
            state->ContinueHandshake();
        }
        state->ProcessDelegateCallQueue();
        return tlsConnection;
    }

}
