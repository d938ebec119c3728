/**
 * @file EventLoopConnection.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::EventLoopConnection class.
 *
 * © 2018 by Richard Walters
 */

#include <Http/Connection.hpp>
#include <memory>
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>
#include <WebSocketClient/EventLoop.hpp>
#include <WebSocketClient/EventLoopConnection.hpp>

namespace WebSocketClient {

    /**
     * This contains the private properties of an EventLoopConnection
     * instance.
     */
    struct EventLoopConnection::Impl {
        // Properties

        /**
         * This is used to synchronize access to the delegates.
         */
        std::mutex mutex;

        /**
         * This is the connection being wrapped.
         */
        std::shared_ptr< Http::Connection > inner;

        /**
         * This is the loop on which delegates are called.
         */
        std::shared_ptr< EventLoop > loop;

        /**
         * This is the function to call when data is received.
         */
        DataReceivedDelegate dataReceivedDelegate;

        /**
         * This is the function to call when the connection is broken.
         */
        BrokenDelegate brokenDelegate;

        /**
         * This holds data received while no data received delegate
         * was set.
         */
        std::vector< uint8_t > heldData;

        /**
         * This flag is set if the connection was broken while no
         * broken delegate was set.
         */
        bool heldBroken = false;

        /**
         * This records whether a held break was graceful.
         */
        bool heldBrokenGraceful = false;

        // Methods

        /**
         * This method is called on the loop to hand received data
         * to the current data received delegate.
         *
         * @param[in] data
         *     This is the data that was received.
         */
        void DeliverData(const std::vector< uint8_t >& data) {
            std::unique_lock< decltype(mutex) > lock(mutex);
            if (dataReceivedDelegate == nullptr) {
                (void)heldData.insert(heldData.end(), data.begin(), data.end());
                return;
            }
            auto dataReceivedDelegateCopy = dataReceivedDelegate;
            lock.unlock();
            dataReceivedDelegateCopy(data);
        }

        /**
         * This method is called on the loop to report that the
         * connection was broken.
         *
         * @param[in] graceful
         *     This indicates whether or not the peer closed
         *     the connection gracefully.
         */
        void DeliverBroken(bool graceful) {
            std::unique_lock< decltype(mutex) > lock(mutex);
            if (brokenDelegate == nullptr) {
                heldBroken = true;
                heldBrokenGraceful = graceful;
                return;
            }
            auto brokenDelegateCopy = brokenDelegate;
            lock.unlock();
            brokenDelegateCopy(graceful);
        }
    };

    EventLoopConnection::~EventLoopConnection() noexcept {
        if (impl_->inner != nullptr) {
            impl_->inner->SetDataReceivedDelegate(nullptr);
            impl_->inner->SetBrokenDelegate(nullptr);
        }
    }

    EventLoopConnection::EventLoopConnection()
        : impl_(new Impl)
    {
    }

    std::shared_ptr< EventLoopConnection > EventLoopConnection::Bind(
        std::shared_ptr< Http::Connection > inner,
        std::shared_ptr< EventLoop > loop
    ) {
        std::shared_ptr< EventLoopConnection > connection(new EventLoopConnection());
        connection->impl_->inner = inner;
        connection->impl_->loop = loop;
        std::weak_ptr< Impl > implWeak(connection->impl_);
        inner->SetDataReceivedDelegate(
            [implWeak, loop](const std::vector< uint8_t >& data){
                (void)loop->Post(
                    [implWeak, data]{
                        const auto impl = implWeak.lock();
                        if (impl) {
                            impl->DeliverData(data);
                        }
                    }
                );
            }
        );
        inner->SetBrokenDelegate(
            [implWeak, loop](bool graceful){
                (void)loop->Post(
                    [implWeak, graceful]{
                        const auto impl = implWeak.lock();
                        if (impl) {
                            impl->DeliverBroken(graceful);
                        }
                    }
                );
            }
        );
        return connection;
    }

    std::shared_ptr< EventLoop > EventLoopConnection::GetLoop() const {
        return impl_->loop;
    }

    std::string EventLoopConnection::GetPeerAddress() {
        return impl_->inner->GetPeerAddress();
    }

    std::string EventLoopConnection::GetPeerId() {
        return impl_->inner->GetPeerId();
    }

    void EventLoopConnection::SetDataReceivedDelegate(DataReceivedDelegate newDataReceivedDelegate) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->dataReceivedDelegate = newDataReceivedDelegate;
        if (
            (newDataReceivedDelegate == nullptr)
            || impl_->heldData.empty()
        ) {
            return;
        }
        std::vector< uint8_t > heldData;
        heldData.swap(impl_->heldData);
        std::weak_ptr< Impl > implWeak(impl_);
        (void)impl_->loop->Post(
            [implWeak, heldData]{
                const auto impl = implWeak.lock();
                if (impl) {
                    impl->DeliverData(heldData);
                }
            }
        );
    }

    void EventLoopConnection::SetBrokenDelegate(BrokenDelegate newBrokenDelegate) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->brokenDelegate = newBrokenDelegate;
        if (
            (newBrokenDelegate == nullptr)
            || !impl_->heldBroken
        ) {
            return;
        }
        impl_->heldBroken = false;
        const auto graceful = impl_->heldBrokenGraceful;
        std::weak_ptr< Impl > implWeak(impl_);
        (void)impl_->loop->Post(
            [implWeak, graceful]{
                const auto impl = implWeak.lock();
                if (impl) {
                    impl->DeliverBroken(graceful);
                }
            }
        );
    }

    void EventLoopConnection::SendData(const std::vector< uint8_t >& data) {
        impl_->inner->SendData(data);
    }

    void EventLoopConnection::Break(bool clean) {
        impl_->inner->Break(clean);
    }

}
