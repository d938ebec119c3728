/**
 * @file EventLoopGroup.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::EventLoopGroup class.
 *
 * © 2018 by Richard Walters
 */

#include <memory>
#include <mutex>
#include <stddef.h>
#include <vector>
#include <WebSocketClient/EventLoop.hpp>
#include <WebSocketClient/EventLoopGroup.hpp>

namespace WebSocketClient {

    /**
     * This contains the private properties of an EventLoopGroup instance.
     */
    struct EventLoopGroup::Impl {
        /**
         * This is used to synchronize access to the group.
         */
        mutable std::mutex mutex;

        /**
         * These are the loops in the group.
         */
        std::vector< std::shared_ptr< EventLoop > > loops;

        /**
         * This is the index of the loop that Next will return.
         */
        size_t nextLoop = 0;

        /**
         * This flag is set once the group has been shut down.
         */
        bool shutDown = false;
    };

    EventLoopGroup::~EventLoopGroup() noexcept {
        if (impl_ == nullptr) {
            return;
        }
        (void)SyncShutdownGracefully();
    }
    EventLoopGroup::EventLoopGroup(EventLoopGroup&&) noexcept = default;
    EventLoopGroup& EventLoopGroup::operator=(EventLoopGroup&&) noexcept = default;

    EventLoopGroup::EventLoopGroup(size_t numLoops)
        : impl_(new Impl)
    {
        if (numLoops == 0) {
            numLoops = 1;
        }
        for (size_t i = 0; i < numLoops; ++i) {
            impl_->loops.push_back(std::make_shared< EventLoop >());
        }
    }

    size_t EventLoopGroup::GetSize() const {
        return impl_->loops.size();
    }

    std::shared_ptr< EventLoop > EventLoopGroup::Next() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto loop = impl_->loops[impl_->nextLoop];
        impl_->nextLoop = (impl_->nextLoop + 1) % impl_->loops.size();
        return loop;
    }

    bool EventLoopGroup::SyncShutdownGracefully() {
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            if (impl_->shutDown) {
                return false;
            }
            impl_->shutDown = true;
        }
        for (const auto& loop: impl_->loops) {
            loop->Stop();
        }
        return true;
    }

    bool EventLoopGroup::IsShutDown() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->shutDown;
    }

}
