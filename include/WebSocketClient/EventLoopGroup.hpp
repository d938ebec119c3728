#ifndef WEB_SOCKET_CLIENT_EVENT_LOOP_GROUP_HPP
#define WEB_SOCKET_CLIENT_EVENT_LOOP_GROUP_HPP

/**
 * @file EventLoopGroup.hpp
 *
 * This module declares the WebSocketClient::EventLoopGroup class.
 *
 * © 2018 by Richard Walters
 */

#include <memory>
#include <stddef.h>
#include <WebSocketClient/EventLoop.hpp>

namespace WebSocketClient {

    /**
     * This is a fixed pool of event loops.  Connections are spread
     * across the loops, each connection staying on the loop it was
     * given for its whole lifetime.
     */
    class EventLoopGroup {
        // Lifecycle management
    public:
        ~EventLoopGroup() noexcept;
        EventLoopGroup(const EventLoopGroup&) = delete;
        EventLoopGroup(EventLoopGroup&&) noexcept;
        EventLoopGroup& operator=(const EventLoopGroup&) = delete;
        EventLoopGroup& operator=(EventLoopGroup&&) noexcept;

        // Public methods
    public:
        /**
         * This constructs the group and starts its loops.
         *
         * @param[in] numLoops
         *     This is the number of loops in the group.  At least
         *     one loop is always made.
         */
        explicit EventLoopGroup(size_t numLoops = 1);

        /**
         * This method returns the number of loops in the group.
         *
         * @return
         *     The number of loops in the group is returned.
         */
        size_t GetSize() const;

        /**
         * This method picks the next loop to use, going around
         * the loops in turn.
         *
         * @return
         *     The loop to use is returned.
         */
        std::shared_ptr< EventLoop > Next();

        /**
         * This method stops every loop in the group, waiting for
         * queued tasks to finish.
         *
         * @return
         *     An indication of whether or not this call shut the group
         *     down is returned.  It's false if the group was already
         *     shut down.
         */
        bool SyncShutdownGracefully();

        /**
         * This method indicates whether or not the group has been
         * shut down.
         *
         * @return
         *     An indication of whether or not the group has been
         *     shut down is returned.
         */
        bool IsShutDown() const;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

}

#endif /* WEB_SOCKET_CLIENT_EVENT_LOOP_GROUP_HPP */
