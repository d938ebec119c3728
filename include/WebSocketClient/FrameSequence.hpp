#ifndef WEB_SOCKET_CLIENT_FRAME_SEQUENCE_HPP
#define WEB_SOCKET_CLIENT_FRAME_SEQUENCE_HPP

/**
 * @file FrameSequence.hpp
 *
 * This module declares the WebSocketClient::FrameSequence class.
 *
 * © 2018 by Richard Walters
 */

#include <string>
#include <WebSocketClient/Frame.hpp>

namespace WebSocketClient {

    /**
     * This class accumulates the frames of one fragmented message
     * until the final fragment arrives.
     */
    class FrameSequence {
        // Types
    public:
        /**
         * This is used to track what kind of message is being
         * received in fragments.
         */
        enum class Type {
            Text,
            Binary,
        };

        // Public methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] type
         *     This is the kind of message the sequence carries.
         *     It never changes.
         */
        explicit FrameSequence(Type type);

        /**
         * This method returns the kind of message the sequence carries.
         *
         * @return
         *     The kind of message the sequence carries is returned.
         */
        Type GetType() const;

        /**
         * This method adds the payload of the given frame to the message.
         * The payload is unmasked first.
         *
         * For text messages, a multi-byte character split across frames
         * is held back until the rest of it arrives.
         *
         * @param[in] frame
         *     This is the frame to add.
         *
         * @return
         *     An indication of whether or not the text received so far
         *     is valid UTF-8 is returned.  Binary messages always
         *     return true.
         */
        bool Append(const Frame& frame);

        /**
         * This method checks that the message ended cleanly, which for
         * text means it doesn't end in the middle of a character.
         *
         * @return
         *     An indication of whether or not the message is complete
         *     and valid is returned.
         */
        bool Finish() const;

        /**
         * This method returns the binary message accumulated so far.
         *
         * @return
         *     The binary message accumulated so far is returned.
         */
        const std::string& GetBinaryBuffer() const;

        /**
         * This method returns the validated text accumulated so far.
         *
         * @return
         *     The validated text accumulated so far is returned.
         */
        const std::string& GetTextBuffer() const;

        // Private properties
    private:
        /**
         * This is the kind of message the sequence carries.
         */
        Type type_;

        /**
         * This is where binary fragments are accumulated.
         */
        std::string binaryBuffer_;

        /**
         * This is where validated text is accumulated.
         */
        std::string textBuffer_;

        /**
         * This holds the octets of a character whose encoding
         * was split across frames.
         */
        std::string pendingText_;
    };

}

#endif /* WEB_SOCKET_CLIENT_FRAME_SEQUENCE_HPP */
