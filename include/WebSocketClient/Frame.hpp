#ifndef WEB_SOCKET_CLIENT_FRAME_HPP
#define WEB_SOCKET_CLIENT_FRAME_HPP

/**
 * @file Frame.hpp
 *
 * This module declares the WebSocketClient::Frame structure and the
 * functions and classes used to encode and decode frames.
 *
 * © 2018 by Richard Walters
 */

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace WebSocketClient {

    /**
     * This is the default upper limit on the payload length of a single
     * frame received from the remote peer.
     */
    constexpr size_t DEFAULT_MAX_FRAME_SIZE = 1 << 14;

    /**
     * This is the maximum length of a control frame payload.
     */
    constexpr size_t MAX_CONTROL_FRAME_DATA_LENGTH = 125;

    /**
     * These are the kinds of WebSocket frames.  Values not listed here
     * are reserved, but may still be carried by a Frame.
     */
    enum class Opcode : uint8_t {
        Continuation = 0x00,
        Text = 0x01,
        Binary = 0x02,
        Close = 0x08,
        Ping = 0x09,
        Pong = 0x0A,
    };

    /**
     * This holds the optional masking key of a frame.
     */
    struct MaskingKey {
        /**
         * This indicates whether or not the frame carries a masking key.
         */
        bool present = false;

        /**
         * This is the masking key, if present.
         */
        uint8_t bytes[4] = {0, 0, 0, 0};
    };

    /**
     * This represents one WebSocket frame.
     */
    struct Frame {
        // Properties

        /**
         * This indicates whether or not this is the final frame
         * of its message.
         */
        bool fin = true;

        /**
         * These are the three reserved bits (RSV1-RSV3), in the
         * low bits of the value.
         */
        uint8_t reservedBits = 0;

        /**
         * This is the kind of frame.
         */
        Opcode opcode = Opcode::Continuation;

        /**
         * This is the masking key applied to the payload, if any.
         */
        MaskingKey maskingKey;

        /**
         * This is the payload exactly as carried on the wire,
         * which means it is masked if the frame has a masking key.
         */
        std::string payload;

        // Methods

        /**
         * This method returns the payload with the masking key,
         * if any, removed.
         *
         * @return
         *     The unmasked payload is returned.
         */
        std::string UnmaskedPayload() const;

        /**
         * This function constructs a frame carrying the given data,
         * masked with the given masking key if it is present.
         *
         * @param[in] fin
         *     This indicates whether or not this is the final frame
         *     of its message.
         *
         * @param[in] opcode
         *     This is the kind of frame to make.
         *
         * @param[in] data
         *     This is the unmasked payload of the frame.
         *
         * @param[in] maskingKey
         *     This is the masking key to apply, if present.
         *
         * @return
         *     The new frame is returned.
         */
        static Frame Make(
            bool fin,
            Opcode opcode,
            const std::string& data,
            const MaskingKey& maskingKey = MaskingKey()
        );
    };

    /**
     * This function applies the given masking key to the given data.
     * Since masking is an XOR, the same call also removes the mask.
     *
     * @param[in] data
     *     This is the data to mask or unmask.
     *
     * @param[in] maskingKey
     *     This is the masking key to apply.  If it is not present,
     *     the data is returned unchanged.
     *
     * @return
     *     The masked or unmasked data is returned.
     */
    std::string ApplyMask(
        const std::string& data,
        const MaskingKey& maskingKey
    );

    /**
     * This function encodes the given frame into the octets
     * to send over the connection.
     *
     * @param[in] frame
     *     This is the frame to encode.
     *
     * @return
     *     The encoded frame is returned.
     */
    std::vector< uint8_t > EncodeFrame(const Frame& frame);

    /**
     * This class reassembles frames from data received over a connection,
     * which may arrive split at arbitrary points.
     */
    class FrameDecoder {
        // Types
    public:
        /**
         * These are the possible outcomes of trying to extract
         * the next frame from the decoder.
         */
        enum class Result {
            /**
             * A complete frame was extracted.
             */
            Complete,

            /**
             * More data is needed before the next frame is complete.
             */
            Incomplete,

            /**
             * The next frame announces a payload longer than the maximum
             * frame size.  The decoder can't make further progress.
             */
            TooBig,
        };

        // Public methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] maxFrameSize
         *     This is the maximum payload length to accept for
         *     any single frame.
         */
        explicit FrameDecoder(size_t maxFrameSize = DEFAULT_MAX_FRAME_SIZE);

        /**
         * This method changes the maximum payload length to accept
         * for any single frame.
         *
         * @param[in] maxFrameSize
         *     This is the maximum payload length to accept for
         *     any single frame.
         */
        void SetMaxFrameSize(size_t maxFrameSize);

        /**
         * This method appends data received from the remote peer.
         *
         * @param[in] data
         *     This is the data received from the remote peer.
         */
        void Feed(const std::vector< uint8_t >& data);

        /**
         * This method appends data received from the remote peer.
         *
         * @param[in] data
         *     This is the data received from the remote peer.
         */
        void Feed(const std::string& data);

        /**
         * This method attempts to extract the next complete frame.
         *
         * @param[out] frame
         *     This is where to store the frame, if one is complete.
         *
         * @return
         *     An indication of the outcome is returned.
         */
        Result Next(Frame& frame);

        /**
         * This method discards all data held by the decoder.
         */
        void Reset();

        // Private properties
    private:
        /**
         * This is the maximum payload length to accept for
         * any single frame.
         */
        size_t maxFrameSize_;

        /**
         * This is where we put data received before it's been
         * reassembled into frames.
         */
        std::vector< uint8_t > frameReassemblyBuffer_;
    };

}

#endif /* WEB_SOCKET_CLIENT_FRAME_HPP */
