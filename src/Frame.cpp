/**
 * @file Frame.cpp
 *
 * This module contains the implementation of the WebSocketClient::Frame
 * structure and the frame encoding and decoding functions.
 *
 * © 2018 by Richard Walters
 */

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include <WebSocketClient/Frame.hpp>

namespace {

    /**
     * This is the bit to set in the first octet of a WebSocket frame
     * to indicate that the frame is the final one in a message.
     */
    constexpr uint8_t FIN = 0x80;

    /**
     * This is the bit to set in the second octet of a WebSocket frame
     * to indicate that the payload of the frame is masked, and that
     * a masking key is included.
     */
    constexpr uint8_t MASK = 0x80;

}

namespace WebSocketClient {

    std::string Frame::UnmaskedPayload() const {
        return ApplyMask(payload, maskingKey);
    }

    Frame Frame::Make(
        bool fin,
        Opcode opcode,
        const std::string& data,
        const MaskingKey& maskingKey
    ) {
        Frame frame;
        frame.fin = fin;
        frame.opcode = opcode;
        frame.maskingKey = maskingKey;
        frame.payload = ApplyMask(data, maskingKey);
        return frame;
    }

    std::string ApplyMask(
        const std::string& data,
        const MaskingKey& maskingKey
    ) {
        if (!maskingKey.present) {
            return data;
        }
        std::string output(data);
        for (size_t i = 0; i < output.length(); ++i) {
            output[i] = (char)((uint8_t)output[i] ^ maskingKey.bytes[i % 4]);
        }
        return output;
    }

    std::vector< uint8_t > EncodeFrame(const Frame& frame) {
        std::vector< uint8_t > output;
        output.push_back(
            (frame.fin ? FIN : 0)
            + (uint8_t)((frame.reservedBits & 0x07) << 4)
            + ((uint8_t)frame.opcode & 0x0F)
        );
        const uint8_t mask = (frame.maskingKey.present ? MASK : 0);
        const auto length = frame.payload.length();
        if (length < 126) {
            output.push_back((uint8_t)length + mask);
        } else if (length < 65536) {
            output.push_back(0x7E + mask);
            output.push_back((uint8_t)(length >> 8));
            output.push_back((uint8_t)(length & 0xFF));
        } else {
            output.push_back(0x7F + mask);
            const auto length64 = (uint64_t)length;
            for (int shift = 56; shift >= 0; shift -= 8) {
                output.push_back((uint8_t)((length64 >> shift) & 0xFF));
            }
        }
        if (mask != 0) {
            for (size_t i = 0; i < sizeof(frame.maskingKey.bytes); ++i) {
                output.push_back(frame.maskingKey.bytes[i]);
            }
        }
        (void)output.insert(
            output.end(),
            frame.payload.begin(),
            frame.payload.end()
        );
        return output;
    }

    FrameDecoder::FrameDecoder(size_t maxFrameSize)
        : maxFrameSize_(maxFrameSize)
    {
    }

    void FrameDecoder::SetMaxFrameSize(size_t maxFrameSize) {
        maxFrameSize_ = maxFrameSize;
    }

    void FrameDecoder::Feed(const std::vector< uint8_t >& data) {
        (void)frameReassemblyBuffer_.insert(
            frameReassemblyBuffer_.end(),
            data.begin(),
            data.end()
        );
    }

    void FrameDecoder::Feed(const std::string& data) {
        (void)frameReassemblyBuffer_.insert(
            frameReassemblyBuffer_.end(),
            data.begin(),
            data.end()
        );
    }

    FrameDecoder::Result FrameDecoder::Next(Frame& frame) {
        if (frameReassemblyBuffer_.size() < 2) {
            return Result::Incomplete;
        }
        const auto lengthFirstOctet = (frameReassemblyBuffer_[1] & ~MASK);
        size_t headerLength;
        uint64_t payloadLength;
        if (lengthFirstOctet == 0x7E) {
            headerLength = 4;
            if (frameReassemblyBuffer_.size() < headerLength) {
                return Result::Incomplete;
            }
            payloadLength = (
                ((uint64_t)frameReassemblyBuffer_[2] << 8)
                + (uint64_t)frameReassemblyBuffer_[3]
            );
        } else if (lengthFirstOctet == 0x7F) {
            headerLength = 10;
            if (frameReassemblyBuffer_.size() < headerLength) {
                return Result::Incomplete;
            }
            payloadLength = 0;
            for (size_t i = 2; i < 10; ++i) {
                payloadLength = (payloadLength << 8) + (uint64_t)frameReassemblyBuffer_[i];
            }
        } else {
            headerLength = 2;
            payloadLength = (uint64_t)lengthFirstOctet;
        }
        if (payloadLength > (uint64_t)maxFrameSize_) {
            return Result::TooBig;
        }
        const bool masked = ((frameReassemblyBuffer_[1] & MASK) != 0);
        if (masked) {
            headerLength += 4;
        }
        if (frameReassemblyBuffer_.size() < headerLength + payloadLength) {
            return Result::Incomplete;
        }
        frame.fin = ((frameReassemblyBuffer_[0] & FIN) != 0);
        frame.reservedBits = ((frameReassemblyBuffer_[0] >> 4) & 0x07);
        frame.opcode = (Opcode)(frameReassemblyBuffer_[0] & 0x0F);
        frame.maskingKey = MaskingKey();
        if (masked) {
            frame.maskingKey.present = true;
            for (size_t i = 0; i < 4; ++i) {
                frame.maskingKey.bytes[i] = frameReassemblyBuffer_[headerLength - 4 + i];
            }
        }
        (void)frame.payload.assign(
            frameReassemblyBuffer_.begin() + headerLength,
            frameReassemblyBuffer_.begin() + headerLength + (size_t)payloadLength
        );
        (void)frameReassemblyBuffer_.erase(
            frameReassemblyBuffer_.begin(),
            frameReassemblyBuffer_.begin() + headerLength + (size_t)payloadLength
        );
        return Result::Complete;
    }

    void FrameDecoder::Reset() {
        frameReassemblyBuffer_.clear();
    }

}
