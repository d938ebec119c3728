/**
 * @file FrameSequence.cpp
 *
 * This module contains the implementation of the
 * WebSocketClient::FrameSequence class.
 *
 * © 2018 by Richard Walters
 */

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <Utf8/Utf8.hpp>
#include <WebSocketClient/FrameSequence.hpp>

namespace {

    /**
     * This function finds how much of the given text ends on a character
     * boundary, leaving out a trailing multi-byte character that hasn't
     * been fully received yet.
     *
     * @param[in] text
     *     This is the UTF-8 text to examine.
     *
     * @return
     *     The number of octets at the front of the text that make up
     *     whole characters (or are malformed, and so can be rejected
     *     right away) is returned.
     */
    size_t LengthOfWholeCharacters(const std::string& text) {
        const auto length = text.length();
        for (size_t back = 1; (back <= 3) && (back <= length); ++back) {
            const auto octet = (uint8_t)text[length - back];
            if ((octet & 0xC0) == 0x80) {
                continue;
            }
            size_t needed;
            if ((octet & 0x80) == 0) {
                needed = 1;
            } else if ((octet & 0xE0) == 0xC0) {
                needed = 2;
            } else if ((octet & 0xF0) == 0xE0) {
                needed = 3;
            } else if ((octet & 0xF8) == 0xF0) {
                needed = 4;
            } else {
                return length;
            }
            return (needed > back) ? (length - back) : length;
        }
        return length;
    }

}

namespace WebSocketClient {

    FrameSequence::FrameSequence(Type type)
        : type_(type)
    {
    }

    FrameSequence::Type FrameSequence::GetType() const {
        return type_;
    }

    bool FrameSequence::Append(const Frame& frame) {
        const auto data = frame.UnmaskedPayload();
        switch (type_) {
            case Type::Binary: {
                binaryBuffer_ += data;
            } break;

            case Type::Text: {
                pendingText_ += data;
                const auto wholeLength = LengthOfWholeCharacters(pendingText_);
                const auto whole = pendingText_.substr(0, wholeLength);
                Utf8::Utf8 utf8;
                if (!utf8.IsValidEncoding(whole)) {
                    return false;
                }
                textBuffer_ += whole;
                (void)pendingText_.erase(0, wholeLength);
            } break;

            default: {
            } break;
        }
        return true;
    }

    bool FrameSequence::Finish() const {
        return pendingText_.empty();
    }

    const std::string& FrameSequence::GetBinaryBuffer() const {
        return binaryBuffer_;
    }

    const std::string& FrameSequence::GetTextBuffer() const {
        return textBuffer_;
    }

}
