/*
Copyright (c) 2021, Sergei Ilinykh <rion4ik@gmail.com>

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.
2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE FOR
ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
(INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
(INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/

#pragma once

#include "escapio_log.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/locale/utf.hpp>

#include <array>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace escapio::detail {

constexpr char32_t replacementCharacter = 0xFFFD;

// UTF-8 encoding of U+FFFD
constexpr std::string_view replacementSequence = "\xEF\xBF\xBD";

/**
 * @brief Decodes UTF-8 data calling visitor(codePoint, rawSequence) for each code point.
 *
 * A byte which doesn't start a valid shortest-form sequence of a Unicode scalar value
 * (stray continuation byte, truncated or overlong sequence, encoded surrogate, value
 * above U+10FFFF) is reported as U+FFFD with the offending byte as rawSequence.
 * Decoding then resumes at the next byte, so one bad byte never swallows a valid character.
 */
template <typename Visitor> void forEachCodePoint(std::string_view data, Visitor &&visitor)
{
    using utf8 = boost::locale::utf::utf_traits<char>;

    const char *const begin = data.data();
    const char *const end   = begin + data.size();
    const char       *it    = begin;
    while (it != end) {
        const char *start     = it;
        auto        codePoint = utf8::decode(it, end);
        if (codePoint == boost::locale::utf::illegal || codePoint == boost::locale::utf::incomplete) {
            ESCAPIO_TRACE("Replacing malformed UTF-8 byte 0x" << std::hex << (int(*start) & 0xFF) << " at offset "
                                                               << std::dec << (start - begin));
            it = start + 1;
            visitor(replacementCharacter, std::string_view(start, 1));
            continue;
        }
        visitor(char32_t(codePoint), std::string_view(start, std::size_t(it - start)));
    }
}

// Calls visitor for the UTF-16 code units of codePoint: one unit in the BMP, a surrogate pair above it.
template <typename Visitor> void forEachUtf16Unit(char32_t codePoint, Visitor &&visitor)
{
    using utf16 = boost::locale::utf::utf_traits<char16_t>;

    std::array<char16_t, 2> units {};
    auto                    unitsEnd = utf16::encode(codePoint, units.begin());
    for (auto it = units.begin(); it != unitsEnd; ++it) {
        visitor(std::uint16_t(*it));
    }
}

// Appends value as uppercase hex, two digits per byte of T.
template <typename T> inline void appendHex(std::string &out, T value)
{
    boost::algorithm::hex(&value, &value + 1, std::back_inserter(out));
}

// Appends value as uppercase hex without leading zeros. Zero is "0".
template <typename T> inline void appendShortHex(std::string &out, T value)
{
    std::string digits;
    appendHex(digits, value);
    boost::algorithm::trim_left_if(digits, boost::algorithm::is_any_of("0"));
    if (digits.empty()) {
        digits = "0";
    }
    out += digits;
}

inline bool isAsciiAlnum(char32_t c) { return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }

} // namespace escapio::detail
