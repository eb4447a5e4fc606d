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

#include "escapio_encoders.hpp"

#include "detail/utf.hpp"

namespace escapio {

using detail::appendHex;
using detail::appendShortHex;
using detail::forEachCodePoint;
using detail::forEachUtf16Unit;
using detail::isAsciiAlnum;

// C0 controls except tab, LF and CR, DEL and C1 controls
static bool isUndefinedInHtml(char32_t c)
{
    return (c <= 0x1F && c != '\t' && c != '\n' && c != '\r') || (c >= 0x7F && c <= 0x9F);
}

std::string htmlEscape(std::string_view data)
{
    std::string result;
    result.reserve(data.size() * 1.1);
    forEachCodePoint(data, [&result](char32_t c, std::string_view raw) {
        switch (c) {
        case '&':
            result.append("&amp;");
            break;
        case '\"':
            result.append("&quot;");
            break;
        case '\'':
            result.append("&#039;");
            break;
        case '<':
            result.append("&lt;");
            break;
        case '>':
            result.append("&gt;");
            break;
        case '/':
            result.append("&#x2F;");
            break;
        case detail::replacementCharacter:
            result.append(detail::replacementSequence);
            break;
        default:
            result.append(raw);
            break;
        }
    });
    return result;
}

std::string htmlAttrEscape(std::string_view data)
{
    std::string result;
    result.reserve(data.size() * 2);
    forEachCodePoint(data, [&result](char32_t c, std::string_view) {
        if (isAsciiAlnum(c) || c == ',' || c == '.' || c == '-' || c == '_') {
            result += char(c);
            return;
        }
        if (isUndefinedInHtml(c)) {
            result.append("&#xFFFD;");
            return;
        }
        // Only the entities XML knows about, others break XHTML serialization
        switch (c) {
        case '\"':
            result.append("&quot;");
            return;
        case '&':
            result.append("&amp;");
            return;
        case '<':
            result.append("&lt;");
            return;
        case '>':
            result.append("&gt;");
            return;
        }
        if (c < 0x80) {
            result.append("&#x");
            appendHex(result, std::uint8_t(c));
            result += ';';
            return;
        }
        forEachUtf16Unit(c, [&result](std::uint16_t unit) {
            result.append("&#x");
            appendHex(result, unit);
            result += ';';
        });
    });
    return result;
}

std::string cssEscape(std::string_view data)
{
    std::string result;
    result.reserve(data.size() * 2);
    forEachCodePoint(data, [&result](char32_t c, std::string_view) {
        if (isAsciiAlnum(c)) {
            result += char(c);
            return;
        }
        if (c < 0x80) {
            result += '\\';
            appendShortHex(result, std::uint8_t(c));
            result += ' ';
            return;
        }
        forEachUtf16Unit(c, [&result](std::uint16_t unit) {
            result += '\\';
            appendShortHex(result, unit);
            result += ' ';
        });
    });
    return result;
}

std::string jsEscape(std::string_view data)
{
    std::string result;
    result.reserve(data.size() * 2);
    forEachCodePoint(data, [&result](char32_t c, std::string_view) {
        if (isAsciiAlnum(c) || c == ',' || c == '.' || c == '_') {
            result += char(c);
            return;
        }
        if (c < 0x80) {
            result.append("\\x");
            appendHex(result, std::uint8_t(c));
            return;
        }
        forEachUtf16Unit(c, [&result](std::uint16_t unit) {
            result.append("\\u");
            appendHex(result, unit);
        });
    });
    return result;
}

std::string urlParamEscape(std::string_view data)
{
    std::string result;
    result.reserve(data.size() * 1.5);
    for (unsigned char c : data) {
        if (isAsciiAlnum(c) || c == '-' || c == '_' || c == '.') {
            result += char(c);
        } else if (c == ' ') {
            result += '+';
        } else {
            result += '%';
            appendHex(result, std::uint8_t(c));
        }
    }
    return result;
}

} // namespace escapio
