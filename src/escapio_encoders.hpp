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

#include <string>
#include <string_view>

namespace escapio {

/**
 * @brief escapes untrusted data for HTML element content
 *
 *   <div>...ESCAPED DATA...</div>
 *
 * & < > " ' become &amp; &lt; &gt; &quot; &#039; and / becomes &#x2F; as it helps to end a tag.
 * Anything else, including non-ASCII text, is copied as is. Malformed UTF-8 is replaced with U+FFFD.
 * Not idempotent: escaping "&amp;" gives "&amp;amp;".
 * Not sufficient for attribute, script or style contexts.
 */
std::string htmlEscape(std::string_view data);

/**
 * @brief escapes untrusted data for a quoted value of a safe HTML attribute
 *
 *   <div title="...ESCAPED DATA...">
 *
 * Everything except [A-Za-z0-9,.-_] is escaped. Characters undefined in HTML (C0 controls other than
 * tab, LF and CR, DEL and C1 controls) become &#xFFFD;, " & < > become named entities and the rest
 * become &#xHH; (ASCII) or one &#xHHHH; per UTF-16 code unit.
 *
 * Only safe for the attributes accepted by isSafeAttribute(). Attributes like href, src or event
 * handlers can still be abused with a correctly escaped value.
 */
std::string htmlAttrEscape(std::string_view data);

/**
 * @brief escapes untrusted data for a CSS property value
 *
 *   <style>selector { property: "...ESCAPED DATA..."; }</style>
 *   <span style="property: ...ESCAPED DATA...">
 *
 * Everything except [A-Za-z0-9] becomes \HEX followed by a space which terminates the escape,
 * so a following hex digit is not taken as part of it. HEX has no leading zeros (NUL is "\0 ").
 * Non-ASCII characters are escaped per UTF-16 code unit.
 *
 * Never safe for url(), behavior, -moz-binding or expression() values.
 */
std::string cssEscape(std::string_view data);

/**
 * @brief escapes untrusted data for a quoted JavaScript string literal
 *
 *   <script>var value = '...ESCAPED DATA...';</script>
 *
 * Everything except [A-Za-z0-9,._] becomes \xHH (ASCII) or \uHHHH per UTF-16 code unit.
 * The literal must already be quoted. Functions evaluating their argument as code, like
 * setTimeout('...'), remain unsafe.
 */
std::string jsEscape(std::string_view data);

/**
 * @brief form-urlencodes a single query parameter value
 *
 *   <a href="/search?value=...ESCAPED DATA...">
 *
 * [A-Za-z0-9-_.] are kept, space becomes '+' and every other byte becomes %HH.
 * Must not be used for whole URLs.
 */
std::string urlParamEscape(std::string_view data);

} // namespace escapio
