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

#include "escapio_attributes.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include <algorithm>
#include <array>
#include <string>

namespace escapio {

static constexpr std::array<std::string_view, 42> safeAttributeNames {
    "align", "alink", "alt", "bgcolor", "border", "cellpadding", "cellspacing",
    "class", "color", "cols", "colspan", "coords", "dir", "face",
    "height", "hspace", "ismap", "lang", "marginheight", "marginwidth", "multiple",
    "nohref", "noresize", "noshade", "nowrap", "ref", "rel", "rev",
    "rows", "rowspan", "scrolling", "shape", "span", "summary", "tabindex",
    "title", "usemap", "valign", "value", "vlink", "vspace", "width",
};

std::span<const std::string_view> safeAttributes() { return safeAttributeNames; }

bool isSafeAttribute(std::string_view name)
{
    auto lowered = boost::algorithm::to_lower_copy(std::string(name));
    return std::binary_search(safeAttributeNames.begin(), safeAttributeNames.end(), std::string_view(lowered));
}

} // namespace escapio
