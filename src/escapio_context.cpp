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

#include "escapio_context.hpp"

#include "escapio_encoders.hpp"
#include "escapio_log.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <array>
#include <stdexcept>
#include <utility>

namespace escapio {

static constexpr std::array<std::pair<Context, std::string_view>, 5> contextNames { {
    { Context::Text, "text" },
    { Context::Attribute, "attr" },
    { Context::Css, "css" },
    { Context::JsString, "js" },
    { Context::UrlParam, "param" },
} };

std::string escape(Context context, std::string_view data)
{
    switch (context) {
    case Context::Text:
        return htmlEscape(data);
    case Context::Attribute:
        return htmlAttrEscape(data);
    case Context::Css:
        return cssEscape(data);
    case Context::JsString:
        return jsEscape(data);
    case Context::UrlParam:
        return urlParamEscape(data);
    }
    ESCAPIO_ERROR("Unknown escaping context: " << int(context));
    throw std::invalid_argument("unknown escaping context " + std::to_string(int(context)));
}

std::string_view toString(Context context)
{
    for (auto const &[ctx, name] : contextNames) {
        if (ctx == context) {
            return name;
        }
    }
    return {};
}

std::optional<Context> contextFromString(std::string_view name)
{
    auto normalized = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(name)));
    for (auto const &[ctx, ctxName] : contextNames) {
        if (ctxName == normalized) {
            return ctx;
        }
    }
    ESCAPIO_DEBUG("No escaping context named \"" << name << "\"");
    return std::nullopt;
}

} // namespace escapio
