/*
 * Copyright 2023 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <lettercommon.hpp>

#include <glib.h>

namespace {

int hex_value(char c) {
    if(!g_ascii_isxdigit(c)) {
        return -1;
    }
    return g_ascii_xdigit_value(c);
}

} // namespace

const char *fontconfig_family(FontFamily family) {
    switch(family) {
    case FontFamily::Times:
        return "Liberation Serif";
    case FontFamily::Helvetica:
        return "Liberation Sans";
    case FontFamily::Courier:
        return "Liberation Mono";
    }
    throw FontError("Unknown font family.");
}

Color parse_color(const std::string &hex) {
    if(hex.size() != 7 || hex[0] != '#') {
        throw ConfigurationError("Color \"" + hex + "\" is not of the form #RRGGBB.");
    }
    double channels[3];
    for(int i = 0; i < 3; ++i) {
        const int hi = hex_value(hex[1 + 2 * i]);
        const int lo = hex_value(hex[2 + 2 * i]);
        if(hi < 0 || lo < 0) {
            throw ConfigurationError("Color \"" + hex + "\" has a non hex digit.");
        }
        channels[i] = (16 * hi + lo) / 255.0;
    }
    return Color{channels[0], channels[1], channels[2]};
}
