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

#pragma once

#include <lettercommon.hpp>

#include <string>

// Rendered width of a single line of text. Both the page count
// simulation and the rendering must use the same measurer.
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    virtual Length text_width(const char *utf8_text, const TextParameters &font) const = 0;

    Length text_width(const std::string &s, const TextParameters &font) const {
        return text_width(s.c_str(), font);
    }
};
