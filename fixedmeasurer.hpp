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

#include <textmeasurer.hpp>

#include <glib.h>

// Every character is half an em wide regardless of face, so tests can
// compute line breaks by counting characters.
class FixedAdvanceMeasurer : public TextMeasurer {
public:
    using TextMeasurer::text_width;
    Length text_width(const char *utf8_text, const TextParameters &font) const override {
        return font.size * (0.5 * double(g_utf8_strlen(utf8_text, -1)));
    }
};
