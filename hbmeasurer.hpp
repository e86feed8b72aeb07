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

#include <hbfontcache.hpp>
#include <textmeasurer.hpp>

#include <string>
#include <unordered_map>

// Measures text by shaping it with HarfBuzz. Widths are cached, so
// an instance must not be shared between threads.
class HBMeasurer : public TextMeasurer {
public:
    explicit HBMeasurer(const HBFontCache &cache, const char *language = "en");
    ~HBMeasurer() override;

    HBMeasurer(const HBMeasurer &) = delete;
    HBMeasurer &operator=(const HBMeasurer &) = delete;

    using TextMeasurer::text_width;
    Length text_width(const char *utf8_text, const TextParameters &font) const override;

private:
    Length compute_width(const char *utf8_text, const TextParameters &text_par) const;

    const HBFontCache &fc;

    hb_buffer_t *buf;
    mutable std::unordered_map<StyledPlainText, Length> plaintext_widths;
};
