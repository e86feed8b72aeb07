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

#include <string>
#include <vector>

enum class ParagraphKind : int {
    Heading,
    Body,
};

// True if the text has at least one cased character and no lower case ones.
bool is_upper_text(const std::string &utf8_text);

// Headings are short all caps lines that do not end like a sentence.
ParagraphKind classify_paragraph(const std::string &paragraph);

// Greedy line filling. A word that is wider than the target on its own
// gets a line of its own, it is never hyphenated.
class ParagraphWrapper {
public:
    ParagraphWrapper(const TextMeasurer &meas, const TextParameters &font, Length target_width);

    std::vector<std::string> wrap(const std::string &text) const;

    Length target_width() const { return width; }

private:
    const TextMeasurer &meas;
    TextParameters font;
    Length width;
};
