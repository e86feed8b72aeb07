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

#include <paragraphwrapper.hpp>
#include <utils.hpp>

#include <glib.h>

namespace {

const size_t max_heading_words = 10;

} // namespace

bool is_upper_text(const std::string &utf8_text) {
    if(!g_utf8_validate(utf8_text.c_str(), utf8_text.length(), nullptr)) {
        return false;
    }
    bool has_cased = false;
    const char *in = utf8_text.c_str();
    while(*in) {
        const gunichar c = g_utf8_get_char(in);
        if(g_unichar_islower(c)) {
            return false;
        }
        if(g_unichar_isupper(c) || g_unichar_istitle(c)) {
            has_cased = true;
        }
        in = g_utf8_next_char(in);
    }
    return has_cased;
}

ParagraphKind classify_paragraph(const std::string &paragraph) {
    if(!is_upper_text(paragraph)) {
        return ParagraphKind::Body;
    }
    if(split_to_words(paragraph).size() > max_heading_words) {
        return ParagraphKind::Body;
    }
    const auto trimmed = strip_copy(paragraph);
    if(!trimmed.empty()) {
        switch(trimmed.back()) {
        case '.':
        case '!':
        case '?':
        case ',':
            return ParagraphKind::Body;
        default:
            break;
        }
    }
    return ParagraphKind::Heading;
}

ParagraphWrapper::ParagraphWrapper(const TextMeasurer &meas_,
                                   const TextParameters &font_,
                                   Length target_width)
    : meas{meas_}, font{font_}, width{target_width} {}

std::vector<std::string> ParagraphWrapper::wrap(const std::string &text) const {
    std::vector<std::string> lines;
    std::string current_line;
    std::string trial;
    for(const auto &w : split_to_words(text)) {
        if(current_line.empty()) {
            current_line = w;
            continue;
        }
        trial = current_line;
        trial += ' ';
        trial += w;
        if(meas.text_width(trial, font) > width) {
            lines.emplace_back(std::move(current_line));
            current_line = w;
        } else {
            current_line = std::move(trial);
        }
    }
    if(!current_line.empty()) {
        lines.emplace_back(std::move(current_line));
    }
    return lines;
}
