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

#include <letterparser.hpp>
#include <paragraphwrapper.hpp>
#include <utils.hpp>

#include <array>
#include <optional>

namespace {

const std::array<const char *, 5> closing_keywords{
    "Sincerely", "Respectfully", "Best regards", "Thank you", "Yours truly"};

const size_t max_heading_words = 10;

void strip_trailing(std::string &s, char c) {
    while(!s.empty() && s.back() == c) {
        s.pop_back();
    }
}

bool has_closing_keyword(const std::string &line) {
    for(const auto *k : closing_keywords) {
        if(line.find(k) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string join_words(const std::vector<std::string> &lines) {
    std::string result;
    for(const auto &l : lines) {
        if(!result.empty()) {
            result += ' ';
        }
        result += l;
    }
    return result;
}

} // namespace

LetterContent parse_letter_content(const std::string &text) {
    LetterContent content;
    const auto lines = split_to_lines(strip_copy(text));

    std::optional<size_t> salutation_line;
    for(size_t i = 0; i < lines.size(); ++i) {
        auto line = strip_copy(lines[i]);
        if(startswith(line, "Dear")) {
            strip_trailing(line, ':');
            strip_trailing(line, ',');
            content.salutation = line;
            salutation_line = i;
            break;
        }
    }

    const size_t body_start = salutation_line ? *salutation_line + 1 : 0;
    size_t body_end = lines.size();
    for(size_t i = lines.size(); i > body_start; --i) {
        auto line = strip_copy(lines[i - 1]);
        strip_trailing(line, ',');
        if(has_closing_keyword(line)) {
            content.closing = line;
            body_end = i - 1;
            break;
        }
    }

    std::vector<std::string> current;
    auto flush = [&]() {
        if(!current.empty()) {
            content.paragraphs.emplace_back(join_words(current));
            current.clear();
        }
    };
    for(size_t i = body_start; i < body_end; ++i) {
        const auto line = strip_copy(lines[i]);
        if(line.empty()) {
            flush();
        } else if(is_upper_text(line) && split_to_words(line).size() <= max_heading_words) {
            flush();
            content.paragraphs.push_back(line);
        } else {
            current.push_back(line);
        }
    }
    flush();
    return content;
}
