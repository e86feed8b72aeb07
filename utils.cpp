/*
 * Copyright 2022 Jussi Pakkanen
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

#include <utils.hpp>
#include <glib.h>
#include <algorithm>
#include <sstream>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <cstdlib>

#include <time.h>

namespace {

// Unicode white space plus the ASCII separators GLib does not count.
bool is_space(gunichar c) {
    return g_unichar_isspace(c) || c == 0x0B || (c >= 0x1C && c <= 0x1F) || c == 0x85;
}

// Byte length of the character text starts with. Bytes that are not
// valid UTF-8 are taken one at a time and are never white space.
size_t next_char(std::string_view text, bool &space) {
    const gunichar c = g_utf8_get_char_validated(text.data(), gssize(text.size()));
    if(c == gunichar(-1) || c == gunichar(-2)) {
        space = false;
        return 1;
    }
    space = is_space(c);
    return size_t(g_utf8_next_char(text.data()) - text.data());
}

} // namespace

void strip(std::string &s) {
    const std::string_view text{s};
    size_t first = text.size();
    size_t last = 0;
    size_t i = 0;
    while(i < text.size()) {
        bool space;
        const size_t n = next_char(text.substr(i), space);
        if(!space) {
            first = std::min(first, i);
            last = i + n;
        }
        i += n;
    }
    if(first >= last) {
        s.clear();
        return;
    }
    s = s.substr(first, last - first);
}

std::string strip_copy(const std::string &s) {
    std::string result{s};
    strip(result);
    return result;
}

bool startswith(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

std::vector<std::string> split_to_lines(const std::string &in_text) {
    std::string val;
    const char separator = '\n';
    std::vector<std::string> lines;
    std::stringstream sstream(in_text);
    while(std::getline(sstream, val, separator)) {
        if(!val.empty() && val.back() == '\r') {
            val.pop_back();
        }
        lines.push_back(val);
    }
    return lines;
}

std::vector<std::string> split_to_words(std::string_view in_text) {
    std::vector<std::string> words;
    std::string current;
    size_t i = 0;
    while(i < in_text.size()) {
        bool space;
        const size_t n = next_char(in_text.substr(i), space);
        if(space) {
            if(!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current.append(in_text.substr(i, n));
        }
        i += n;
    }
    if(!current.empty()) {
        words.push_back(current);
    }
    return words;
}

std::vector<std::string> read_lines(const char *p) {
    std::vector<std::string> lines;
    std::ifstream input(p);
    if(input.fail()) {
        throw std::runtime_error(std::string{"Could not open file "} + p + ".");
    }
    for(std::string line; std::getline(input, line);) {
        if(!g_utf8_validate(line.c_str(), line.length(), nullptr)) {
            throw std::runtime_error(std::string{"Invalid UTF-8 in "} + p + ".");
        }
        if(!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<uint8_t> read_bytes(const char *p) {
    std::ifstream input(p, std::ios::binary);
    if(input.fail()) {
        throw std::runtime_error(std::string{"Could not open file "} + p + ".");
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(input),
                                std::istreambuf_iterator<char>());
}

std::string current_date() {
    char buf[200];
    time_t t;
    struct tm *tmp;
    t = time(NULL);
    tmp = localtime(&t);
    if(tmp == NULL) {
        std::abort();
    }

    if(strftime(buf, 200, "%Y-%m-%d", tmp) == 0) {
        std::abort();
    }
    return std::string{buf};
}
