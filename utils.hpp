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

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

std::vector<std::string> split_to_words(std::string_view in_text);
std::vector<std::string> split_to_lines(const std::string &in_text);

void strip(std::string &s);
std::string strip_copy(const std::string &s);

bool startswith(std::string_view text, std::string_view prefix);

std::vector<std::string> read_lines(const char *p);

std::vector<uint8_t> read_bytes(const char *p);

std::string current_date();
