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

#include <string>
#include <vector>

struct LetterContent {
    std::string salutation = "Dear Senator";
    std::vector<std::string> paragraphs;
    std::string closing = "Respectfully";
};

// Splits a drafted letter into its salutation, body paragraphs and
// closing phrase. Body paragraphs are separated by empty lines. An all
// caps line is a paragraph of its own.
LetterContent parse_letter_content(const std::string &text);
