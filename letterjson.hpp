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

#include <hbfontcache.hpp>
#include <letterconfig.hpp>
#include <letterrequest.hpp>

#include <filesystem>
#include <string>

enum class Backend : int {
    CapyPdf,
    Cairo,
};

// Everything lettermaker needs to produce one letter.
struct LetterDefinition {
    LetterConfig config;
    LetterRequest request;
    FontFilePaths font_files;
    Backend backend = Backend::CapyPdf;
    std::filesystem::path top_dir;
    std::filesystem::path output;
};

// Throws ConfigurationError on missing keys, wrong types and invalid values.
LetterDefinition load_letter_json(const char *path);

LetterDefinition parse_letter_definition(const std::string &json_text,
                                         const std::filesystem::path &top_dir);
