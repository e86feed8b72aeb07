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

#include <units.hpp>

#include <functional>
#include <stdexcept>
#include <string>
#include <cmath>
#include <cstdint>

enum class TextAlignment : int {
    Left,
    Centered,
    Right,
};

// The closed set of faces a letter can be set in. Each maps to a
// metric compatible free font family.
enum class FontFamily : uint8_t {
    Times,
    Helvetica,
    Courier,
};

// Bold is the "emphasized" variant of a family.
enum class TextStyle : uint8_t {
    Regular,
    Bold,
};

enum class PageRole : uint8_t {
    First,
    Subsequent,
};

const char *fontconfig_family(FontFamily family);

struct TextParameters {
    Length size = Length::from_pt(11); // Be careful with comparisons.
    FontFamily family = FontFamily::Times;
    TextStyle style = TextStyle::Regular;

    bool operator==(const TextParameters &o) const noexcept {
        return (fabs((size - o.size).pt()) < 0.05) && family == o.family && style == o.style;
    }
};

template<> struct std::hash<TextParameters> {
    std::size_t operator()(TextParameters const &tp) const noexcept {
        const size_t shuffle = 13;
        auto h1 = std::hash<size_t>{}((size_t)(10 * tp.size.pt() + 0.001));
        auto h2 = std::hash<size_t>{}((size_t)tp.family);
        auto h3 = std::hash<size_t>{}((size_t)tp.style);
        size_t hashvalue = (h1 * shuffle) + h2;
        hashvalue = hashvalue * shuffle + h3;
        return hashvalue;
    }
};

struct StyledPlainText {
    std::string text;
    TextParameters font;

    bool operator==(const StyledPlainText &o) const noexcept {
        return text == o.text && font == o.font;
    }
};

template<> struct std::hash<StyledPlainText> {
    std::size_t operator()(StyledPlainText const &s) const noexcept {
        auto h1 = std::hash<std::string>{}(s.text);
        auto h2 = std::hash<TextParameters>{}(s.font);
        return (h1 * 13) + h2;
    }
};

struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    static Color black() { return Color{0.0, 0.0, 0.0}; }
    static Color gray(double v) { return Color{v, v, v}; }

    bool operator==(const Color &o) const = default;
};

// Parses "#RRGGBB". Throws ConfigurationError on anything else.
Color parse_color(const std::string &hex);

struct LineStyle {
    Length width = Length::from_pt(0.5);
    Color color;
    bool dashed = false;
};

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string &msg) : std::runtime_error(msg) {}
};

class UnrenderableContentError : public std::runtime_error {
public:
    UnrenderableContentError(const std::string &msg, size_t paragraph)
        : std::runtime_error(msg), paragraph_index(paragraph) {}

    size_t paragraph_index;
};

class SurfaceError : public std::runtime_error {
public:
    explicit SurfaceError(const std::string &msg) : std::runtime_error(msg) {}
};

class FontError : public std::runtime_error {
public:
    explicit FontError(const std::string &msg) : std::runtime_error(msg) {}
};
