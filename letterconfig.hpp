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
#include <lettercommon.hpp>

#include <optional>
#include <string>
#include <vector>

// All positions are measured from the top left corner of the page.

struct PageSize {
    Length w = Length::from_in(8.5);
    Length h = Length::from_in(11);
};

struct Margins {
    Length top = Length::from_in(1.25);
    Length bottom = Length::from_in(1.25);
    Length left = Length::from_in(1.25);
    Length right = Length::from_in(1.25);
};

// A box that must show through an envelope window.
struct AddressPosition {
    Length x;
    Length y;
    Length width;
    std::optional<Length> height;

    Length right_edge() const { return x + width; }
};

struct DatePosition {
    Length x = Length::from_in(4.875);
    Length y = Length::from_in(1.7);
    // With Right the date is set flush with the recipient box's right edge
    // and x is not used.
    TextAlignment alignment = TextAlignment::Right;
};

struct Positioning {
    Margins margins;
    AddressPosition return_address{Length::from_in(0.5),
                                   Length::from_in(0.625),
                                   Length::from_in(3.5),
                                   Length::from_in(1.0)};
    AddressPosition recipient_address{Length::from_in(0.75),
                                      Length::from_in(2.0625),
                                      Length::from_in(4.0),
                                      Length::from_in(1.125)};
    DatePosition date;
    // Where the subject block starts on the first page.
    Length body_start_y = Length::from_in(3.67);
    // Body text may run this close to the bottom edge. The closing block
    // uses margins.bottom instead.
    Length body_bottom = Length::from_in(0.75);
};

struct Formatting {
    FontFamily family = FontFamily::Times;
    Length font_size = Length::from_pt(11);
    double line_spacing = 1.5;
    Length paragraph_spacing = Length::from_pt(12);
    bool indent_paragraphs = true;
    Length indent_size = Length::from_in(0.5);

    Length line_height() const { return font_size * line_spacing; }
    // Address and signature lines are set tighter than body text.
    Length block_line_height() const { return font_size * 1.2; }

    TextParameters body_font() const { return TextParameters{font_size, family, TextStyle::Regular}; }
    TextParameters emphasized_font() const {
        return TextParameters{font_size, family, TextStyle::Bold};
    }
};

struct FoldLineStyle {
    Length line_length = Length::from_mm(4);
    Length margin_offset = Length::from_mm(3);
    Color color = Color::gray(0xCC / 255.0);
    Length line_width = Length::from_pt(0.5);
    bool dashed = false;
};

// Tick marks for folding the letter into thirds.
struct FoldLines {
    bool enabled = true;
    std::vector<Length> positions{Length::from_in(3.67), Length::from_in(7.33)};
    FoldLineStyle style;
};

// Zone templates may contain {page}, {total} and {formatted_date}.
struct ZoneContent {
    bool enabled = true;
    std::string left;
    std::string center;
    std::string right;
};

struct Header {
    ZoneContent first_page{false, "", "", ""};
    ZoneContent subsequent;
    Length font_size = Length::from_pt(10);
    Color color = Color::gray(0x33 / 255.0);
    bool line_below = true;

    const ZoneContent &content(PageRole role) const {
        return role == PageRole::First ? first_page : subsequent;
    }
};

struct Footer {
    ZoneContent content{true, "", "Page {page} of {total}", ""};
    Length font_size = Length::from_pt(10);
    Color color = Color::gray(0x66 / 255.0);
    bool line_above = true;
};

struct LetterConfig {
    PageSize page;
    Positioning positioning;
    Formatting formatting;
    FoldLines fold_lines;
    Header header;
    Footer footer;

    Length text_width() const {
        return page.w - positioning.margins.left - positioning.margins.right;
    }

    // Throws ConfigurationError describing the first broken invariant.
    void validate() const;
};
