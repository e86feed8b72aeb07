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

#include <letterconfig.hpp>
#include <letterrequest.hpp>
#include <paragraphwrapper.hpp>
#include <textmeasurer.hpp>

#include <string>
#include <variant>
#include <vector>

// All y coordinates in this file are baselines measured downwards
// from the top edge of the page.

struct TextDrawCommand {
    std::string text;
    TextParameters par;
    Color color;
    Length x; // Left edge, alignment has already been applied.
    Length y;
};

struct LineDrawCommand {
    Length x0;
    Length y0;
    Length x1;
    Length y1;
    LineStyle style;
};

typedef std::variant<TextDrawCommand, LineDrawCommand> DrawCommand;

struct PlacedParagraph {
    size_t index;
    ParagraphKind kind;
    Length first_baseline;
    size_t num_lines;
};

// Everything on one page except the running headers, footers and fold
// marks, which depend on the final page count.
struct PageLayout {
    PageRole role = PageRole::First;
    std::vector<DrawCommand> commands;
    std::vector<PlacedParagraph> paragraphs;
    bool has_closing = false;
};

struct LetterLayout {
    std::vector<PageLayout> pages;
    std::string iso_date;
    std::string formatted_date;

    int num_pages() const { return int(pages.size()); }
};

// Where along a baseline text starts for a given anchor point.
Length aligned_x(Length anchor, Length text_width, TextAlignment alignment);

// The single implementation of the page filling rules. Page count
// simulation and rendering both run this.
class LetterLayouter {
public:
    LetterLayouter(const LetterConfig &config, const TextMeasurer &meas);

    // Throws UnrenderableContentError if a paragraph does not fit
    // on an empty page.
    LetterLayout layout(const LetterRequest &req) const;

    Length line_height() const { return conf.formatting.line_height(); }
    // Lowest point body text may reach.
    Length bottom_limit() const { return conf.page.h - conf.positioning.body_bottom; }
    // The closing block must fit above this.
    Length closing_limit() const { return conf.page.h - conf.positioning.margins.bottom; }

    static Length closing_reserve() { return Length::from_in(3); }

private:
    struct FlowState {
        LetterLayout &out;
        Length y;
        bool page_has_body = false;
    };

    void layout_address_blocks(const LetterRequest &req, PageLayout &page) const;
    void layout_date(PageLayout &page, const std::string &formatted_date) const;
    Length layout_subject_block(const LetterRequest &req, PageLayout &page) const;
    void flow_paragraphs(const LetterRequest &req, FlowState &state) const;
    void layout_closing(const LetterRequest &req, FlowState &state) const;

    void start_new_page(FlowState &state) const;
    bool in_bottom_third(Length y) const;
    void emit_text(PageLayout &page,
                   const std::string &text,
                   const TextParameters &par,
                   Length x,
                   Length y) const;

    const LetterConfig &conf;
    const TextMeasurer &meas;
    ParagraphWrapper wrapper;
};
