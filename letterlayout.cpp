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

#include <letterlayout.hpp>

#include <algorithm>

namespace {

// Space after the closing phrase, the gap left for a hand written
// signature and the space above the typed name.
const Length after_closing = Length::from_in(0.25);
const Length signature_gap = Length::from_in(0.6);
const Length above_typed_name = Length::from_in(0.15);

// A heading wants this many lines of its successor on the same page.
const size_t max_followers = 4;
const size_t min_followers = 2;

Length wrap_width(const LetterConfig &conf) {
    if(conf.formatting.indent_paragraphs) {
        return conf.text_width() - conf.formatting.indent_size;
    }
    return conf.text_width();
}

} // namespace

Length aligned_x(Length anchor, Length text_width, TextAlignment alignment) {
    switch(alignment) {
    case TextAlignment::Left:
        return anchor;
    case TextAlignment::Centered:
        return anchor - text_width / 2;
    case TextAlignment::Right:
        return anchor - text_width;
    }
    return anchor;
}

LetterLayouter::LetterLayouter(const LetterConfig &config, const TextMeasurer &meas_)
    : conf{config}, meas{meas_}, wrapper{meas_, config.formatting.body_font(), wrap_width(config)} {
}

LetterLayout LetterLayouter::layout(const LetterRequest &req) const {
    LetterLayout out;
    out.iso_date = resolve_letter_date(req.date);
    out.formatted_date = format_letter_date(out.iso_date);
    out.pages.emplace_back();
    out.pages.back().role = PageRole::First;

    layout_address_blocks(req, out.pages.back());
    layout_date(out.pages.back(), out.formatted_date);
    const Length body_y = layout_subject_block(req, out.pages.back());

    FlowState state{out, body_y};
    flow_paragraphs(req, state);
    layout_closing(req, state);
    return out;
}

void LetterLayouter::emit_text(PageLayout &page,
                               const std::string &text,
                               const TextParameters &par,
                               Length x,
                               Length y) const {
    if(text.empty()) {
        return;
    }
    page.commands.emplace_back(TextDrawCommand{text, par, Color::black(), x, y});
}

void LetterLayouter::layout_address_blocks(const LetterRequest &req, PageLayout &page) const {
    const auto &pos = conf.positioning;
    const auto font = conf.formatting.body_font();
    const Length step = conf.formatting.block_line_height();

    Length y = pos.return_address.y;
    for(const auto &line : return_address_lines(req.sender)) {
        emit_text(page, line, font, pos.return_address.x, y);
        y += step;
    }

    y = pos.recipient_address.y;
    for(const auto &line : recipient_address_lines(req.recipient)) {
        emit_text(page, line, font, pos.recipient_address.x, y);
        y += step;
    }
}

void LetterLayouter::layout_date(PageLayout &page, const std::string &formatted_date) const {
    const auto &pos = conf.positioning;
    const auto font = conf.formatting.body_font();
    const Length w = meas.text_width(formatted_date, font);
    Length x;
    switch(pos.date.alignment) {
    case TextAlignment::Right:
        x = aligned_x(pos.recipient_address.right_edge(), w, TextAlignment::Right);
        break;
    case TextAlignment::Centered:
        x = aligned_x(pos.date.x, w, TextAlignment::Centered);
        break;
    case TextAlignment::Left:
        x = pos.date.x;
        break;
    }
    emit_text(page, formatted_date, font, x, pos.date.y);
}

Length LetterLayouter::layout_subject_block(const LetterRequest &req, PageLayout &page) const {
    const auto &f = conf.formatting;
    const Length x = conf.positioning.margins.left;
    Length y = conf.positioning.body_start_y + f.paragraph_spacing;

    if(!req.subject.empty()) {
        emit_text(page, req.subject, f.emphasized_font(), x, y);
        y += 1.5 * f.paragraph_spacing;
    }
    if(!req.salutation.empty()) {
        emit_text(page, req.salutation + ',', f.body_font(), x, y);
    }
    y += 1.5 * line_height();
    return y;
}

bool LetterLayouter::in_bottom_third(Length y) const {
    const Length third = (conf.page.h - conf.positioning.margins.top) / 3;
    return conf.page.h - y < third;
}

void LetterLayouter::start_new_page(FlowState &state) const {
    state.out.pages.emplace_back();
    state.out.pages.back().role = PageRole::Subsequent;
    state.y = conf.positioning.margins.top;
    state.page_has_body = false;
}

void LetterLayouter::flow_paragraphs(const LetterRequest &req, FlowState &state) const {
    const auto &f = conf.formatting;
    const auto &paragraphs = req.paragraphs;
    const Length lh = line_height();
    const auto font = f.body_font();

    for(size_t i = 0; i < paragraphs.size(); ++i) {
        const bool is_last = i + 1 == paragraphs.size();
        const auto kind = classify_paragraph(paragraphs[i]);
        const auto lines = wrapper.wrap(paragraphs[i]);
        const Length lines_height = double(lines.size()) * lh;
        Length space_needed = lines_height;
        if(!is_last) {
            space_needed += f.paragraph_spacing;
        }

        bool needs_break = state.y + space_needed > bottom_limit();
        if(kind == ParagraphKind::Heading && !is_last) {
            const size_t next_lines = wrapper.wrap(paragraphs[i + 1]).size();
            const size_t followers =
                std::min(max_followers, std::max(min_followers, next_lines / 2));
            const Length with_followers = space_needed + double(followers) * lh;
            if(state.y + with_followers > bottom_limit() || in_bottom_third(state.y)) {
                needs_break = true;
            }
        }
        // A continuation page that is still empty can not get any emptier.
        const bool on_blank_page = state.out.pages.size() > 1 && !state.page_has_body;
        if(needs_break && !on_blank_page) {
            start_new_page(state);
        }
        if(state.y + lines_height > bottom_limit()) {
            throw UnrenderableContentError("Paragraph " + std::to_string(i + 1) + " has " +
                                               std::to_string(lines.size()) +
                                               " lines which do not fit on an empty page.",
                                           i);
        }

        auto &page = state.out.pages.back();
        page.paragraphs.emplace_back(PlacedParagraph{i, kind, state.y, lines.size()});
        for(size_t j = 0; j < lines.size(); ++j) {
            Length x = conf.positioning.margins.left;
            if(j == 0 && kind == ParagraphKind::Body && f.indent_paragraphs) {
                x += f.indent_size;
            }
            emit_text(page, lines[j], font, x, state.y);
            state.y += lh;
        }
        if(!is_last) {
            state.y += f.paragraph_spacing;
        }
        state.page_has_body = true;
    }
}

void LetterLayouter::layout_closing(const LetterRequest &req, FlowState &state) const {
    const auto &f = conf.formatting;
    state.y += 2 * f.paragraph_spacing;
    if(closing_limit() - state.y < closing_reserve()) {
        start_new_page(state);
    }

    auto &page = state.out.pages.back();
    page.has_closing = true;
    const Length x = conf.positioning.margins.left;
    const auto font = f.body_font();
    if(!req.closing.empty()) {
        emit_text(page, req.closing + ',', font, x, state.y);
    }
    state.y += after_closing + signature_gap + above_typed_name;
    for(const auto &line : signature_lines(req)) {
        emit_text(page, line, font, x, state.y);
        state.y += f.block_line_height();
    }
}
