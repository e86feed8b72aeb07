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

#include <letterconfig.hpp>

#include <cstdio>

namespace {

std::string inches(Length l) {
    char buf[64];
    snprintf(buf, 64, "%.3f in", l.in());
    return std::string{buf};
}

void check_nonnegative(Length l, const char *name) {
    if(l < Length::zero()) {
        throw ConfigurationError(std::string{name} + " is negative (" + inches(l) + ").");
    }
}

void check_positive(Length l, const char *name) {
    if(!(l > Length::zero())) {
        throw ConfigurationError(std::string{name} + " must be positive (" + inches(l) + ").");
    }
}

void check_box(const AddressPosition &box, const PageSize &page, const char *name) {
    const std::string n{name};
    check_nonnegative(box.x, (n + " x").c_str());
    check_nonnegative(box.y, (n + " y").c_str());
    check_positive(box.width, (n + " width").c_str());
    if(box.right_edge() > page.w) {
        throw ConfigurationError(n + " extends past the right edge of the page.");
    }
    const Length h = box.height.value_or(Length::zero());
    check_nonnegative(h, (n + " height").c_str());
    if(box.y + h > page.h) {
        throw ConfigurationError(n + " extends past the bottom edge of the page.");
    }
}

bool boxes_overlap(const AddressPosition &a, const AddressPosition &b) {
    const Length ah = a.height.value_or(Length::zero());
    const Length bh = b.height.value_or(Length::zero());
    const bool x_apart = a.right_edge() <= b.x || b.right_edge() <= a.x;
    const bool y_apart = a.y + ah <= b.y || b.y + bh <= a.y;
    return !x_apart && !y_apart;
}

} // namespace

void LetterConfig::validate() const {
    check_positive(page.w, "Page width");
    check_positive(page.h, "Page height");

    const auto &m = positioning.margins;
    check_nonnegative(m.top, "Top margin");
    check_nonnegative(m.bottom, "Bottom margin");
    check_nonnegative(m.left, "Left margin");
    check_nonnegative(m.right, "Right margin");
    if(!(m.top + m.bottom < page.h)) {
        throw ConfigurationError("Top and bottom margins do not leave room on the page.");
    }
    check_nonnegative(positioning.body_bottom, "Body bottom");
    if(!(m.top + positioning.body_bottom < page.h)) {
        throw ConfigurationError("Top margin and body bottom do not leave room on the page.");
    }
    if(!(m.left + m.right < page.w)) {
        throw ConfigurationError("Left and right margins do not leave room on the page.");
    }

    check_box(positioning.return_address, page, "Return address");
    check_box(positioning.recipient_address, page, "Recipient address");
    if(boxes_overlap(positioning.return_address, positioning.recipient_address)) {
        throw ConfigurationError("Return address and recipient address boxes overlap.");
    }

    check_nonnegative(positioning.date.x, "Date x");
    check_nonnegative(positioning.date.y, "Date y");
    if(positioning.date.x > page.w || positioning.date.y > page.h) {
        throw ConfigurationError("Date position is outside the page.");
    }
    if(positioning.body_start_y < Length::zero() ||
       !(positioning.body_start_y < page.h - m.bottom)) {
        throw ConfigurationError("Body start " + inches(positioning.body_start_y) +
                                 " is not within the printable area.");
    }

    check_positive(formatting.font_size, "Font size");
    if(!(formatting.line_spacing > 0)) {
        throw ConfigurationError("Line spacing must be positive.");
    }
    check_nonnegative(formatting.paragraph_spacing, "Paragraph spacing");
    check_nonnegative(formatting.indent_size, "Indent size");
    if(formatting.indent_paragraphs && !(formatting.indent_size < text_width())) {
        throw ConfigurationError("Paragraph indent is wider than the text block.");
    }

    if(fold_lines.enabled) {
        for(const auto &y : fold_lines.positions) {
            if(y < Length::zero() || y > page.h) {
                throw ConfigurationError("Fold line at " + inches(y) + " is outside the page.");
            }
        }
        check_positive(fold_lines.style.line_length, "Fold line length");
        check_nonnegative(fold_lines.style.margin_offset, "Fold line margin offset");
        check_nonnegative(fold_lines.style.line_width, "Fold line width");
        if(!(2 * (fold_lines.style.margin_offset + fold_lines.style.line_length) < page.w)) {
            throw ConfigurationError("Fold line ticks do not fit across the page.");
        }
    }

    check_positive(header.font_size, "Header font size");
    check_positive(footer.font_size, "Footer font size");
}
