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

#include <fixedmeasurer.hpp>
#include <letterlayout.hpp>
#include <letterpaginator.hpp>
#include <recordingsurface.hpp>
#include <utils.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

const Length epsilon = Length::from_pt(0.001);

// With the default configuration and the fixed measurer twelve of these
// words fill one line and thirteen do not.
std::string body_paragraph(size_t num_lines) {
    std::string text;
    for(size_t i = 0; i < 12 * num_lines; ++i) {
        if(!text.empty()) {
            text += ' ';
        }
        text += "lorem";
    }
    return text;
}

LetterRequest make_request(std::vector<std::string> paragraphs) {
    LetterRequest req;
    req.sender.name = "Pat Smith";
    req.sender.address = PostalAddress{"12 Elm Street", "", "Springfield", "IL", "62701"};
    req.recipient.name = "Jane Doe";
    req.recipient.honorific = "The Honorable";
    req.recipient.title = "United States Senator";
    req.recipient.address =
        PostalAddress{"100 Senate Office Building", "", "Washington", "DC", "20510"};
    req.subject = "Bridge repairs";
    req.salutation = "Dear Senator Doe";
    req.date = "2024-03-05";
    req.paragraphs = std::move(paragraphs);
    return req;
}

std::string as_string(const std::vector<uint8_t> &bytes) {
    return std::string(bytes.begin(), bytes.end());
}

// Recorded commands that were drawn on the given 1-based page.
std::vector<std::string> page_lines(const std::string &log, int page) {
    std::vector<std::string> result;
    int current = 0;
    for(const auto &line : split_to_lines(log)) {
        if(startswith(line, "page ")) {
            current = atoi(line.c_str() + 5);
            continue;
        }
        if(current == page) {
            result.push_back(line);
        }
    }
    return result;
}

bool has_line(const std::vector<std::string> &lines, const std::string &expected) {
    for(const auto &l : lines) {
        if(l == expected) {
            return true;
        }
    }
    return false;
}

bool has_text(const std::vector<std::string> &lines, const std::string &text) {
    const std::string suffix = " " + text;
    for(const auto &l : lines) {
        if(startswith(l, "text ") && l.size() >= suffix.size() &&
           l.compare(l.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

int page_of(const LetterLayout &layout, size_t paragraph) {
    for(size_t p = 0; p < layout.pages.size(); ++p) {
        for(const auto &placed : layout.pages[p].paragraphs) {
            if(placed.index == paragraph) {
                return int(p);
            }
        }
    }
    return -1;
}

void check_atomic_paragraphs(const LetterLayout &layout,
                             const LetterRequest &req,
                             const LetterLayouter &layouter) {
    size_t expected = 0;
    for(const auto &page : layout.pages) {
        for(const auto &placed : page.paragraphs) {
            CHECK(placed.index == expected);
            ++expected;
            const Length last_line_bottom =
                placed.first_baseline + double(placed.num_lines) * layouter.line_height();
            CHECK(last_line_bottom <= layouter.bottom_limit() + epsilon);
        }
    }
    CHECK(expected == req.paragraphs.size());
}

void check_orphan_control(const LetterLayout &layout,
                          const LetterConfig &conf,
                          const LetterLayouter &layouter) {
    std::vector<PlacedParagraph> all;
    std::vector<bool> first_on_continuation;
    for(size_t p = 0; p < layout.pages.size(); ++p) {
        const auto &placed = layout.pages[p].paragraphs;
        for(size_t i = 0; i < placed.size(); ++i) {
            all.push_back(placed[i]);
            first_on_continuation.push_back(p > 0 && i == 0);
        }
    }
    const Length lh = layouter.line_height();
    const Length third = (conf.page.h - conf.positioning.margins.top) / 3;
    for(size_t i = 0; i + 1 < all.size(); ++i) {
        if(all[i].kind != ParagraphKind::Heading) {
            continue;
        }
        const size_t k = std::min<size_t>(4, std::max<size_t>(2, all[i + 1].num_lines / 2));
        const Length y = all[i].first_baseline;
        const Length needed = double(all[i].num_lines + k) * lh + conf.formatting.paragraph_spacing;
        const bool lookahead_fits = y + needed <= layouter.bottom_limit() + epsilon;
        const bool in_bottom_third = conf.page.h - y < third;
        if(!lookahead_fits || in_bottom_third) {
            CHECK(first_on_continuation[i]);
        }
    }
}

std::vector<std::string> sweep_body(size_t variant) {
    std::vector<std::string> paragraphs;
    const size_t count = 1 + variant % 17;
    for(size_t i = 0; i < count; ++i) {
        if((i + variant) % 4 == 3 && i + 1 < count) {
            paragraphs.push_back("SECTION HEADING");
        } else {
            paragraphs.push_back(body_paragraph(1 + (i * 7 + variant) % 9));
        }
    }
    return paragraphs;
}

} // namespace

void test_scenario_single_page() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    auto req = make_request({"Please repair the bridge on Route 9."});
    CHECK(paginator.simulate(req) == 1);
    auto letter = paginator.generate(req, recording_surface_factory());
    CHECK(letter.num_pages == 1);
    const auto log = as_string(letter.bytes);
    const auto page1 = page_lines(log, 1);
    CHECK(has_text(page1, "Page 1 of 1"));
    CHECK(has_text(page1, "Respectfully,"));
    CHECK(has_text(page1, "Pat Smith"));
    CHECK(log.find("end 1\n") != std::string::npos);
}

void test_scenario_many_paragraphs() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterLayouter layouter(conf, meas);
    std::vector<std::string> body;
    for(int i = 0; i < 12; ++i) {
        body.push_back(body_paragraph(5));
    }
    auto req = make_request(body);
    const auto layout = layouter.layout(req);
    CHECK(layout.num_pages() >= 2);
    CHECK(layout.num_pages() == 3);
    CHECK(layout.pages[0].paragraphs.size() == 4);
    CHECK(layout.pages[1].paragraphs.size() == 6);
    CHECK(layout.pages[2].paragraphs.size() == 2);
    check_atomic_paragraphs(layout, req, layouter);
    for(size_t p = 1; p < layout.pages.size(); ++p) {
        CHECK(layout.pages[p].paragraphs.front().first_baseline == conf.positioning.margins.top);
    }
}

void test_scenario_heading_moves() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterLayouter layouter(conf, meas);
    std::vector<std::string> body;
    for(int i = 0; i < 4; ++i) {
        body.push_back(body_paragraph(5));
    }
    body.push_back("BACKGROUND");
    body.push_back(body_paragraph(20));
    auto req = make_request(body);
    const auto layout = layouter.layout(req);

    // The heading alone would fit above the bottom margin.
    const Length heading_y = layout.pages[0].paragraphs.back().first_baseline +
                             layouter.line_height() * 5 + conf.formatting.paragraph_spacing;
    CHECK(heading_y + layouter.line_height() <= layouter.bottom_limit());

    CHECK(page_of(layout, 4) == 1);
    CHECK(page_of(layout, 5) == 1);
    const auto &page2 = layout.pages[1].paragraphs;
    CHECK(page2.size() == 2);
    CHECK(page2[0].kind == ParagraphKind::Heading);
    CHECK(page2[0].first_baseline == conf.positioning.margins.top);
    CHECK(page2[1].num_lines >= 4);
    check_orphan_control(layout, conf, layouter);
}

void test_body_line_does_not_move() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterLayouter layouter(conf, meas);
    std::vector<std::string> body;
    for(int i = 0; i < 4; ++i) {
        body.push_back(body_paragraph(5));
    }
    body.push_back("See below.");
    body.push_back(body_paragraph(20));
    const auto layout = layouter.layout(make_request(body));
    CHECK(page_of(layout, 4) == 0);
    CHECK(page_of(layout, 5) == 1);
}

void test_scenario_closing_page() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    LetterLayouter layouter(conf, meas);
    std::vector<std::string> body;
    for(int i = 0; i < 4; ++i) {
        body.push_back(body_paragraph(5));
    }
    auto req = make_request(body);
    const auto layout = layouter.layout(req);
    CHECK(layout.num_pages() == 2);
    CHECK(layout.pages[0].paragraphs.size() == 4);
    CHECK(!layout.pages[0].has_closing);
    CHECK(layout.pages[1].paragraphs.empty());
    CHECK(layout.pages[1].has_closing);

    CHECK(paginator.simulate(req) == 2);
    const auto letter = paginator.generate(req, recording_surface_factory());
    const auto log = as_string(letter.bytes);
    CHECK(!has_text(page_lines(log, 1), "Respectfully,"));
    CHECK(has_text(page_lines(log, 2), "Respectfully,"));
    CHECK(has_text(page_lines(log, 2), "Page 2 of 2"));
}

void test_closing_stays() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterLayouter layouter(conf, meas);
    const auto layout = layouter.layout(make_request({body_paragraph(3)}));
    CHECK(layout.num_pages() == 1);
    CHECK(layout.pages[0].has_closing);
}

// Body text could continue for another 3.4 in but the closing block
// has to end above the 1.25 in bottom margin.
void test_closing_respects_bottom_margin() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterLayouter layouter(conf, meas);
    const auto layout = layouter.layout(make_request({body_paragraph(9)}));
    CHECK(layout.num_pages() == 2);
    const auto &placed = layout.pages[0].paragraphs;
    CHECK(placed.size() == 1);
    const Length closing_y = placed[0].first_baseline + 9 * layouter.line_height() +
                             2 * conf.formatting.paragraph_spacing;
    const Length body_room = layouter.bottom_limit() - closing_y;
    CHECK(body_room > Length::from_in(3.0));
    CHECK(body_room < Length::from_in(3.5));
    CHECK(layouter.closing_limit() - closing_y < LetterLayouter::closing_reserve());
    CHECK(!layout.pages[0].has_closing);
    CHECK(layout.pages[1].has_closing);
    CHECK(layout.pages[1].paragraphs.empty());

    const auto shorter = layouter.layout(make_request({body_paragraph(7)}));
    CHECK(shorter.num_pages() == 1);
    CHECK(shorter.pages[0].has_closing);
}

void test_long_paragraph_moves_whole() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterLayouter layouter(conf, meas);
    auto req = make_request({body_paragraph(30)});
    const auto layout = layouter.layout(req);
    CHECK(layout.pages[0].paragraphs.empty());
    CHECK(page_of(layout, 0) == 1);
    CHECK(layout.pages[1].paragraphs[0].num_lines == 30);
    CHECK(layout.num_pages() == 3);
    check_atomic_paragraphs(layout, req, layouter);
}

void test_unrenderable_paragraph() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    auto req = make_request({"Short opening.", body_paragraph(45)});
    bool thrown = false;
    try {
        paginator.simulate(req);
    } catch(const UnrenderableContentError &e) {
        thrown = true;
        CHECK(e.paragraph_index == 1);
    }
    CHECK(thrown);

    thrown = false;
    try {
        paginator.generate(req, recording_surface_factory());
    } catch(const UnrenderableContentError &e) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_two_pass_consistency() {
    LetterConfig conf;
    conf.header.subsequent.left = "{formatted_date}";
    conf.header.subsequent.right = "Page {page}";
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    LetterLayouter layouter(paginator.config(), meas);
    for(size_t variant = 0; variant < 60; ++variant) {
        auto req = make_request(sweep_body(variant));
        req.include_email = variant % 2 == 0;
        req.sender.email = "pat@example.com";
        const int simulated = paginator.simulate(req);
        const auto letter = paginator.render(req, simulated, recording_surface_factory());
        CHECK(letter.num_pages == simulated);
        const auto log = as_string(letter.bytes);
        CHECK(log.find("end " + std::to_string(simulated) + "\n") != std::string::npos);

        const auto layout = layouter.layout(req);
        check_atomic_paragraphs(layout, req, layouter);
        check_orphan_control(layout, paginator.config(), layouter);
    }
}

void test_idempotence() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    auto req = make_request(sweep_body(16));
    const auto first = paginator.generate(req, recording_surface_factory());
    const auto second = paginator.generate(req, recording_surface_factory());
    CHECK(first.num_pages == second.num_pages);
    CHECK(first.bytes == second.bytes);
}

void test_page_count_mismatch() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    auto req = make_request({"One paragraph."});
    bool thrown = false;
    try {
        paginator.render(req, 2, recording_surface_factory());
    } catch(const std::logic_error &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_first_page_placement() {
    LetterConfig conf;
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    auto req = make_request({"Please repair the bridge."});
    const auto log = as_string(paginator.generate(req, recording_surface_factory()).bytes);
    const auto page1 = page_lines(log, 1);
    // Date flush with the recipient box's right edge at 4.75 in.
    CHECK(has_line(page1, "text 270.50 669.60 times regular 11.0 #000000 March 5, 2024"));
    CHECK(has_line(page1, "text 36.00 747.00 times regular 11.0 #000000 Pat Smith"));
    CHECK(has_line(page1,
                   "text 54.00 643.50 times regular 11.0 #000000 The Honorable Jane Doe"));
    // No blank line where street line 2 would be.
    CHECK(has_line(page1, "text 54.00 603.90 times regular 11.0 #000000 Washington, DC 20510"));
    CHECK(has_line(page1, "text 90.00 515.76 times bold 11.0 #000000 Bridge repairs"));
    CHECK(has_line(page1, "text 90.00 497.76 times regular 11.0 #000000 Dear Senator Doe,"));
    CHECK(has_text(page1, "Please repair the bridge."));
    CHECK(has_line(page1, "line 8.50 527.76 19.84 527.76 0.50 #CCCCCC solid"));
    CHECK(has_line(page1, "line 592.16 527.76 603.50 527.76 0.50 #CCCCCC solid"));
    CHECK(log.find("title Letter to Jane Doe\n") != std::string::npos);
    CHECK(log.find("author Pat Smith\n") != std::string::npos);
    CHECK(log.find("created 2024-03-05\n") != std::string::npos);
}

void test_date_alignment() {
    FixedAdvanceMeasurer meas;
    auto req = make_request({"Please repair the bridge."});

    LetterConfig left;
    left.positioning.date.alignment = TextAlignment::Left;
    LetterPaginator left_paginator(left, meas);
    const auto left_log =
        as_string(left_paginator.generate(req, recording_surface_factory()).bytes);
    // Starts at date.x, 4.875 in.
    CHECK(has_line(page_lines(left_log, 1),
                   "text 351.00 669.60 times regular 11.0 #000000 March 5, 2024"));

    LetterConfig centered;
    centered.positioning.date.alignment = TextAlignment::Centered;
    centered.positioning.date.x = Length::from_in(4.25);
    LetterPaginator centered_paginator(centered, meas);
    const auto centered_log =
        as_string(centered_paginator.generate(req, recording_surface_factory()).bytes);
    // 71.5 pt wide and centered on 306 pt.
    CHECK(has_line(page_lines(centered_log, 1),
                   "text 270.25 669.60 times regular 11.0 #000000 March 5, 2024"));
}

void test_first_page_header() {
    LetterConfig conf;
    conf.header.first_page = ZoneContent{true, "{formatted_date}", "", "Ref {page}"};
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    std::vector<std::string> body;
    for(int i = 0; i < 12; ++i) {
        body.push_back(body_paragraph(5));
    }
    const auto log =
        as_string(paginator.generate(make_request(body), recording_surface_factory()).bytes);
    const auto page1 = page_lines(log, 1);
    const auto page2 = page_lines(log, 2);
    CHECK(has_line(page1, "text 90.00 756.00 times regular 10.0 #333333 March 5, 2024"));
    CHECK(has_line(page1, "text 497.00 756.00 times regular 10.0 #333333 Ref 1"));
    CHECK(has_line(page1, "line 90.00 751.00 522.00 751.00 0.50 #CCCCCC solid"));
    CHECK(!has_text(page2, "Ref 2"));
    CHECK(!has_line(page2, "text 90.00 756.00 times regular 10.0 #333333 March 5, 2024"));
}

void test_headers() {
    LetterConfig conf;
    conf.header.subsequent.left = "{formatted_date}";
    conf.header.subsequent.right = "p. {page}/{total}";
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    std::vector<std::string> body;
    for(int i = 0; i < 12; ++i) {
        body.push_back(body_paragraph(5));
    }
    const auto log =
        as_string(paginator.generate(make_request(body), recording_surface_factory()).bytes);
    const auto page1 = page_lines(log, 1);
    const auto page2 = page_lines(log, 2);
    CHECK(!has_text(page1, "p. 1/3"));
    CHECK(!has_line(page1, "text 90.00 756.00 times regular 10.0 #333333 March 5, 2024"));
    CHECK(has_text(page1, "Page 1 of 3"));
    CHECK(has_line(page2, "text 90.00 756.00 times regular 10.0 #333333 March 5, 2024"));
    CHECK(has_text(page2, "p. 2/3"));
    CHECK(has_text(page2, "Page 2 of 3"));
    CHECK(has_line(page2, "line 90.00 751.00 522.00 751.00 0.50 #CCCCCC solid"));
    CHECK(has_line(page2, "line 90.00 51.00 522.00 51.00 0.50 #CCCCCC solid"));
    CHECK(has_text(page_lines(log, 3), "Page 3 of 3"));
}

void test_disabled_decorations() {
    LetterConfig conf;
    conf.fold_lines.enabled = false;
    conf.footer.content.enabled = false;
    conf.header.subsequent.enabled = false;
    FixedAdvanceMeasurer meas;
    LetterPaginator paginator(conf, meas);
    const auto log = as_string(
        paginator.generate(make_request({"Short."}), recording_surface_factory()).bytes);
    CHECK(log.find("\nline ") == std::string::npos);
    CHECK(log.find("Page 1 of 1") == std::string::npos);
}

int main(int, char **) {
    test_scenario_single_page();
    test_scenario_many_paragraphs();
    test_scenario_heading_moves();
    test_body_line_does_not_move();
    test_scenario_closing_page();
    test_closing_stays();
    test_closing_respects_bottom_margin();
    test_long_paragraph_moves_whole();
    test_unrenderable_paragraph();
    test_two_pass_consistency();
    test_idempotence();
    test_page_count_mismatch();
    test_first_page_placement();
    test_headers();
    test_date_alignment();
    test_first_page_header();
    test_disabled_decorations();
    printf("All pagination tests passed.\n");
    return 0;
}
