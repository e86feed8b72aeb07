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
#include <letterjson.hpp>
#include <letterpaginator.hpp>
#include <fixedmeasurer.hpp>

#include <cstdio>
#include <cstdlib>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

bool rejects(const LetterConfig &conf) {
    try {
        conf.validate();
    } catch(const ConfigurationError &) {
        return true;
    }
    return false;
}

bool rejects_json(const std::string &text) {
    try {
        parse_letter_definition(text, ".");
    } catch(const ConfigurationError &) {
        return true;
    }
    return false;
}

const char *minimal_letter = R"({
    "output": "out.pdf",
    "sender": {"name": "Pat Smith", "street_1": "12 Elm Street", "city": "Springfield",
               "state": "IL", "zip": "62701"},
    "recipient": {"name": "Jane Doe", "honorific": "The Honorable"},
    "subject": "Bridge repairs",
    "salutation": "Dear Senator Doe",
    "body": ["Please repair the bridge."]
})";

} // namespace

void test_defaults_valid() {
    LetterConfig conf;
    conf.validate();
    CHECK(conf.text_width().in() > 5.99 && conf.text_width().in() < 6.01);
    CHECK(conf.formatting.line_height().pt() > 16.49 && conf.formatting.line_height().pt() < 16.51);
}

void test_bad_margins() {
    LetterConfig conf;
    conf.positioning.margins.top = Length::from_in(6);
    conf.positioning.margins.bottom = Length::from_in(5.5);
    CHECK(rejects(conf));

    conf = LetterConfig{};
    conf.positioning.margins.left = Length::from_in(-0.1);
    CHECK(rejects(conf));

    conf = LetterConfig{};
    conf.positioning.margins.left = Length::from_in(4.5);
    conf.positioning.margins.right = Length::from_in(4.5);
    CHECK(rejects(conf));

    conf = LetterConfig{};
    conf.positioning.body_bottom = Length::from_in(-0.5);
    CHECK(rejects(conf));
    conf.positioning.body_bottom = Length::from_in(9.75);
    CHECK(rejects(conf));
}

void test_bad_address_boxes() {
    LetterConfig conf;
    conf.positioning.recipient_address.width = Length::from_in(8);
    CHECK(rejects(conf));

    conf = LetterConfig{};
    conf.positioning.return_address.y = Length::from_in(10.5);
    CHECK(rejects(conf));

    conf = LetterConfig{};
    conf.positioning.recipient_address.y = Length::from_in(1.0);
    CHECK(rejects(conf));

    // Without a height the recipient box is a line that misses the return box.
    conf.positioning.recipient_address.y = Length::from_in(1.7);
    conf.positioning.recipient_address.height.reset();
    CHECK(!rejects(conf));
}

void test_bad_formatting() {
    LetterConfig conf;
    conf.formatting.font_size = Length::zero();
    CHECK(rejects(conf));

    conf = LetterConfig{};
    conf.formatting.line_spacing = 0;
    CHECK(rejects(conf));

    conf = LetterConfig{};
    conf.formatting.indent_size = Length::from_in(7);
    CHECK(rejects(conf));
    conf.formatting.indent_paragraphs = false;
    CHECK(!rejects(conf));
}

void test_bad_fold_lines() {
    LetterConfig conf;
    conf.fold_lines.positions.push_back(Length::from_in(12));
    CHECK(rejects(conf));
    conf.fold_lines.enabled = false;
    CHECK(!rejects(conf));
}

void test_paginator_validates() {
    LetterConfig conf;
    conf.positioning.body_start_y = Length::from_in(10.9);
    FixedAdvanceMeasurer meas;
    bool thrown = false;
    try {
        LetterPaginator p(conf, meas);
    } catch(const ConfigurationError &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_colors() {
    const auto c = parse_color("#FF8000");
    CHECK(c.r == 1.0);
    CHECK(c.g > 0.50 && c.g < 0.51);
    CHECK(c.b == 0.0);
    CHECK(parse_color("#cccccc") == Color::gray(0xCC / 255.0));
    bool thrown = false;
    try {
        parse_color("CCCCCC");
    } catch(const ConfigurationError &) {
        thrown = true;
    }
    CHECK(thrown);
    thrown = false;
    try {
        parse_color("#12345G");
    } catch(const ConfigurationError &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_json_minimal() {
    const auto def = parse_letter_definition(minimal_letter, "letters");
    CHECK(def.backend == Backend::CapyPdf);
    CHECK(def.output == std::filesystem::path("letters") / "out.pdf");
    CHECK(def.request.sender.name == "Pat Smith");
    CHECK(def.request.sender.address.city == "Springfield");
    CHECK(def.request.recipient.honorific == "The Honorable");
    CHECK(def.request.paragraphs.size() == 1);
    CHECK(def.request.closing == "Respectfully");
    CHECK(!def.request.include_email);
    CHECK(def.config.header.subsequent.left == "Jane Doe");
    CHECK(def.config.header.subsequent.right == "{formatted_date}");
    CHECK(def.config.page.w == LetterConfig{}.page.w);
}

void test_json_overrides() {
    const char *text = R"({
        "backend": "cairo",
        "output": "out.pdf",
        "sender": {"name": "Pat Smith", "email": "pat@example.com"},
        "recipient": {"name": "Jane Doe"},
        "include_email": true,
        "closing": "Sincerely",
        "date": "2024-03-05",
        "body": ["One.", "Two."],
        "config": {
            "margins": {"bottom": 1.0},
            "body_bottom": 0.5,
            "date": {"alignment": "center", "x": 4.25},
            "recipient_address": {"height": null},
            "formatting": {"font_family": "Helvetica", "font_size": 12, "indent_paragraphs": false},
            "fold_lines": {"positions": [3.5], "style": {"color": "#000000", "line_style": "dashed"}},
            "header": {"subsequent": {"center": "{page}"}, "line_below": false},
            "footer": {"center": "", "right": "{page}/{total}"}
        }
    })";
    const auto def = parse_letter_definition(text, ".");
    const auto &conf = def.config;
    CHECK(def.backend == Backend::Cairo);
    CHECK(def.request.include_email);
    CHECK(def.request.closing == "Sincerely");
    CHECK(def.request.paragraphs.size() == 2);
    CHECK(conf.positioning.margins.bottom == Length::from_in(1.0));
    CHECK(conf.positioning.margins.top == Length::from_in(1.25));
    CHECK(conf.positioning.body_bottom == Length::from_in(0.5));
    CHECK(conf.positioning.date.alignment == TextAlignment::Centered);
    CHECK(!conf.positioning.recipient_address.height);
    CHECK(conf.formatting.family == FontFamily::Helvetica);
    CHECK(conf.formatting.font_size == Length::from_pt(12));
    CHECK(!conf.formatting.indent_paragraphs);
    CHECK(conf.fold_lines.positions.size() == 1);
    CHECK(conf.fold_lines.style.dashed);
    CHECK(conf.fold_lines.style.color == Color::black());
    CHECK(conf.header.subsequent.center == "{page}");
    CHECK(conf.header.subsequent.left.empty());
    CHECK(!conf.header.line_below);
    CHECK(conf.footer.content.center.empty());
    CHECK(conf.footer.content.right == "{page}/{total}");
    conf.validate();
}

void test_json_errors() {
    CHECK(rejects_json("not json"));
    CHECK(rejects_json("[1, 2]"));
    CHECK(rejects_json(R"({"sender": {"name": "A"}, "recipient": {"name": "B"}, "body": []})"));
    CHECK(rejects_json(R"({"output": "o.pdf", "recipient": {"name": "B"}, "body": []})"));
    CHECK(rejects_json(
        R"({"output": "o.pdf", "sender": {"name": "A"}, "recipient": {"name": "B"}})"));
    CHECK(rejects_json(
        R"({"output": "o.pdf", "sender": {"name": "A"}, "recipient": {"name": "B"}, "body": "x"})"));
    CHECK(rejects_json(R"({"output": "o.pdf", "sender": {"name": 3}, "recipient": {"name": "B"},
                           "body": []})"));
    CHECK(rejects_json(R"({"output": "o.pdf", "sender": {"name": "A"}, "recipient": {"name": "B"},
                           "body": [], "backend": "postscript"})"));
    CHECK(rejects_json(R"({"output": "o.pdf", "sender": {"name": "A"}, "recipient": {"name": "B"},
                           "body": [], "config": {"formatting": {"font_family": "Comic"}}})"));
    CHECK(rejects_json(R"({"output": "o.pdf", "sender": {"name": "A"}, "recipient": {"name": "B"},
                           "body": [], "config": {"header": {"color": "gray"}}})"));
    CHECK(rejects_json(R"({"output": "o.pdf", "sender": {"name": "A"}, "recipient": {"name": "B"},
                           "body": [], "content": "letter.txt"})"));
    CHECK(rejects_json(R"({"output": "o.pdf", "sender": {"name": "A"}, "recipient": {"name": "B"},
                           "body": [], "backend": "cairo",
                           "fonts": {"times": {"regular": "a.ttf", "bold": "b.ttf"}}})"));
}

int main(int, char **) {
    test_defaults_valid();
    test_bad_margins();
    test_bad_address_boxes();
    test_bad_formatting();
    test_bad_fold_lines();
    test_paginator_validates();
    test_colors();
    test_json_minimal();
    test_json_overrides();
    test_json_errors();
    printf("All config tests passed.\n");
    return 0;
}
