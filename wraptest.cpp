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

#include <fixedmeasurer.hpp>
#include <letterpaginator.hpp>
#include <letterparser.hpp>
#include <letterrequest.hpp>
#include <paragraphwrapper.hpp>
#include <utils.hpp>

#include <cstdio>
#include <cstdlib>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

const TextParameters body_font{Length::from_pt(10), FontFamily::Times, TextStyle::Regular};

} // namespace

void test_upper_text() {
    CHECK(is_upper_text("BACKGROUND"));
    CHECK(is_upper_text("PART 2: COSTS"));
    CHECK(is_upper_text("ÄÄNESTYS"));
    CHECK(!is_upper_text("Background"));
    CHECK(!is_upper_text("ÄäNESTYS"));
    CHECK(!is_upper_text("2024"));
    CHECK(!is_upper_text(""));
}

void test_classify_heading() {
    CHECK(classify_paragraph("BACKGROUND") == ParagraphKind::Heading);
    CHECK(classify_paragraph("WHY THIS BILL MATTERS TO OUR TOWN") == ParagraphKind::Heading);
    CHECK(classify_paragraph("IMPACT ON FAMILIES   ") == ParagraphKind::Heading);
    CHECK(classify_paragraph("ONE TWO THREE FOUR FIVE SIX SEVEN EIGHT NINE TEN") ==
          ParagraphKind::Heading);
}

void test_classify_body() {
    CHECK(classify_paragraph("I am writing to you today.") == ParagraphKind::Body);
    CHECK(classify_paragraph("PLEASE VOTE NO.") == ParagraphKind::Body);
    CHECK(classify_paragraph("PLEASE VOTE NO!") == ParagraphKind::Body);
    CHECK(classify_paragraph("WILL YOU HELP?") == ParagraphKind::Body);
    CHECK(classify_paragraph("FIRST, ") == ParagraphKind::Body);
    CHECK(classify_paragraph("ONE TWO THREE FOUR FIVE SIX SEVEN EIGHT NINE TEN ELEVEN") ==
          ParagraphKind::Body);
}

void test_wrap_greedy() {
    FixedAdvanceMeasurer meas;
    // 5 pt per character, 20 characters per line.
    ParagraphWrapper w(meas, body_font, Length::from_pt(100));
    auto lines = w.wrap("aaaa bbbb cccc dddd eeee ffff");
    CHECK(lines.size() == 2);
    CHECK(lines[0] == "aaaa bbbb cccc dddd");
    CHECK(lines[1] == "eeee ffff");
}

void test_wrap_full_line() {
    FixedAdvanceMeasurer meas;
    ParagraphWrapper w(meas, body_font, Length::from_pt(100));
    auto lines = w.wrap("aaaaaaaa bbbbbbbbbb c");
    CHECK(lines.size() == 2);
    CHECK(lines[0] == "aaaaaaaa bbbbbbbbbb");
    CHECK(lines[1] == "c");
}

void test_wrap_long_word() {
    FixedAdvanceMeasurer meas;
    ParagraphWrapper w(meas, body_font, Length::from_pt(100));
    auto lines = w.wrap("a supercalifragilisticexpialidocious b");
    CHECK(lines.size() == 3);
    CHECK(lines[0] == "a");
    CHECK(lines[1] == "supercalifragilisticexpialidocious");
    CHECK(lines[2] == "b");
}

void test_wrap_whitespace() {
    FixedAdvanceMeasurer meas;
    ParagraphWrapper w(meas, body_font, Length::from_pt(100));
    CHECK(w.wrap("").empty());
    CHECK(w.wrap("   \n ").empty());
    auto lines = w.wrap("  one\ntwo   three ");
    CHECK(lines.size() == 1);
    CHECK(lines[0] == "one two three");
}

void test_unicode_whitespace() {
    const auto words = split_to_words("one\vtwo\fthree\u00A0four\u2003five\x1fsix");
    CHECK(words.size() == 6);
    CHECK(words[3] == "four");
    CHECK(words[5] == "six");
    CHECK(strip_copy("\u00A0 letter \u3000") == "letter");
    CHECK(strip_copy("\u2003\u2003").empty());
    const auto raw = split_to_words("a\xff b");
    CHECK(raw.size() == 2);
    CHECK(raw[0] == "a\xff");
    CHECK(classify_paragraph("ONE\u2003TWO THREE FOUR FIVE SIX SEVEN EIGHT NINE TEN ELEVEN") ==
          ParagraphKind::Body);
}

void test_date_format() {
    CHECK(format_letter_date("2024-03-05") == "March 5, 2024");
    CHECK(format_letter_date("1999-12-31") == "December 31, 1999");
    CHECK(format_letter_date("2024-02-29") == "February 29, 2024");
}

// The clock may pass midnight while this runs.
bool is_today(const std::string &formatted, const std::string &before, const std::string &after) {
    return formatted == format_letter_date(before) || formatted == format_letter_date(after);
}

void test_date_fallback() {
    const auto before = current_date();
    const auto empty = format_letter_date("");
    const auto leap = format_letter_date("2023-02-29");
    const auto words = format_letter_date("next tuesday");
    const auto trailing = format_letter_date("2024-03-05x");
    const auto resolved = resolve_letter_date("garbage");
    const auto after = current_date();
    CHECK(!empty.empty());
    CHECK(is_today(empty, before, after));
    CHECK(is_today(leap, before, after));
    CHECK(is_today(words, before, after));
    CHECK(is_today(trailing, before, after));
    CHECK(resolved == before || resolved == after);
}

void test_date_normalized() {
    CHECK(resolve_letter_date("2024-03-05") == "2024-03-05");
    CHECK(resolve_letter_date("2024-3-5") == "2024-03-05");
}

void test_city_line() {
    PostalAddress a{"1 Main St", "", "Springfield", "IL", "62701"};
    CHECK(format_city_line(a) == "Springfield, IL 62701");
    a.zip = "";
    CHECK(format_city_line(a) == "Springfield, IL");
    a.state = "";
    CHECK(format_city_line(a) == "Springfield");
    a.city = "";
    a.state = "IL";
    a.zip = "62701";
    CHECK(format_city_line(a) == "IL 62701");
}

void test_recipient_compaction() {
    Recipient r;
    r.name = "Jane Doe";
    r.honorific = "The Honorable";
    r.title = "United States Senator";
    r.address = PostalAddress{"100 Senate Office Building", "", "Washington", "DC", "20510"};
    auto lines = recipient_address_lines(r);
    CHECK(lines.size() == 4);
    CHECK(lines[0] == "The Honorable Jane Doe");
    CHECK(lines[1] == "United States Senator");
    CHECK(lines[2] == "100 Senate Office Building");
    CHECK(lines[3] == "Washington, DC 20510");

    r.address.street_2 = "Suite 5";
    r.title = "";
    r.honorific = "";
    lines = recipient_address_lines(r);
    CHECK(lines.size() == 4);
    CHECK(lines[0] == "Jane Doe");
    CHECK(lines[2] == "Suite 5");
}

void test_signature_lines() {
    LetterRequest req;
    req.sender.name = "Pat Smith";
    req.sender.email = "pat@example.com";
    req.sender.phone = "555-0100";
    auto lines = signature_lines(req);
    CHECK(lines.size() == 1);
    req.include_phone = true;
    lines = signature_lines(req);
    CHECK(lines.size() == 2);
    CHECK(lines[1] == "555-0100");
    req.include_email = true;
    lines = signature_lines(req);
    CHECK(lines.size() == 3);
    CHECK(lines[1] == "pat@example.com");
    CHECK(lines[2] == "555-0100");
}

void test_placeholders() {
    CHECK(expand_placeholders("Page {page} of {total}", 2, 5, "") == "Page 2 of 5");
    CHECK(expand_placeholders("{formatted_date}", 1, 1, "March 5, 2024") == "March 5, 2024");
    CHECK(expand_placeholders("{page}{page}", 3, 4, "") == "33");
    CHECK(expand_placeholders("{unknown} {page", 1, 1, "") == "{unknown} {page");
    CHECK(expand_placeholders("", 1, 1, "x").empty());
}

void test_parse_content() {
    const std::string draft = "Dear Senator Doe:\n"
                              "\n"
                              "I am writing about the bridge.\n"
                              "It needs repairs.\n"
                              "\n"
                              "BACKGROUND\n"
                              "The bridge was built in 1931.\n"
                              "\n"
                              "Sincerely,\n"
                              "Pat Smith\n";
    const auto c = parse_letter_content(draft);
    CHECK(c.salutation == "Dear Senator Doe");
    CHECK(c.closing == "Sincerely");
    CHECK(c.paragraphs.size() == 3);
    CHECK(c.paragraphs[0] == "I am writing about the bridge. It needs repairs.");
    CHECK(c.paragraphs[1] == "BACKGROUND");
    CHECK(c.paragraphs[2] == "The bridge was built in 1931.");
}

void test_parse_content_defaults() {
    const auto c = parse_letter_content("Please fix the bridge.\n\nIt is old.");
    CHECK(c.salutation == "Dear Senator");
    CHECK(c.closing == "Respectfully");
    CHECK(c.paragraphs.size() == 2);
    CHECK(c.paragraphs[0] == "Please fix the bridge.");
}

void test_parse_content_closing_keyword() {
    const auto c = parse_letter_content("Dear Ms. Roe,\nThank you for reading.\nBody text here.\n"
                                        "With best wishes and Thank you,\nPat");
    CHECK(c.salutation == "Dear Ms. Roe");
    CHECK(c.closing == "With best wishes and Thank you");
    CHECK(c.paragraphs.size() == 1);
    CHECK(c.paragraphs[0] == "Thank you for reading. Body text here.");
}

int main(int, char **) {
    test_upper_text();
    test_classify_heading();
    test_classify_body();
    test_wrap_greedy();
    test_wrap_full_line();
    test_wrap_long_word();
    test_wrap_whitespace();
    test_unicode_whitespace();
    test_date_format();
    test_date_fallback();
    test_date_normalized();
    test_city_line();
    test_recipient_compaction();
    test_signature_lines();
    test_placeholders();
    test_parse_content();
    test_parse_content_defaults();
    test_parse_content_closing_keyword();
    printf("All wrap tests passed.\n");
    return 0;
}
