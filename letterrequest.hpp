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

#include <cstdint>
#include <string>
#include <vector>

struct PostalAddress {
    std::string street_1;
    std::string street_2;
    std::string city;
    std::string state;
    std::string zip;
};

struct Sender {
    std::string name;
    PostalAddress address;
    std::string email;
    std::string phone;
};

struct Recipient {
    std::string name;
    std::string title;
    std::string honorific;
    PostalAddress address;
};

struct LetterRequest {
    Sender sender;
    Recipient recipient;
    std::string subject;
    std::string salutation;
    std::vector<std::string> paragraphs;
    std::string closing = "Respectfully";
    // ISO 8601 (YYYY-MM-DD). Empty means today.
    std::string date;
    bool include_email = false;
    bool include_phone = false;
};

struct RenderedLetter {
    std::vector<uint8_t> bytes;
    int num_pages = 0;
};

// "City, ST ZIP" with blank parts left out.
std::string format_city_line(const PostalAddress &a);

std::vector<std::string> return_address_lines(const Sender &s);

std::vector<std::string> recipient_address_lines(const Recipient &r);

// Typed name and the contact details the request allows to be shown.
std::vector<std::string> signature_lines(const LetterRequest &req);

// Normalized YYYY-MM-DD form of iso_date, or the current date if it
// can not be parsed.
std::string resolve_letter_date(const std::string &iso_date);

// "Month D, YYYY". Falls back to the current date if iso_date can not
// be parsed.
std::string format_letter_date(const std::string &iso_date);
