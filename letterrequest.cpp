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

#include <letterrequest.hpp>
#include <utils.hpp>

#include <glib.h>

#include <cstdio>
#include <cstdlib>

namespace {

const char *month_names[12] = {"January",
                               "February",
                               "March",
                               "April",
                               "May",
                               "June",
                               "July",
                               "August",
                               "September",
                               "October",
                               "November",
                               "December"};

bool parse_iso_date(const std::string &text, int &year, int &month, int &day) {
    char trailing;
    if(sscanf(text.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &trailing) != 3) {
        return false;
    }
    if(year < 1 || year > 9999) {
        return false;
    }
    return g_date_valid_dmy(GDateDay(day), GDateMonth(month), GDateYear(year));
}

void append_nonempty(std::vector<std::string> &lines, const std::string &s) {
    if(!s.empty()) {
        lines.push_back(s);
    }
}

} // namespace

std::string format_city_line(const PostalAddress &a) {
    const std::string city = strip_copy(a.city);
    const std::string state = strip_copy(a.state);
    const std::string zip = strip_copy(a.zip);
    std::string tail = state;
    if(!zip.empty()) {
        if(!tail.empty()) {
            tail += ' ';
        }
        tail += zip;
    }
    if(city.empty()) {
        return tail;
    }
    if(tail.empty()) {
        return city;
    }
    return city + ", " + tail;
}

std::vector<std::string> return_address_lines(const Sender &s) {
    std::vector<std::string> lines;
    append_nonempty(lines, s.name);
    append_nonempty(lines, s.address.street_1);
    append_nonempty(lines, s.address.street_2);
    append_nonempty(lines, format_city_line(s.address));
    return lines;
}

std::vector<std::string> recipient_address_lines(const Recipient &r) {
    std::vector<std::string> lines;
    if(!r.honorific.empty() && !r.name.empty()) {
        lines.push_back(r.honorific + ' ' + r.name);
    } else {
        append_nonempty(lines, r.name);
    }
    append_nonempty(lines, r.title);
    append_nonempty(lines, r.address.street_1);
    append_nonempty(lines, r.address.street_2);
    append_nonempty(lines, format_city_line(r.address));
    return lines;
}

std::vector<std::string> signature_lines(const LetterRequest &req) {
    std::vector<std::string> lines;
    lines.push_back(req.sender.name);
    if(req.include_email) {
        append_nonempty(lines, req.sender.email);
    }
    if(req.include_phone) {
        append_nonempty(lines, req.sender.phone);
    }
    return lines;
}

std::string resolve_letter_date(const std::string &iso_date) {
    int year, month, day;
    if(!parse_iso_date(iso_date, year, month, day)) {
        if(!iso_date.empty()) {
            fprintf(stderr,
                    "Could not parse date \"%s\", using the current date.\n",
                    iso_date.c_str());
        }
        return current_date();
    }
    char buf[64];
    snprintf(buf, 64, "%04d-%02d-%02d", year, month, day);
    return std::string{buf};
}

std::string format_letter_date(const std::string &iso_date) {
    int year, month, day;
    if(!parse_iso_date(resolve_letter_date(iso_date), year, month, day)) {
        std::abort();
    }
    char buf[64];
    snprintf(buf, 64, "%s %d, %d", month_names[month - 1], day, year);
    return std::string{buf};
}
