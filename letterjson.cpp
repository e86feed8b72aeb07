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

#include <letterjson.hpp>
#include <letterparser.hpp>
#include <utils.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <unordered_map>

using json = nlohmann::json;

namespace {

const std::unordered_map<std::string, FontFamily> familymap{{"Times", FontFamily::Times},
                                                            {"Helvetica", FontFamily::Helvetica},
                                                            {"Courier", FontFamily::Courier}};

const std::unordered_map<std::string, TextAlignment> alignmap{{"left", TextAlignment::Left},
                                                              {"center", TextAlignment::Centered},
                                                              {"right", TextAlignment::Right}};

const std::unordered_map<std::string, Backend> backendmap{{"capypdf", Backend::CapyPdf},
                                                          {"cairo", Backend::Cairo}};

std::string get_string(const json &data, const char *key) {
    if(!data.contains(key)) {
        throw ConfigurationError(std::string{"Missing required key "} + key + ".");
    }
    const auto &value = data[key];
    if(!value.is_string()) {
        throw ConfigurationError(std::string{"Element "} + key + " is not a string.");
    }
    return value.get<std::string>();
}

double get_double(const json &data, const char *key) {
    if(!data.contains(key)) {
        throw ConfigurationError(std::string{"Missing required key "} + key + ".");
    }
    const auto &value = data[key];
    if(!value.is_number()) {
        throw ConfigurationError(std::string{"Element "} + key + " is not a number.");
    }
    return value.get<double>();
}

bool get_bool(const json &data, const char *key) {
    if(!data.contains(key)) {
        throw ConfigurationError(std::string{"Missing required key "} + key + ".");
    }
    const auto &value = data[key];
    if(!value.is_boolean()) {
        throw ConfigurationError(std::string{"Element "} + key + " is not a boolean.");
    }
    return value.get<bool>();
}

const json &get_object(const json &data, const char *key) {
    if(!data.contains(key)) {
        throw ConfigurationError(std::string{"Missing required key "} + key + ".");
    }
    const auto &value = data[key];
    if(!value.is_object()) {
        throw ConfigurationError(std::string{"Element "} + key + " is not an object.");
    }
    return value;
}

std::vector<std::string> get_stringarray(const json &data, const char *key) {
    std::vector<std::string> result;
    const auto &arr = data[key];
    if(!arr.is_array()) {
        throw ConfigurationError(std::string{key} + " must be an array of strings.");
    }
    for(const auto &e : arr) {
        if(!e.is_string()) {
            throw ConfigurationError(std::string{"Array "} + key + " has an entry that is not a string.");
        }
        result.push_back(e.get<std::string>());
    }
    return result;
}

// The override_* helpers leave the default in place when the key is absent.

void override_string(const json &data, const char *key, std::string &target) {
    if(data.contains(key)) {
        target = get_string(data, key);
    }
}

void override_bool(const json &data, const char *key, bool &target) {
    if(data.contains(key)) {
        target = get_bool(data, key);
    }
}

void override_double(const json &data, const char *key, double &target) {
    if(data.contains(key)) {
        target = get_double(data, key);
    }
}

void override_in(const json &data, const char *key, Length &target) {
    if(data.contains(key)) {
        target = Length::from_in(get_double(data, key));
    }
}

void override_pt(const json &data, const char *key, Length &target) {
    if(data.contains(key)) {
        target = Length::from_pt(get_double(data, key));
    }
}

void override_mm(const json &data, const char *key, Length &target) {
    if(data.contains(key)) {
        target = Length::from_mm(get_double(data, key));
    }
}

void override_color(const json &data, const char *key, Color &target) {
    if(data.contains(key)) {
        target = parse_color(get_string(data, key));
    }
}

template<typename T>
T lookup(const std::unordered_map<std::string, T> &map,
         const std::string &value,
         const char *what) {
    auto it = map.find(value);
    if(it == map.end()) {
        throw ConfigurationError(std::string{"Unknown "} + what + " \"" + value + "\".");
    }
    return it->second;
}

void parse_address_position(const json &data, AddressPosition &box) {
    override_in(data, "x", box.x);
    override_in(data, "y", box.y);
    override_in(data, "width", box.width);
    if(data.contains("height")) {
        if(data["height"].is_null()) {
            box.height.reset();
        } else {
            box.height = Length::from_in(get_double(data, "height"));
        }
    }
}

void parse_zone(const json &data, ZoneContent &zone) {
    override_bool(data, "enabled", zone.enabled);
    override_string(data, "left", zone.left);
    override_string(data, "center", zone.center);
    override_string(data, "right", zone.right);
}

void parse_config(const json &data, LetterConfig &conf) {
    if(data.contains("page")) {
        const auto &page = get_object(data, "page");
        override_in(page, "width", conf.page.w);
        override_in(page, "height", conf.page.h);
    }
    auto &pos = conf.positioning;
    if(data.contains("margins")) {
        const auto &margins = get_object(data, "margins");
        override_in(margins, "top", pos.margins.top);
        override_in(margins, "bottom", pos.margins.bottom);
        override_in(margins, "left", pos.margins.left);
        override_in(margins, "right", pos.margins.right);
    }
    if(data.contains("return_address")) {
        parse_address_position(get_object(data, "return_address"), pos.return_address);
    }
    if(data.contains("recipient_address")) {
        parse_address_position(get_object(data, "recipient_address"), pos.recipient_address);
    }
    if(data.contains("date")) {
        const auto &date = get_object(data, "date");
        override_in(date, "x", pos.date.x);
        override_in(date, "y", pos.date.y);
        if(date.contains("alignment")) {
            pos.date.alignment = lookup(alignmap, get_string(date, "alignment"), "alignment");
        }
    }
    override_in(data, "body_start_y", pos.body_start_y);
    override_in(data, "body_bottom", pos.body_bottom);

    if(data.contains("formatting")) {
        const auto &fmt = get_object(data, "formatting");
        auto &f = conf.formatting;
        if(fmt.contains("font_family")) {
            f.family = lookup(familymap, get_string(fmt, "font_family"), "font family");
        }
        override_pt(fmt, "font_size", f.font_size);
        override_double(fmt, "line_spacing", f.line_spacing);
        override_pt(fmt, "paragraph_spacing", f.paragraph_spacing);
        override_bool(fmt, "indent_paragraphs", f.indent_paragraphs);
        override_in(fmt, "indent_size", f.indent_size);
    }

    if(data.contains("fold_lines")) {
        const auto &fold = get_object(data, "fold_lines");
        auto &fl = conf.fold_lines;
        override_bool(fold, "enabled", fl.enabled);
        if(fold.contains("positions")) {
            const auto &arr = fold["positions"];
            if(!arr.is_array()) {
                throw ConfigurationError("positions must be an array of numbers.");
            }
            fl.positions.clear();
            for(const auto &e : arr) {
                if(!e.is_number()) {
                    throw ConfigurationError("Array positions has an entry that is not a number.");
                }
                fl.positions.push_back(Length::from_in(e.get<double>()));
            }
        }
        if(fold.contains("style")) {
            const auto &style = get_object(fold, "style");
            override_mm(style, "line_length_mm", fl.style.line_length);
            override_mm(style, "margin_offset_mm", fl.style.margin_offset);
            override_color(style, "color", fl.style.color);
            override_pt(style, "line_width", fl.style.line_width);
            if(style.contains("line_style")) {
                const auto ls = get_string(style, "line_style");
                if(ls == "solid") {
                    fl.style.dashed = false;
                } else if(ls == "dashed") {
                    fl.style.dashed = true;
                } else {
                    throw ConfigurationError("Unknown line style \"" + ls + "\".");
                }
            }
        }
    }

    if(data.contains("header")) {
        const auto &header = get_object(data, "header");
        if(header.contains("first_page")) {
            parse_zone(get_object(header, "first_page"), conf.header.first_page);
        }
        if(header.contains("subsequent")) {
            parse_zone(get_object(header, "subsequent"), conf.header.subsequent);
        }
        override_pt(header, "font_size", conf.header.font_size);
        override_color(header, "color", conf.header.color);
        override_bool(header, "line_below", conf.header.line_below);
    }

    if(data.contains("footer")) {
        const auto &footer = get_object(data, "footer");
        parse_zone(footer, conf.footer.content);
        override_pt(footer, "font_size", conf.footer.font_size);
        override_color(footer, "color", conf.footer.color);
        override_bool(footer, "line_above", conf.footer.line_above);
    }
}

void parse_postal_address(const json &data, PostalAddress &a) {
    override_string(data, "street_1", a.street_1);
    override_string(data, "street_2", a.street_2);
    override_string(data, "city", a.city);
    override_string(data, "state", a.state);
    override_string(data, "zip", a.zip);
}

void parse_font_files(const json &data, const char *key, FontFiles &f) {
    if(!data.contains(key)) {
        return;
    }
    const auto &fdict = get_object(data, key);
    if(fdict.contains("regular")) {
        f.regular = get_string(fdict, "regular");
    }
    if(fdict.contains("bold")) {
        f.bold = get_string(fdict, "bold");
    }
}

bool has_subsequent_header(const json &data) {
    if(!data.contains("config") || !data["config"].contains("header")) {
        return false;
    }
    return data["config"]["header"].contains("subsequent");
}

} // namespace

LetterDefinition parse_letter_definition(const std::string &json_text,
                                         const std::filesystem::path &top_dir) {
    LetterDefinition def;
    def.top_dir = top_dir;
    json data;
    try {
        data = json::parse(json_text);
    } catch(const json::parse_error &e) {
        throw ConfigurationError(std::string{"Letter definition is not valid JSON: "} + e.what());
    }
    if(!data.is_object()) {
        throw ConfigurationError("Letter definition must be a JSON object.");
    }

    if(data.contains("config")) {
        parse_config(get_object(data, "config"), def.config);
    }
    if(data.contains("fonts")) {
        const auto &fonts = get_object(data, "fonts");
        parse_font_files(fonts, "times", def.font_files.times);
        parse_font_files(fonts, "helvetica", def.font_files.helvetica);
        parse_font_files(fonts, "courier", def.font_files.courier);
    }
    if(data.contains("backend")) {
        def.backend = lookup(backendmap, get_string(data, "backend"), "backend");
    }
    // Pango selects fonts by family name so it would draw with different
    // glyphs than the ones the layout was measured with.
    if(def.backend == Backend::Cairo && data.contains("fonts")) {
        throw ConfigurationError("Explicit font files can not be used with the cairo backend.");
    }
    def.output = top_dir / get_string(data, "output");

    auto &req = def.request;
    const auto &sender = get_object(data, "sender");
    req.sender.name = get_string(sender, "name");
    parse_postal_address(sender, req.sender.address);
    override_string(sender, "email", req.sender.email);
    override_string(sender, "phone", req.sender.phone);

    const auto &recipient = get_object(data, "recipient");
    req.recipient.name = get_string(recipient, "name");
    override_string(recipient, "title", req.recipient.title);
    override_string(recipient, "honorific", req.recipient.honorific);
    parse_postal_address(recipient, req.recipient.address);

    override_string(data, "subject", req.subject);
    override_string(data, "date", req.date);
    override_bool(data, "include_email", req.include_email);
    override_bool(data, "include_phone", req.include_phone);

    if(data.contains("body") && data.contains("content")) {
        throw ConfigurationError("Only one of body and content may be given.");
    }
    if(data.contains("body")) {
        req.paragraphs = get_stringarray(data, "body");
    } else if(data.contains("content")) {
        const auto content_file = top_dir / get_string(data, "content");
        std::string text;
        try {
            for(const auto &line : read_lines(content_file.string().c_str())) {
                text += line;
                text += '\n';
            }
        } catch(const std::runtime_error &e) {
            throw ConfigurationError(e.what());
        }
        auto content = parse_letter_content(text);
        req.salutation = std::move(content.salutation);
        req.paragraphs = std::move(content.paragraphs);
        req.closing = std::move(content.closing);
    } else {
        throw ConfigurationError("Letter definition must have either body or content.");
    }
    override_string(data, "salutation", req.salutation);
    override_string(data, "closing", req.closing);

    // Continuation pages name the recipient and the date unless told otherwise.
    if(!has_subsequent_header(data)) {
        def.config.header.subsequent.left = req.recipient.name;
        def.config.header.subsequent.right = "{formatted_date}";
    }
    return def;
}

LetterDefinition load_letter_json(const char *path) {
    std::filesystem::path json_file(path);
    std::ifstream ifile(path);
    if(ifile.fail()) {
        throw ConfigurationError(std::string{"Could not open file "} + path + ".");
    }
    std::stringstream contents;
    contents << ifile.rdbuf();
    return parse_letter_definition(contents.str(), json_file.parent_path());
}
