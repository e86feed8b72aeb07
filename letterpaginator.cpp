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

#include <letterpaginator.hpp>

#include <stdexcept>

namespace {

const Length header_baseline = Length::from_in(0.5);
const Length header_rule_gap = Length::from_pt(5);
const Length footer_baseline = Length::from_in(0.5);
const Length footer_rule_gap = Length::from_pt(15);

const LineStyle rule_style{Length::from_pt(0.5), Color::gray(0.8), false};

} // namespace

std::string expand_placeholders(const std::string &tmpl,
                                int page,
                                int total,
                                const std::string &formatted_date) {
    std::string result;
    result.reserve(tmpl.size());
    size_t i = 0;
    while(i < tmpl.size()) {
        if(tmpl[i] == '{') {
            const auto end = tmpl.find('}', i);
            if(end != std::string::npos) {
                const auto key = tmpl.substr(i + 1, end - i - 1);
                if(key == "page") {
                    result += std::to_string(page);
                    i = end + 1;
                    continue;
                } else if(key == "total") {
                    result += std::to_string(total);
                    i = end + 1;
                    continue;
                } else if(key == "formatted_date") {
                    result += formatted_date;
                    i = end + 1;
                    continue;
                }
            }
        }
        result.push_back(tmpl[i]);
        ++i;
    }
    return result;
}

LetterPaginator::LetterPaginator(const LetterConfig &config, const TextMeasurer &meas_)
    : conf{config}, meas{meas_}, frame{config.page}, layouter{conf, meas_} {
    conf.validate();
}

int LetterPaginator::simulate(const LetterRequest &req) const {
    return layouter.layout(req).num_pages();
}

RenderedLetter LetterPaginator::generate(const LetterRequest &req,
                                         const SurfaceFactory &factory) const {
    return render(req, simulate(req), factory);
}

RenderedLetter LetterPaginator::render(const LetterRequest &req,
                                       int total_pages,
                                       const SurfaceFactory &factory) const {
    const auto layout = layouter.layout(req);
    if(layout.num_pages() != total_pages) {
        throw std::logic_error("Page count mismatch: simulated " + std::to_string(total_pages) +
                               " pages but layout has " + std::to_string(layout.num_pages()) +
                               ".");
    }

    SurfaceSetup setup;
    setup.page = conf.page;
    setup.title = "Letter to " + req.recipient.name;
    setup.author = req.sender.name;
    setup.subject = req.subject;
    setup.creation_date = layout.iso_date;
    std::unique_ptr<DrawingSurface> surface = factory(setup);
    if(!surface) {
        throw SurfaceError("Surface factory did not create a surface.");
    }

    for(size_t i = 0; i < layout.pages.size(); ++i) {
        if(i > 0) {
            surface->new_page();
        }
        const auto &page = layout.pages[i];
        draw_page_decorations(*surface, page, int(i + 1), total_pages, layout.formatted_date);
        flush_draw_commands(*surface, page);
    }
    if(surface->page_num() != total_pages) {
        throw std::logic_error("Surface ended up with " + std::to_string(surface->page_num()) +
                               " pages instead of " + std::to_string(total_pages) + ".");
    }

    RenderedLetter result;
    result.bytes = surface->finish();
    result.num_pages = total_pages;
    return result;
}

void LetterPaginator::draw_page_decorations(DrawingSurface &surface,
                                            const PageLayout &page,
                                            int page_num,
                                            int total_pages,
                                            const std::string &formatted_date) const {
    draw_fold_lines(surface);
    draw_header(surface, page.role, page_num, total_pages, formatted_date);
    draw_footer(surface, page_num, total_pages, formatted_date);
}

void LetterPaginator::draw_fold_lines(DrawingSurface &surface) const {
    const auto &fold = conf.fold_lines;
    if(!fold.enabled) {
        return;
    }
    const LineStyle style{fold.style.line_width, fold.style.color, fold.style.dashed};
    const Length left = fold.style.margin_offset;
    const Length right = conf.page.w - fold.style.margin_offset;
    for(const auto &pos : fold.positions) {
        const Length y = frame.surface_y(pos);
        surface.draw_line(left, y, left + fold.style.line_length, y, style);
        surface.draw_line(right - fold.style.line_length, y, right, y, style);
    }
}

void LetterPaginator::draw_header(DrawingSurface &surface,
                                  PageRole role,
                                  int page_num,
                                  int total_pages,
                                  const std::string &formatted_date) const {
    const auto &zones = conf.header.content(role);
    if(!zones.enabled) {
        return;
    }
    const TextParameters par{conf.header.font_size, conf.formatting.family, TextStyle::Regular};
    draw_zones(surface,
               zones,
               header_baseline,
               par,
               conf.header.color,
               page_num,
               total_pages,
               formatted_date);
    if(conf.header.line_below) {
        draw_rule(surface, header_baseline + header_rule_gap);
    }
}

void LetterPaginator::draw_footer(DrawingSurface &surface,
                                  int page_num,
                                  int total_pages,
                                  const std::string &formatted_date) const {
    const auto &zones = conf.footer.content;
    if(!zones.enabled) {
        return;
    }
    const Length baseline = conf.page.h - footer_baseline;
    if(conf.footer.line_above) {
        draw_rule(surface, baseline - footer_rule_gap);
    }
    const TextParameters par{conf.footer.font_size, conf.formatting.family, TextStyle::Regular};
    draw_zones(
        surface, zones, baseline, par, conf.footer.color, page_num, total_pages, formatted_date);
}

void LetterPaginator::draw_zones(DrawingSurface &surface,
                                 const ZoneContent &zones,
                                 Length y,
                                 const TextParameters &par,
                                 const Color &color,
                                 int page_num,
                                 int total_pages,
                                 const std::string &formatted_date) const {
    const Length sy = frame.surface_y(y);
    const Length left_edge = conf.positioning.margins.left;
    const Length right_edge = conf.page.w - conf.positioning.margins.right;

    const auto left = expand_placeholders(zones.left, page_num, total_pages, formatted_date);
    if(!left.empty()) {
        surface.draw_text(left_edge, sy, left, par, color);
    }
    const auto center = expand_placeholders(zones.center, page_num, total_pages, formatted_date);
    if(!center.empty()) {
        const Length w = meas.text_width(center, par);
        surface.draw_text(
            aligned_x(conf.page.w / 2, w, TextAlignment::Centered), sy, center, par, color);
    }
    const auto right = expand_placeholders(zones.right, page_num, total_pages, formatted_date);
    if(!right.empty()) {
        const Length w = meas.text_width(right, par);
        surface.draw_text(aligned_x(right_edge, w, TextAlignment::Right), sy, right, par, color);
    }
}

void LetterPaginator::draw_rule(DrawingSurface &surface, Length y) const {
    const Length sy = frame.surface_y(y);
    surface.draw_line(conf.positioning.margins.left,
                      sy,
                      conf.page.w - conf.positioning.margins.right,
                      sy,
                      rule_style);
}

void LetterPaginator::flush_draw_commands(DrawingSurface &surface, const PageLayout &page) const {
    for(const auto &c : page.commands) {
        if(const auto *text = std::get_if<TextDrawCommand>(&c)) {
            surface.draw_text(text->x, frame.surface_y(text->y), text->text, text->par, text->color);
        } else if(const auto *line = std::get_if<LineDrawCommand>(&c)) {
            surface.draw_line(line->x0,
                              frame.surface_y(line->y0),
                              line->x1,
                              frame.surface_y(line->y1),
                              line->style);
        }
    }
}
