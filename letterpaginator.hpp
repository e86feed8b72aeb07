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

#include <drawingsurface.hpp>
#include <letterconfig.hpp>
#include <letterlayout.hpp>
#include <letterrequest.hpp>
#include <textmeasurer.hpp>

#include <string>

// Replaces {page}, {total} and {formatted_date}. Other text, including
// unknown brace sequences, is copied as is.
std::string expand_placeholders(const std::string &tmpl,
                                int page,
                                int total,
                                const std::string &formatted_date);

class LetterPaginator {
public:
    // Throws ConfigurationError if the configuration is not usable.
    LetterPaginator(const LetterConfig &config, const TextMeasurer &meas);

    LetterPaginator(const LetterPaginator &) = delete;
    LetterPaginator &operator=(const LetterPaginator &) = delete;

    // Number of pages render() will produce.
    int simulate(const LetterRequest &req) const;

    // total_pages must come from simulate() on the same request.
    RenderedLetter
    render(const LetterRequest &req, int total_pages, const SurfaceFactory &factory) const;

    // Both passes in one go.
    RenderedLetter generate(const LetterRequest &req, const SurfaceFactory &factory) const;

    const LetterConfig &config() const { return conf; }

private:
    void draw_page_decorations(DrawingSurface &surface,
                               const PageLayout &page,
                               int page_num,
                               int total_pages,
                               const std::string &formatted_date) const;
    void draw_fold_lines(DrawingSurface &surface) const;
    void draw_header(DrawingSurface &surface,
                     PageRole role,
                     int page_num,
                     int total_pages,
                     const std::string &formatted_date) const;
    void draw_footer(DrawingSurface &surface,
                     int page_num,
                     int total_pages,
                     const std::string &formatted_date) const;
    void draw_zones(DrawingSurface &surface,
                    const ZoneContent &zones,
                    Length y,
                    const TextParameters &par,
                    const Color &color,
                    int page_num,
                    int total_pages,
                    const std::string &formatted_date) const;
    void draw_rule(DrawingSurface &surface, Length y) const;

    void flush_draw_commands(DrawingSurface &surface, const PageLayout &page) const;

    LetterConfig conf;
    const TextMeasurer &meas;
    PageFrame frame;
    LetterLayouter layouter;
};
