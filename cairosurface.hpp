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

#pragma once

#include <drawingsurface.hpp>

#include <cairo.h>
#include <pango/pangocairo.h>

// Cairo's PDF backend with text laid out by Pango. Cairo's y axis points
// down so coordinates are flipped on the way in.
class CairoSurface : public DrawingSurface {
public:
    explicit CairoSurface(const SurfaceSetup &setup);
    ~CairoSurface() override;

    CairoSurface(const CairoSurface &) = delete;
    CairoSurface &operator=(const CairoSurface &) = delete;

    void draw_text(Length x,
                   Length y,
                   const std::string &text,
                   const TextParameters &par,
                   const Color &color) override;

    void draw_line(Length x0, Length y0, Length x1, Length y1, const LineStyle &style) override;

    void new_page() override;

    std::vector<uint8_t> finish() override;

    int page_num() const override { return pages; }

private:
    static cairo_status_t
    append_to_buffer(void *closure, const unsigned char *data, unsigned int length);

    void setup_pango(const TextParameters &par);
    void check_open() const;
    double flip(Length y) const { return pageh - y.pt(); }

    std::vector<uint8_t> output;
    int pages = 1;
    bool finished = false;
    double pageh;
    cairo_surface_t *surf;
    cairo_t *cr;
    PangoLayout *layout;
};

SurfaceFactory cairo_surface_factory();
