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

#include <letterconfig.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Coordinates given to a surface are in PDF user space: the origin is
// the bottom left corner of the page and y grows upwards.
class DrawingSurface {
public:
    virtual ~DrawingSurface() = default;

    virtual void draw_text(Length x,
                           Length y,
                           const std::string &text,
                           const TextParameters &par,
                           const Color &color) = 0;

    virtual void draw_line(Length x0, Length y0, Length x1, Length y1, const LineStyle &style) = 0;

    virtual void new_page() = 0;

    // Closes the document and hands out its contents. The surface can
    // not be drawn to afterwards. Throws SurfaceError.
    virtual std::vector<uint8_t> finish() = 0;

    // 1-based number of the page currently being drawn.
    virtual int page_num() const = 0;
};

struct SurfaceSetup {
    PageSize page;
    std::string title;
    std::string author;
    std::string subject;
    // YYYY-MM-DD, recorded as the document's creation date.
    std::string creation_date;
};

typedef std::function<std::unique_ptr<DrawingSurface>(const SurfaceSetup &)> SurfaceFactory;

// The only place where layout coordinates (distance from the top edge)
// are turned into surface coordinates.
class PageFrame {
public:
    explicit PageFrame(const PageSize &page) : page_h{page.h} {}

    Length surface_y(Length from_top) const { return page_h - from_top; }

private:
    Length page_h;
};
