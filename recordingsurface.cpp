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

#include <recordingsurface.hpp>

#include <cstdarg>
#include <cstdio>

namespace {

const char *family_name(FontFamily f) {
    switch(f) {
    case FontFamily::Times:
        return "times";
    case FontFamily::Helvetica:
        return "helvetica";
    case FontFamily::Courier:
        return "courier";
    }
    return "unknown";
}

const char *style_name(TextStyle s) { return s == TextStyle::Bold ? "bold" : "regular"; }

} // namespace

RecordingSurface::RecordingSurface(const SurfaceSetup &setup) {
    append("document %.2f %.2f\n", setup.page.w.pt(), setup.page.h.pt());
    append("title %s\n", setup.title.c_str());
    append("author %s\n", setup.author.c_str());
    append("subject %s\n", setup.subject.c_str());
    append("created %s\n", setup.creation_date.c_str());
    append("page %d\n", pages);
}

void RecordingSurface::append(const char *fmt, ...) {
    char tmp[1024];
    va_list args;
    va_start(args, fmt);
    const int rc = vsnprintf(tmp, sizeof(tmp), fmt, args);
    va_end(args);
    if(rc < 0) {
        throw SurfaceError("Could not format a recorded command.");
    }
    if(size_t(rc) < sizeof(tmp)) {
        buf.append(tmp, rc);
        return;
    }
    std::string big(rc + 1, '\0');
    va_start(args, fmt);
    vsnprintf(big.data(), big.size(), fmt, args);
    va_end(args);
    big.pop_back();
    buf += big;
}

void RecordingSurface::check_open() const {
    if(finished) {
        throw SurfaceError("Tried to draw on a finished surface.");
    }
}

void RecordingSurface::draw_text(
    Length x, Length y, const std::string &text, const TextParameters &par, const Color &color) {
    check_open();
    append("text %.2f %.2f %s %s %.1f #%02X%02X%02X %s\n",
           x.pt(),
           y.pt(),
           family_name(par.family),
           style_name(par.style),
           par.size.pt(),
           int(color.r * 255 + 0.5),
           int(color.g * 255 + 0.5),
           int(color.b * 255 + 0.5),
           text.c_str());
}

void RecordingSurface::draw_line(
    Length x0, Length y0, Length x1, Length y1, const LineStyle &style) {
    check_open();
    append("line %.2f %.2f %.2f %.2f %.2f #%02X%02X%02X %s\n",
           x0.pt(),
           y0.pt(),
           x1.pt(),
           y1.pt(),
           style.width.pt(),
           int(style.color.r * 255 + 0.5),
           int(style.color.g * 255 + 0.5),
           int(style.color.b * 255 + 0.5),
           style.dashed ? "dashed" : "solid");
}

void RecordingSurface::new_page() {
    check_open();
    ++pages;
    append("page %d\n", pages);
}

std::vector<uint8_t> RecordingSurface::finish() {
    check_open();
    finished = true;
    append("end %d\n", pages);
    return std::vector<uint8_t>(buf.begin(), buf.end());
}

SurfaceFactory recording_surface_factory() {
    return [](const SurfaceSetup &setup) -> std::unique_ptr<DrawingSurface> {
        return std::make_unique<RecordingSurface>(setup);
    };
}
