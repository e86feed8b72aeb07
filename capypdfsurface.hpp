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
#include <hbfontcache.hpp>

#include <capypdf.hpp>

#include <stdexcept>
#include <unordered_map>

// Runs CapyPDF calls. Their failures come out as SurfaceError.
template<typename F> auto capypdf_call(const std::string &what, F &&f) -> decltype(f()) {
    try {
        return f();
    } catch(const SurfaceError &) {
        throw;
    } catch(const std::runtime_error &e) {
        throw SurfaceError(what + ": " + e.what());
    }
}

// A file name reserved with GLib that is deleted when this goes away.
class TempPdfFile {
public:
    TempPdfFile();
    ~TempPdfFile();

    TempPdfFile(const TempPdfFile &) = delete;
    TempPdfFile &operator=(const TempPdfFile &) = delete;

    const char *path() const { return fname; }

private:
    char *fname = nullptr;
};

class CapyPdfSurface : public DrawingSurface {
public:
    CapyPdfSurface(const SurfaceSetup &setup, const HBFontCache &fc);

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
    static capypdf::DocumentProperties document_properties(const SurfaceSetup &setup);

    void check_open() const;

    CapyPDF_FontId hbfont2capyfont(const FontInfo &fontinfo);

    TempPdfFile tmpfile;
    capypdf::Generator capygen;
    capypdf::DrawContext ctx;
    const HBFontCache &fc;
    std::unique_ptr<hb_buffer_t, HBBufferCloser> buf;
    std::unordered_map<hb_font_t *, CapyPDF_FontId> loaded_fonts;
    int pages = 1;
    bool finished = false;
};

SurfaceFactory capypdf_surface_factory(const HBFontCache &fc);
