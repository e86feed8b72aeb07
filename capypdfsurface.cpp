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

#include <capypdfsurface.hpp>
#include <utils.hpp>

#include <glib.h>
#include <glib/gstdio.h>
#include <unistd.h>

#include <cstring>
#include <string_view>

namespace {

size_t
get_endpoint(hb_glyph_info_t *glyph_info, size_t glyph_count, size_t i, const char *sampletext) {
    if(i + 1 < glyph_count) {
        return glyph_info[i + 1].cluster;
    }
    return strlen(sampletext);
}

void hb_buffer_to_textsequence(hb_buffer_t *buf,
                               capypdf::TextSequence &ts,
                               const FontInfo &fontinfo,
                               double hbscale,
                               const char *unshaped_text) {
    unsigned int glyph_count;
    hb_glyph_info_t *glyph_info = hb_buffer_get_glyph_infos(buf, &glyph_count);
    hb_glyph_position_t *glyph_pos = hb_buffer_get_glyph_positions(buf, &glyph_count);
    for(unsigned int i = 0; i < glyph_count; i++) {
        const hb_glyph_info_t *current = glyph_info + i;
        const hb_glyph_position_t *curpos = glyph_pos + i;
        const auto original_text_start = unshaped_text + current->cluster;
        const auto original_text_end =
            unshaped_text + get_endpoint(glyph_info, glyph_count, i, unshaped_text);
        const std::string_view original_text(original_text_start,
                                             original_text_end - original_text_start);
        // PDF advances glyphs by their default width, shaping may have
        // changed that (kerning).
        const auto glyph_advance_in_font_units =
            hb_font_get_glyph_h_advance(fontinfo.f, current->codepoint) / hbscale *
            fontinfo.units_per_em;
        const auto shaped_advance_in_font_units =
            curpos->x_advance / hbscale * fontinfo.units_per_em;
        const int32_t kerning_delta =
            int32_t(glyph_advance_in_font_units - shaped_advance_in_font_units);
        const auto *one_char_forward = g_utf8_next_char(original_text_start);
        if(one_char_forward == original_text_end) {
            ts.append_raw_glyph(current->codepoint, g_utf8_get_char(original_text_start));
        } else {
            ts.append_ligature_glyph(current->codepoint, original_text);
        }
        if(kerning_delta != 0) {
            ts.append_kerning(kerning_delta);
        }
    }
}

} // namespace

TempPdfFile::TempPdfFile() {
    GError *err = nullptr;
    const int fd = g_file_open_tmp("letterpress-XXXXXX.pdf", &fname, &err);
    if(fd < 0) {
        std::string msg{"Could not create a temporary file: "};
        msg += err ? err->message : "unknown error";
        g_clear_error(&err);
        throw SurfaceError(msg);
    }
    close(fd);
}

TempPdfFile::~TempPdfFile() {
    if(fname) {
        g_unlink(fname);
        g_free(fname);
    }
}

capypdf::DocumentProperties CapyPdfSurface::document_properties(const SurfaceSetup &setup) {
    capypdf::DocumentProperties dprop;
    capypdf::PageProperties pprop;
    pprop.set_pagebox(CAPY_BOX_MEDIA, 0, 0, setup.page.w.pt(), setup.page.h.pt());
    dprop.set_default_page_properties(pprop);
    dprop.set_title(setup.title);
    dprop.set_author(setup.author);
    dprop.set_creator("lettermaker");
    return dprop;
}

CapyPdfSurface::CapyPdfSurface(const SurfaceSetup &setup, const HBFontCache &fc_)
    : capygen{capypdf_call("Could not create PDF generator",
                           [&] {
                               return capypdf::Generator(tmpfile.path(),
                                                         document_properties(setup));
                           })},
      ctx{capypdf_call("Could not create page context",
                       [this] { return capygen.new_page_context(); })},
      fc{fc_}, buf{hb_buffer_create()} {
    if(!hb_buffer_allocation_successful(buf.get())) {
        throw SurfaceError("Could not allocate a HarfBuzz buffer.");
    }
}

void CapyPdfSurface::check_open() const {
    if(finished) {
        throw SurfaceError("Tried to draw on a finished surface.");
    }
}

void CapyPdfSurface::draw_text(
    Length x, Length y, const std::string &text, const TextParameters &par, const Color &color) {
    check_open();
    if(text.empty()) {
        return;
    }
    auto font_o = fc.get_font(par);
    if(!font_o) {
        throw SurfaceError("Requested font is not loaded.");
    }
    const auto &fontinfo = font_o.value();
    const auto capyfont_id = hbfont2capyfont(fontinfo);

    const double hbscale = par.size.pt() * HBFontCache::NUM_STEPS;
    hb_buffer_t *b = buf.get();
    hb_buffer_clear_contents(b);
    hb_buffer_set_direction(b, HB_DIRECTION_LTR);
    hb_buffer_set_script(b, HB_SCRIPT_LATIN);
    hb_buffer_set_language(b, hb_language_from_string("en", -1));
    hb_buffer_add_utf8(b, text.data(), text.size(), 0, -1);
    hb_buffer_guess_segment_properties(b);
    hb_font_set_scale(fontinfo.f, hbscale, hbscale);
    hb_shape(fontinfo.f, b, nullptr, 0);

    capypdf::TextSequence ts;
    hb_buffer_to_textsequence(b, ts, fontinfo, hbscale, text.c_str());

    capypdf_call("Could not draw text", [&] {
        ctx.cmd_q();
        ctx.cmd_rg(color.r, color.g, color.b);
        capypdf::Text tobj = ctx.text_new();
        tobj.cmd_Tf(capyfont_id, par.size.pt());
        tobj.cmd_Td(x.pt(), y.pt());
        tobj.cmd_TJ(ts);
        ctx.render_text_obj(tobj);
        ctx.cmd_Q();
    });
}

void CapyPdfSurface::draw_line(
    Length x0, Length y0, Length x1, Length y1, const LineStyle &style) {
    check_open();
    capypdf_call("Could not draw line", [&] {
        ctx.cmd_q();
        ctx.cmd_RG(style.color.r, style.color.g, style.color.b);
        ctx.cmd_w(style.width.pt());
        if(style.dashed) {
            double dashes[2] = {3.0, 2.0};
            ctx.cmd_d(dashes, 2, 0.0);
        }
        ctx.cmd_m(x0.pt(), y0.pt());
        ctx.cmd_l(x1.pt(), y1.pt());
        ctx.cmd_S();
        ctx.cmd_Q();
    });
}

void CapyPdfSurface::new_page() {
    check_open();
    capypdf_call("Could not add page", [this] { capygen.add_page(ctx); });
    ++pages;
}

std::vector<uint8_t> CapyPdfSurface::finish() {
    check_open();
    finished = true;
    capypdf_call("PDF generation failed", [this] {
        capygen.add_page(ctx);
        capygen.write();
    });
    try {
        return read_bytes(tmpfile.path());
    } catch(const std::runtime_error &e) {
        throw SurfaceError(e.what());
    }
}

CapyPDF_FontId CapyPdfSurface::hbfont2capyfont(const FontInfo &fontinfo) {
    auto it = loaded_fonts.find(fontinfo.f);
    if(it != loaded_fonts.end()) {
        return it->second;
    }
    capypdf::FontProperties fprop;
    const auto font_id = capypdf_call("Could not load font " + fontinfo.fname->string(), [&] {
        return capygen.load_font(fontinfo.fname->string().c_str(), fprop);
    });
    loaded_fonts[fontinfo.f] = font_id;
    return font_id;
}

SurfaceFactory capypdf_surface_factory(const HBFontCache &fc) {
    return [&fc](const SurfaceSetup &setup) -> std::unique_ptr<DrawingSurface> {
        return std::make_unique<CapyPdfSurface>(setup, fc);
    };
}
