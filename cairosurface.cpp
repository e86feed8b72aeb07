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

#include <cairosurface.hpp>

#include <cairo-pdf.h>

CairoSurface::CairoSurface(const SurfaceSetup &setup) : pageh{setup.page.h.pt()} {
    surf = cairo_pdf_surface_create_for_stream(
        &CairoSurface::append_to_buffer, this, setup.page.w.pt(), setup.page.h.pt());
    if(cairo_surface_status(surf) != CAIRO_STATUS_SUCCESS) {
        const std::string msg{cairo_status_to_string(cairo_surface_status(surf))};
        cairo_surface_destroy(surf);
        throw SurfaceError("Could not create PDF surface: " + msg);
    }
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_TITLE, setup.title.c_str());
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_AUTHOR, setup.author.c_str());
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_SUBJECT, setup.subject.c_str());
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_CREATOR, "lettermaker");
    // Otherwise Cairo stamps the current time and no two renders match.
    if(!setup.creation_date.empty()) {
        const std::string created = setup.creation_date + "T00:00:00Z";
        cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_CREATE_DATE, created.c_str());
    }
    cr = cairo_create(surf);
    layout = pango_cairo_create_layout(cr);
    PangoContext *context = pango_layout_get_context(layout);
    pango_context_set_round_glyph_positions(context, FALSE);
}

CairoSurface::~CairoSurface() {
    g_object_unref(G_OBJECT(layout));
    cairo_destroy(cr);
    cairo_surface_destroy(surf);
}

cairo_status_t
CairoSurface::append_to_buffer(void *closure, const unsigned char *data, unsigned int length) {
    auto *self = static_cast<CairoSurface *>(closure);
    self->output.insert(self->output.end(), data, data + length);
    return CAIRO_STATUS_SUCCESS;
}

void CairoSurface::check_open() const {
    if(finished) {
        throw SurfaceError("Tried to draw on a finished surface.");
    }
}

void CairoSurface::setup_pango(const TextParameters &par) {
    PangoFontDescription *desc = pango_font_description_from_string(fontconfig_family(par.family));
    if(par.style == TextStyle::Bold) {
        pango_font_description_set_weight(desc, PANGO_WEIGHT_BOLD);
    } else {
        pango_font_description_set_weight(desc, PANGO_WEIGHT_NORMAL);
    }
    pango_font_description_set_style(desc, PANGO_STYLE_NORMAL);
    pango_font_description_set_absolute_size(desc, par.size.pt() * PANGO_SCALE);
    pango_layout_set_font_description(layout, desc);
    pango_font_description_free(desc);
}

void CairoSurface::draw_text(
    Length x, Length y, const std::string &text, const TextParameters &par, const Color &color) {
    check_open();
    if(text.empty()) {
        return;
    }
    setup_pango(par);
    pango_layout_set_attributes(layout, nullptr);
    pango_layout_set_text(layout, text.c_str(), int(text.length()));
    // Pango positions by the top of the layout, we want the baseline.
    // https://gitlab.gnome.org/GNOME/pango/-/issues/698
    const double baseline = double(pango_layout_get_baseline(layout)) / PANGO_SCALE;
    cairo_save(cr);
    cairo_set_source_rgb(cr, color.r, color.g, color.b);
    cairo_move_to(cr, x.pt(), flip(y) - baseline);
    pango_cairo_update_layout(cr, layout);
    pango_cairo_show_layout(cr, layout);
    cairo_restore(cr);
}

void CairoSurface::draw_line(Length x0, Length y0, Length x1, Length y1, const LineStyle &style) {
    check_open();
    cairo_save(cr);
    cairo_set_source_rgb(cr, style.color.r, style.color.g, style.color.b);
    cairo_set_line_width(cr, style.width.pt());
    if(style.dashed) {
        const double dashes[2] = {3.0, 2.0};
        cairo_set_dash(cr, dashes, 2, 0.0);
    }
    cairo_move_to(cr, x0.pt(), flip(y0));
    cairo_line_to(cr, x1.pt(), flip(y1));
    cairo_stroke(cr);
    cairo_restore(cr);
}

void CairoSurface::new_page() {
    check_open();
    cairo_surface_show_page(surf);
    ++pages;
}

std::vector<uint8_t> CairoSurface::finish() {
    check_open();
    finished = true;
    cairo_surface_finish(surf);
    const auto status = cairo_surface_status(surf);
    if(status != CAIRO_STATUS_SUCCESS) {
        throw SurfaceError(std::string{"Could not finish PDF: "} + cairo_status_to_string(status));
    }
    return std::move(output);
}

SurfaceFactory cairo_surface_factory() {
    return [](const SurfaceSetup &setup) -> std::unique_ptr<DrawingSurface> {
        return std::make_unique<CairoSurface>(setup);
    };
}
