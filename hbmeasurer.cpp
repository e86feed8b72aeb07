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

#include "hbmeasurer.hpp"

#include <glib.h>

HBMeasurer::HBMeasurer(const HBFontCache &cache, const char *language) : fc{cache} {
    buf = hb_buffer_create();
    if(!hb_buffer_allocation_successful(buf)) {
        hb_buffer_destroy(buf);
        throw FontError("Could not allocate a HarfBuzz buffer.");
    }
    hb_buffer_set_direction(buf, HB_DIRECTION_LTR);
    hb_buffer_set_script(buf, HB_SCRIPT_LATIN);
    hb_buffer_set_language(buf, hb_language_from_string(language, -1));
}

HBMeasurer::~HBMeasurer() { hb_buffer_destroy(buf); }

Length HBMeasurer::text_width(const char *utf8_text, const TextParameters &text_par) const {
    StyledPlainText k{utf8_text, text_par};
    auto f = plaintext_widths.find(k);
    if(f != plaintext_widths.end()) {
        return f->second;
    }
    Length total_size = compute_width(utf8_text, text_par);
    plaintext_widths[k] = total_size;
    return total_size;
}

Length HBMeasurer::compute_width(const char *utf8_text, const TextParameters &text_par) const {
    if(!g_utf8_validate(utf8_text, -1, nullptr)) {
        throw FontError("Tried to measure text that is not valid UTF-8.");
    }
    const double num_steps = HBFontCache::NUM_STEPS;
    const double hbscale = text_par.size.pt() * num_steps;
    double total_width = 0;
    hb_buffer_clear_contents(buf);
    hb_buffer_add_utf8(buf, utf8_text, -1, 0, -1);
    hb_buffer_guess_segment_properties(buf);

    auto font_o = fc.get_font(text_par);
    if(!font_o) {
        throw FontError("Requested font does not exist.");
    }
    auto &font = font_o.value();
    hb_font_set_scale(font.f, hbscale, hbscale);

    hb_shape(font.f, buf, nullptr, 0);

    unsigned int glyph_count;
    hb_glyph_position_t *glyph_pos = hb_buffer_get_glyph_positions(buf, &glyph_count);
    if(!glyph_pos && glyph_count > 0) {
        throw FontError("Could not get glyph positions.");
    }

    for(unsigned int i = 0; i < glyph_count; i++) {
        const hb_glyph_position_t *curpos = glyph_pos + i;
        total_width += curpos->x_advance / hbscale;
    }
    return total_width * text_par.size;
}
