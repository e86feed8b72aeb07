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

#include <hbfontcache.hpp>

#include <fontconfig/fontconfig.h>
#include <ft2build.h>
#include FT_FREETYPE_H

#include <cstdio>

std::filesystem::path find_font_file(const char *family, TextStyle style) {
    if(!FcInit()) {
        throw FontError("Could not initialize Fontconfig.");
    }
    FcPattern *pattern = FcPatternCreate();
    FcPatternAddString(pattern, FC_FAMILY, (const FcChar8 *)family);
    FcPatternAddInteger(
        pattern, FC_WEIGHT, style == TextStyle::Bold ? FC_WEIGHT_BOLD : FC_WEIGHT_REGULAR);
    FcPatternAddInteger(pattern, FC_SLANT, FC_SLANT_ROMAN);
    FcConfigSubstitute(nullptr, pattern, FcMatchPattern);
    FcDefaultSubstitute(pattern);

    FcResult result;
    FcPattern *match = FcFontMatch(nullptr, pattern, &result);
    FcPatternDestroy(pattern);
    if(!match) {
        throw FontError(std::string{"No font matches family "} + family + ".");
    }
    FcChar8 *file = nullptr;
    if(FcPatternGetString(match, FC_FILE, 0, &file) != FcResultMatch) {
        FcPatternDestroy(match);
        throw FontError(std::string{"Font match for "} + family + " has no file.");
    }
    std::filesystem::path fontfile{(const char *)file};
    FcPatternDestroy(match);
    return fontfile;
}

HBFontCache::HBFontCache() : HBFontCache(FontFilePaths{}) {}

HBFontCache::HBFontCache(const FontFilePaths &paths) {
    open_family(times, FontFamily::Times, paths.times);
    open_family(helvetica, FontFamily::Helvetica, paths.helvetica);
    open_family(courier, FontFamily::Courier, paths.courier);
}

void HBFontCache::open_family(FontPtrs &ptrs, FontFamily family, const FontFiles &fnames) {
    const char *fcname = fontconfig_family(family);
    ptrs.regular = open_file(fnames.regular.empty() ? find_font_file(fcname, TextStyle::Regular)
                                                    : fnames.regular);
    ptrs.bold =
        open_file(fnames.bold.empty() ? find_font_file(fcname, TextStyle::Bold) : fnames.bold);
}

FontOwner HBFontCache::open_file(const std::filesystem::path &fontfile) {
    hb_blob_t *blob = hb_blob_create_from_file_or_fail(fontfile.string().c_str());
    if(!blob) {
        throw FontError("Could not open font file " + fontfile.string() + ".");
    }
    hb_face_t *face = hb_face_create(blob, 0);
    hb_blob_destroy(blob);
    if(!face) {
        throw FontError("HB face creation failed for " + fontfile.string() + ".");
    }
    hb_font_t *font = hb_font_create(face);
    hb_face_destroy(face);
    if(!font) {
        throw FontError("HB font creation failed for " + fontfile.string() + ".");
    }
    std::unique_ptr<hb_font_t, HBFontCloser> h{font};
    FontOwner result{std::move(h), fontfile, get_em_units(fontfile)};

    return result;
}

uint32_t HBFontCache::get_em_units(const std::filesystem::path &fontfile) {
    // HB does not seem to expose this value to end users, but it
    // is required to make PDF kerning work.
    FT_Library ft;
    FT_Face ftface;
    FT_Error fte;
    fte = FT_Init_FreeType(&ft);
    if(fte != 0) {
        throw FontError("Could not initialize FreeType.");
    }
    fte = FT_New_Face(ft, fontfile.string().c_str(), 0, &ftface);
    if(fte != 0) {
        FT_Done_FreeType(ft);
        throw FontError("FreeType could not load " + fontfile.string() + ".");
    }
    uint32_t units = ftface->units_per_EM;
    FT_Done_Face(ftface);
    FT_Done_FreeType(ft);
    return units;
}

std::optional<FontInfo> HBFontCache::get_font(FontFamily family, TextStyle style) const {
    const FontPtrs *p;
    switch(family) {
    case FontFamily::Times:
        p = &times;
        break;
    case FontFamily::Helvetica:
        p = &helvetica;
        break;
    case FontFamily::Courier:
        p = &courier;
        break;
    default:
        return {};
    }
    FontInfo result = style == TextStyle::Bold ? FontInfo(p->bold) : FontInfo(p->regular);
    if(!result.f) {
        return {};
    }
    return result;
}
