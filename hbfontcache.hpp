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

#include <lettercommon.hpp>

#include <hb.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <cstdint>

struct HBFontCloser {
    void operator()(hb_font_t *f) const noexcept { hb_font_destroy(f); }
};

struct HBBufferCloser {
    void operator()(hb_buffer_t *b) const noexcept { hb_buffer_destroy(b); }
};

struct FontOwner {
    std::unique_ptr<hb_font_t, HBFontCloser> handle;
    std::filesystem::path file;
    uint32_t units_per_em;
};

struct FontPtrs {
    FontOwner regular;
    FontOwner bold;
};

struct FontFiles {
    std::filesystem::path regular;
    std::filesystem::path bold;
};

// Explicit font files for each family. Empty entries are looked up
// with Fontconfig.
struct FontFilePaths {
    FontFiles times;
    FontFiles helvetica;
    FontFiles courier;
};

struct FontInfo {
    FontInfo() = default;
    FontInfo(const FontOwner &o) {
        f = o.handle.get();
        fname = &o.file;
        units_per_em = o.units_per_em;
    }
    hb_font_t *f = nullptr;
    const std::filesystem::path *fname = nullptr;
    uint32_t units_per_em = 0;
};

class HBFontCache {
public:
    HBFontCache();
    explicit HBFontCache(const FontFilePaths &paths);

    std::optional<FontInfo> get_font(FontFamily family, TextStyle style) const;
    std::optional<FontInfo> get_font(const TextParameters &par) const {
        return get_font(par.family, par.style);
    }

    static constexpr double NUM_STEPS = 64;

private:
    void open_family(FontPtrs &ptrs, FontFamily family, const FontFiles &fnames);

    FontOwner open_file(const std::filesystem::path &font_file);

    uint32_t get_em_units(const std::filesystem::path &fontfile);

    FontPtrs times;
    FontPtrs helvetica;
    FontPtrs courier;
};

// Asks Fontconfig for the file that best matches a family and weight.
std::filesystem::path find_font_file(const char *family, TextStyle style);
