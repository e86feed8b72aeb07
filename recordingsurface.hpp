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

// Writes every draw call as one line of text. Output only depends on
// the calls made, so it can be compared byte for byte.
class RecordingSurface : public DrawingSurface {
public:
    explicit RecordingSurface(const SurfaceSetup &setup);

    void draw_text(Length x,
                   Length y,
                   const std::string &text,
                   const TextParameters &par,
                   const Color &color) override;

    void draw_line(Length x0, Length y0, Length x1, Length y1, const LineStyle &style) override;

    void new_page() override;

    std::vector<uint8_t> finish() override;

    int page_num() const override { return pages; }

    const std::string &log() const { return buf; }

private:
    void append(const char *fmt, ...) __attribute__((format(printf, 2, 3)));
    void check_open() const;

    std::string buf;
    int pages = 1;
    bool finished = false;
};

SurfaceFactory recording_surface_factory();
