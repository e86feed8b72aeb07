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

#include <cairosurface.hpp>
#include <capypdfsurface.hpp>
#include <recordingsurface.hpp>

#include <glib.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

SurfaceSetup letter_setup() {
    SurfaceSetup setup;
    setup.title = "Letter to Jane Doe";
    setup.author = "Pat Smith";
    setup.subject = "Bridge repairs";
    setup.creation_date = "2024-03-05";
    return setup;
}

std::vector<uint8_t> draw_fold_mark(const SurfaceFactory &factory) {
    auto surface = factory(letter_setup());
    const LineStyle style{Length::from_pt(0.5), Color::gray(0.8), true};
    surface->draw_line(Length::from_pt(8.5),
                       Length::from_pt(527.76),
                       Length::from_pt(19.84),
                       Length::from_pt(527.76),
                       style);
    surface->new_page();
    surface->draw_line(Length::from_pt(8.5),
                       Length::from_pt(527.76),
                       Length::from_pt(19.84),
                       Length::from_pt(527.76),
                       style);
    return surface->finish();
}

} // namespace

void test_capypdf_errors_are_surface_errors() {
    CHECK(capypdf_call("Adding", [] { return 3; }) == 3);

    bool thrown = false;
    try {
        capypdf_call("Could not load font a.ttf",
                     []() -> int { throw std::runtime_error("unsupported font format"); });
    } catch(const SurfaceError &e) {
        thrown = true;
        CHECK(std::string{e.what()} == "Could not load font a.ttf: unsupported font format");
    }
    CHECK(thrown);

    thrown = false;
    try {
        capypdf_call("Could not add page", [] { throw SurfaceError("Disk full."); });
    } catch(const SurfaceError &e) {
        thrown = true;
        CHECK(std::string{e.what()} == "Disk full.");
    }
    CHECK(thrown);
}

void test_cairo_output_is_stable() {
    const auto first = draw_fold_mark(cairo_surface_factory());
    // Creation dates have a resolution of one second.
    g_usleep(1100000);
    const auto second = draw_fold_mark(cairo_surface_factory());
    CHECK(!first.empty());
    CHECK(first == second);
}

void test_recording_setup() {
    const auto bytes = draw_fold_mark(recording_surface_factory());
    const std::string log(bytes.begin(), bytes.end());
    CHECK(log.find("subject Bridge repairs\ncreated 2024-03-05\npage 1\n") != std::string::npos);
    CHECK(log.find("line 8.50 527.76 19.84 527.76 0.50 #CCCCCC dashed\npage 2\n") !=
          std::string::npos);
    CHECK(log.find("end 2\n") != std::string::npos);
}

void test_finished_surface_rejects_drawing() {
    auto surface = recording_surface_factory()(letter_setup());
    surface->finish();
    bool thrown = false;
    try {
        surface->new_page();
    } catch(const SurfaceError &) {
        thrown = true;
    }
    CHECK(thrown);
}

int main(int, char **) {
    test_capypdf_errors_are_surface_errors();
    test_cairo_output_is_stable();
    test_recording_setup();
    test_finished_surface_rejects_drawing();
    printf("All surface tests passed.\n");
    return 0;
}
