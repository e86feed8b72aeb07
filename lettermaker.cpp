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
#include <capypdfsurface.hpp>
#include <hbfontcache.hpp>
#include <hbmeasurer.hpp>
#include <letterjson.hpp>
#include <letterpaginator.hpp>
#include <recordingsurface.hpp>

#include <cstdio>
#include <cstring>

namespace {

void write_output(const std::filesystem::path &ofname, const std::vector<uint8_t> &bytes) {
    FILE *f = fopen(ofname.string().c_str(), "wb");
    if(!f) {
        throw SurfaceError("Could not open " + ofname.string() + " for writing.");
    }
    const auto written = fwrite(bytes.data(), 1, bytes.size(), f);
    const auto rc = fclose(f);
    if(written != bytes.size() || rc != 0) {
        throw SurfaceError("Could not write " + ofname.string() + ".");
    }
}

int generate_letter(const char *defname, bool dump) {
    const auto def = load_letter_json(defname);
    HBFontCache fc(def.font_files);
    HBMeasurer meas(fc);
    LetterPaginator paginator(def.config, meas);

    const int total_pages = paginator.simulate(def.request);
    if(dump) {
        const auto letter = paginator.render(def.request, total_pages, recording_surface_factory());
        fwrite(letter.bytes.data(), 1, letter.bytes.size(), stdout);
        return 0;
    }

    const SurfaceFactory factory = def.backend == Backend::Cairo ? cairo_surface_factory()
                                                                 : capypdf_surface_factory(fc);
    const auto letter = paginator.render(def.request, total_pages, factory);
    write_output(def.output, letter.bytes);
    printf("Generated %d page(s) for %s in %s.\n",
           letter.num_pages,
           def.request.recipient.name.c_str(),
           def.output.string().c_str());
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    bool dump = false;
    const char *defname = nullptr;
    if(argc == 2) {
        defname = argv[1];
    } else if(argc == 3 && strcmp(argv[1], "--dump") == 0) {
        dump = true;
        defname = argv[2];
    } else {
        printf("%s [--dump] <letter.json>\n", argv[0]);
        return 1;
    }
    try {
        return generate_letter(defname, dump);
    } catch(const ConfigurationError &e) {
        fprintf(stderr, "Invalid letter definition: %s\n", e.what());
    } catch(const UnrenderableContentError &e) {
        fprintf(stderr,
                "Can not lay out paragraph %d: %s\n",
                int(e.paragraph_index + 1),
                e.what());
    } catch(const FontError &e) {
        fprintf(stderr, "Font error: %s\n", e.what());
    } catch(const SurfaceError &e) {
        fprintf(stderr, "Output error: %s\n", e.what());
    }
    return 1;
}
