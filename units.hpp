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

#include <compare>

// Letters are specified in inches and drawn in PostScript points.
constexpr double points_per_inch = 72.0;
constexpr double mm_per_inch = 25.4;

class Length {
private:
    explicit Length(double points) : v_pt(points) {}

public:
    double v_pt = 0.0;

    static Length from_pt(double val) { return Length(val); }
    static Length from_in(double val) { return Length(val * points_per_inch); }
    static Length from_mm(double val) { return Length(val / mm_per_inch * points_per_inch); }

    static Length zero() { return Length{0.0}; }

    Length() = default;

    Length operator-() const { return Length{-v_pt}; }

    Length &operator+=(const Length &o) {
        v_pt += o.v_pt;
        return *this;
    }

    Length &operator-=(const Length &o) {
        v_pt -= o.v_pt;
        return *this;
    }

    Length operator+(const Length &o) const { return Length{v_pt + o.v_pt}; }
    Length operator-(const Length &o) const { return Length{v_pt - o.v_pt}; }
    Length operator*(const double o) const { return Length{v_pt * o}; }
    Length operator/(const double o) const { return Length{v_pt / o}; }
    double operator/(const Length &o) const { return v_pt / o.v_pt; }

    std::partial_ordering operator<=>(const Length &o) const { return v_pt <=> o.v_pt; }
    bool operator==(const Length &o) const { return v_pt == o.v_pt; }

    double pt() const { return v_pt; }
    double in() const { return v_pt / points_per_inch; }
    double mm() const { return in() * mm_per_inch; }
};

inline Length operator*(const double d, const Length l) { return l * d; }
