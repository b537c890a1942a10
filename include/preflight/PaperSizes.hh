/* Copyright (c) 2024-2026 The preflight authors
 *
 * This file is part of preflight.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


#ifndef PAPERSIZES_HH
#define PAPERSIZES_HH

#include <preflight/DLL.h>

#include <string>
#include <vector>

struct PaperSize
{
    std::string name;
    std::string series;
    double width_mm;
    double height_mm;
};

// Named paper sizes: the ISO A, B and C series, RA and SRA press
// sheets, and the US classic and ANSI sizes. Sizes are defined in
// millimetres; US sizes defined in inches are converted at 25.4 mm to
// the inch.
class PaperSizes
{
  public:
    static double constexpr mm_per_inch = 25.4;
    static double constexpr points_per_inch = 72.0;

    // All sizes in table order
    PREFLIGHT_DLL
    static std::vector<PaperSize> const& all();

    // Look up a size by name, case-insensitively. Returns nullptr if
    // there is no such size.
    PREFLIGHT_DLL
    static PaperSize const* find(std::string const& name);

    // The first size matching width x height points in either
    // orientation, with each side within tolerance_mm. Returns nullptr
    // if nothing matches.
    PREFLIGHT_DLL
    static PaperSize const* match(double width_pt, double height_pt, double tolerance_mm = 1.0);

    // "210 x 297 mm", or in inches to two decimal places
    PREFLIGHT_DLL
    static std::string formatDimensions(PaperSize const&, bool inches = false);

    PREFLIGHT_DLL
    static double pointsToMm(double points);
};

#endif // PAPERSIZES_HH
