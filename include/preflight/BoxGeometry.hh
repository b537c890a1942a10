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


#ifndef BOXGEOMETRY_HH
#define BOXGEOMETRY_HH

#include <preflight/DLL.h>
#include <preflight/PageBox.hh>
#include <preflight/PreflightIssue.hh>

#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <variant>
#include <vector>

// Turns the raw box arrays of a page (/MediaBox, /TrimBox, /BleedBox,
// /CropBox) into PageBox values and checks trim and bleed geometry.
class BoxGeometry
{
  public:
    static double constexpr letter_width = 612.0;
    static double constexpr letter_height = 792.0;
    static double constexpr mm_per_point = 0.352778;
    static double constexpr default_bleed_threshold = 8.5;
    static double constexpr default_size_tolerance = 1.0;

    // An entry of a box array: a number, an indirect object that is
    // not a number, or anything else.
    typedef std::variant<double, QPDFObjGen, std::monostate> BoxValue;

    // The entries of box, which is normally an array. Anything else
    // gives no entries.
    PREFLIGHT_DLL
    static std::vector<BoxValue> readBoxValues(QPDFObjectHandle box);

    // Normalize the first four entries into a box. Entries that are
    // not numbers count as 0. With fewer than four entries, fallback
    // is returned.
    PREFLIGHT_DLL
    static PageBox normalize(std::vector<BoxValue> const& values, PageBox const& fallback);

    // US Letter at the origin
    PREFLIGHT_DLL
    static PageBox letter();

    // Geometry of a page, with /MediaBox, /CropBox and /Rotate
    // inherited from the page tree. A missing or short MediaBox gives
    // US Letter; a short TrimBox, BleedBox or CropBox gives the
    // MediaBox.
    PREFLIGHT_DLL
    static PageInfo resolvePage(QPDFPageObjectHelper page, int page_number);

    // The smallest distance by which bleed extends past trim on any
    // side. Negative if bleed is inside trim on some side.
    PREFLIGHT_DLL
    static double bleedMargin(PageBox const& trim, PageBox const& bleed);

    // Append geometry issues for page. first_page is the geometry of
    // page 1, against which page sizes are compared.
    PREFLIGHT_DLL
    static void checkPage(
        PageInfo const& page,
        PageInfo const& first_page,
        double bleed_threshold,
        double size_tolerance,
        std::vector<PreflightIssue>& issues);
};

#endif // BOXGEOMETRY_HH
