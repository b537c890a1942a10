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


#ifndef PAGEBOX_HH
#define PAGEBOX_HH

#include <preflight/DLL.h>
#include <qpdf/JSON.hh>

#include <optional>
#include <string>

// An axis-aligned rectangle in PDF points. x and y are the lower left
// corner; width and height are never negative.
struct PageBox
{
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};

    // Normalize the corners (x1, y1) and (x2, y2), given in any order.
    PREFLIGHT_DLL
    static PageBox fromCorners(double x1, double y1, double x2, double y2);

    double
    right() const
    {
        return x + width;
    }
    double
    top() const
    {
        return y + height;
    }

    bool operator==(PageBox const&) const = default;

    // [x, y, width, height]
    PREFLIGHT_DLL
    JSON getJSON() const;
};

// Geometry of one page as found by the structural pass.
struct PageInfo
{
    // 1-based
    int page_number{0};
    PageBox media_box;
    // Absent when the page doesn't define them
    std::optional<PageBox> trim_box;
    std::optional<PageBox> bleed_box;
    std::optional<PageBox> crop_box;
    // Taken from the MediaBox
    double width{0.0};
    double height{0.0};
    // Inherited /Rotate, normalized to 0, 90, 180 or 270
    int rotate{0};
    // Name of the matching standard paper size, or empty
    std::string paper_size;

    PREFLIGHT_DLL
    JSON getJSON() const;
};

#endif // PAGEBOX_HH
