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

#ifndef OVERLAYMAPPER_HH
#define OVERLAYMAPPER_HH

#include <preflight/DLL.h>
#include <preflight/PageBox.hh>

#include <optional>

// Maps page boxes onto a rendered preview, for drawing trim, bleed and
// crop outlines over it. Screen coordinates have their origin at the
// top left of the bitmap and grow downward.
class OverlayMapper
{
  public:
    struct Rect
    {
        double x{0.0};
        double y{0.0};
        double width{0.0};
        double height{0.0};

        bool operator==(Rect const&) const = default;
    };

    struct Overlay
    {
        std::optional<Rect> trim;
        std::optional<Rect> bleed;
        std::optional<Rect> crop;
    };

    // scale is pixels per point; bitmap_height is in pixels.
    PREFLIGHT_DLL
    OverlayMapper(PageBox const& media_box, double scale, int bitmap_height);

    PREFLIGHT_DLL
    Rect map(PageBox const& box) const;

    // Rectangles for whichever of the page's boxes are present
    PREFLIGHT_DLL
    Overlay map(PageInfo const& page) const;

  private:
    PageBox media_box;
    double scale;
    int bitmap_height;
};

#endif // OVERLAYMAPPER_HH
