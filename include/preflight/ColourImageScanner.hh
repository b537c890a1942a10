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


#ifndef COLOURIMAGESCANNER_HH
#define COLOURIMAGESCANNER_HH

#include <preflight/DLL.h>
#include <preflight/PFContentProvider.hh>
#include <preflight/PreflightIssue.hh>

#include <set>
#include <string>
#include <vector>

// Counts images and collects colour space families from a page's
// operator list.
class ColourImageScanner
{
  public:
    struct PageScan
    {
        int image_count{0};
        // Colour space names without the slash
        std::set<std::string> colour_spaces;
    };

    PREFLIGHT_DLL
    static PageScan scan(std::vector<PFContentProvider::Operation> const& ops);

    // Colour issues are appended before the image issue.
    PREFLIGHT_DLL
    static void report(
        PageScan const& scan,
        int page_number,
        std::vector<PreflightIssue>& colour_issues,
        std::vector<PreflightIssue>& image_issues);

    // DeviceRGB, CalRGB, RGB
    PREFLIGHT_DLL
    static bool isRGBFamily(std::string const& name);
    // DeviceCMYK, CMYK
    PREFLIGHT_DLL
    static bool isCMYKFamily(std::string const& name);
};

#endif // COLOURIMAGESCANNER_HH
