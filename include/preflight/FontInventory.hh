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


#ifndef FONTINVENTORY_HH
#define FONTINVENTORY_HH

#include <preflight/DLL.h>
#include <preflight/PreflightIssue.hh>

#include <qpdf/JSON.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <set>
#include <string>
#include <utility>
#include <vector>

struct FontInfo
{
    // /BaseFont with any subset tag removed
    std::string name;
    // /Subtype without the slash, e.g. "Type1" or "Type0"
    std::string subtype;
    bool embedded{false};
    // Page on which the font was first seen
    int first_page{0};

    PREFLIGHT_DLL
    JSON getJSON() const;
};

// Collects the fonts used by a document's pages, one entry per
// distinct (name, subtype), and reports fonts that are not embedded.
class FontInventory
{
  public:
    PREFLIGHT_DLL
    FontInventory(int max_form_depth = 8);

    // Inventory the fonts in a page's resource dictionary and in the
    // resources of Form XObjects it uses. Issues for fonts not seen on
    // an earlier page are appended to issues.
    PREFLIGHT_DLL
    void addPage(int page_number, QPDFObjectHandle resources, std::vector<PreflightIssue>& issues);

    // Fonts in order of first appearance
    PREFLIGHT_DLL
    std::vector<FontInfo> const& getFonts() const;

    // Remove a subset tag: six capital letters followed by "+".
    // "ABCDEF+" gives the empty string.
    PREFLIGHT_DLL
    static std::string stripSubsetPrefix(std::string const& name);

    // Whether name is one of the 14 standard Type 1 fonts
    PREFLIGHT_DLL
    static bool isStandard14(std::string const& name);

    // Whether font counts as embedded: its descriptor has a font
    // file, it is a standard font, or it is a Type0 font with a
    // descendant whose descriptor has a font file.
    PREFLIGHT_DLL
    static bool isEmbedded(QPDFObjectHandle font, std::string const& clean_name);

  private:
    void addResources(
        int page_number,
        QPDFObjectHandle resources,
        int depth,
        QPDFObjGen::set& visited,
        std::vector<PreflightIssue>& issues);
    void addFont(
        int page_number,
        std::string const& key,
        QPDFObjectHandle font,
        std::vector<PreflightIssue>& issues);
    static bool hasFontFile(QPDFObjectHandle font);

    int max_form_depth;
    std::vector<FontInfo> fonts;
    std::set<std::pair<std::string, std::string>> seen;
};

#endif // FONTINVENTORY_HH
