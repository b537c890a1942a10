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


#ifndef TRANSPARENCYDETECTOR_HH
#define TRANSPARENCYDETECTOR_HH

#include <preflight/DLL.h>
#include <preflight/PreflightIssue.hh>

#include <qpdf/PDFVersion.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <string>
#include <vector>

// Finds transparency in a page's group and graphics state resources.
// Transparency is an error in documents older than PDF 1.4, which
// can't represent it, and informational otherwise.
class TransparencyDetector
{
  public:
    // 1.4
    PREFLIGHT_DLL
    static PDFVersion minimumVersion();

    // /Resources is inherited from the page tree.
    PREFLIGHT_DLL
    static void checkPage(
        QPDFPageObjectHelper page,
        int page_number,
        PDFVersion const& version,
        std::vector<PreflightIssue>& issues);

    // Whether an ExtGState dictionary sets a constant alpha below 1 or
    // a soft mask other than /None. If so, describe what was found in
    // details.
    PREFLIGHT_DLL
    static bool usesTransparency(QPDFObjectHandle gs, std::string& details);
};

#endif // TRANSPARENCYDETECTOR_HH
