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


#ifndef REPORTAGGREGATOR_HH
#define REPORTAGGREGATOR_HH

#include <preflight/DLL.h>
#include <preflight/PreflightReport.hh>

#include <map>
#include <optional>
#include <string>
#include <vector>

// Collects the findings of the analysis phases and assembles them into
// a PreflightReport. Findings may arrive in any order; the report
// always lists page issues by page, and within a page in the order
// geometry, fonts, transparency, colour, images. Document-level
// checks follow the page issues.
class ReportAggregator
{
  public:
    PREFLIGHT_DLL
    ReportAggregator(std::string const& file_name, size_t file_size);

    // recovered_problems is the number of problems the loader worked
    // around while reading the file.
    PREFLIGHT_DLL
    void setDocumentInfo(PDFVersion const& version, bool encrypted, size_t recovered_problems);

    PREFLIGHT_DLL
    void addPage(PageInfo const& info);
    PREFLIGHT_DLL
    void setFonts(std::vector<FontInfo> const& fonts);

    // Issues must all have a page.
    PREFLIGHT_DLL
    void addPageIssues(std::vector<PreflightIssue> const& issues);

    // Record that the content phase failed. The report is still
    // produced, with a warning giving reason.
    PREFLIGHT_DLL
    void setContentUnavailable(std::string const& reason);

    PREFLIGHT_DLL
    PreflightReport assemble() const;

    // Position of a category within a page's issues
    PREFLIGHT_DLL
    static int categoryRank(pf_category_e);

  private:
    PreflightReport report;
    size_t recovered_problems{0};
    std::map<int, std::vector<PreflightIssue>> page_issues;
    std::optional<std::string> content_unavailable;
};

#endif // REPORTAGGREGATOR_HH
