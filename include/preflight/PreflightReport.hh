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


#ifndef PREFLIGHTREPORT_HH
#define PREFLIGHTREPORT_HH

#include <preflight/DLL.h>
#include <preflight/FontInventory.hh>
#include <preflight/PageBox.hh>
#include <preflight/PreflightIssue.hh>

#include <qpdf/JSON.hh>
#include <qpdf/PDFVersion.hh>

#include <string>
#include <vector>

class Pipeline;
class ReportAggregator;

// Result of a completed analysis. Reports are built by
// ReportAggregator and read-only afterwards.
class PreflightReport
{
  public:
    PREFLIGHT_DLL
    PreflightReport() = default;

    PREFLIGHT_DLL
    std::string const& getFileName() const;
    PREFLIGHT_DLL
    size_t getFileSize() const;
    PREFLIGHT_DLL
    PDFVersion getVersion() const;
    PREFLIGHT_DLL
    int getPageCount() const;
    PREFLIGHT_DLL
    bool isEncrypted() const;
    // True if the content phase failed and only structural checks
    // were done
    PREFLIGHT_DLL
    bool isDegraded() const;
    PREFLIGHT_DLL
    std::vector<PageInfo> const& getPages() const;
    PREFLIGHT_DLL
    std::vector<FontInfo> const& getFonts() const;
    PREFLIGHT_DLL
    std::vector<PreflightIssue> const& getIssues() const;

    // Ready for print: no issue has error severity.
    PREFLIGHT_DLL
    bool passes() const;
    PREFLIGHT_DLL
    size_t countIssues(pf_severity_e severity) const;

    // The whole report. Keys are sorted and nothing depends on the
    // time or environment, so identical input gives identical output.
    PREFLIGHT_DLL
    JSON getJSON() const;

    // Human-readable report
    PREFLIGHT_DLL
    void writeText(Pipeline* p, bool verbose = false) const;

  private:
    friend class ReportAggregator;

    std::string file_name;
    size_t file_size{0};
    PDFVersion version;
    int page_count{0};
    bool encrypted{false};
    bool degraded{false};
    std::vector<PageInfo> pages;
    std::vector<FontInfo> fonts;
    std::vector<PreflightIssue> issues;
};

#endif // PREFLIGHTREPORT_HH
