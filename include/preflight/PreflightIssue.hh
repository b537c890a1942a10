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


#ifndef PREFLIGHTISSUE_HH
#define PREFLIGHTISSUE_HH

#include <preflight/Constants.h>
#include <preflight/DLL.h>
#include <qpdf/JSON.hh>

#include <optional>
#include <string>

// One finding of the analysis. Issues are values: once created they
// are never changed, merged or deduplicated.
class PreflightIssue
{
  public:
    // page is 1-based; document-level issues have no page.
    PREFLIGHT_DLL
    PreflightIssue(
        pf_severity_e severity,
        pf_category_e category,
        std::string const& message,
        std::optional<int> page = std::nullopt,
        std::optional<std::string> details = std::nullopt);

    PREFLIGHT_DLL
    pf_severity_e getSeverity() const;
    PREFLIGHT_DLL
    pf_category_e getCategory() const;
    PREFLIGHT_DLL
    std::string const& getMessage() const;
    PREFLIGHT_DLL
    std::optional<int> getPage() const;
    PREFLIGHT_DLL
    std::optional<std::string> const& getDetails() const;

    // "error", "warning", "info"
    PREFLIGHT_DLL
    static char const* severityName(pf_severity_e);
    // "document", "geometry", "fonts", "colour", "images",
    // "transparency"
    PREFLIGHT_DLL
    static char const* categoryName(pf_category_e);

    // One line of text, for example
    // "error [fonts] page 2: Font "Foo" is not embedded"
    PREFLIGHT_DLL
    std::string unparse() const;

    PREFLIGHT_DLL
    JSON getJSON() const;

  private:
    pf_severity_e severity;
    pf_category_e category;
    std::string message;
    std::optional<int> page;
    std::optional<std::string> details;
};

#endif // PREFLIGHTISSUE_HH
