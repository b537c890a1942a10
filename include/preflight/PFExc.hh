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

#ifndef PFEXC_HH
#define PFEXC_HH

#include <preflight/Constants.h>
#include <preflight/DLL.h>

#include <exception>
#include <stdexcept>
#include <string>

// A classified failure of the analysis. what() is "file: message",
// or "file (where): message" when the failure has a location such as
// an object or a page.
//
// The error code is how callers tell failures apart:
// pf_e_damaged_pdf is a document that can't be parsed, pf_e_password
// an encrypted document that can't be opened, pf_e_content a page
// whose content can't be analysed, and pf_e_analysis any other fault
// during analysis.
class PREFLIGHT_DLL_CLASS PFExc: public std::runtime_error
{
  public:
    PREFLIGHT_DLL
    PFExc(
        pf_error_code_e error_code,
        std::string const& filename,
        std::string const& where,
        std::string const& message);
    PREFLIGHT_DLL
    PFExc(pf_error_code_e error_code, std::string const& message);
    ~PFExc() noexcept override = default;

    // Classify an exception thrown while working on filename. qpdf's
    // QPDFExc keeps its classification; anything else gets
    // error_code.
    PREFLIGHT_DLL
    static PFExc fromException(
        std::exception const& e, std::string const& filename, pf_error_code_e error_code);

    PREFLIGHT_DLL
    pf_error_code_e getErrorCode() const;
    PREFLIGHT_DLL
    std::string const& getFilename() const;
    PREFLIGHT_DLL
    std::string const& getWhere() const;
    PREFLIGHT_DLL
    std::string const& getMessageDetail() const;

    // "ParseError", "EncryptedUnreadable", ...
    PREFLIGHT_DLL
    static char const* errorName(pf_error_code_e);

  private:
    PREFLIGHT_DLL_PRIVATE
    static std::string
    createWhat(std::string const& filename, std::string const& where, std::string const& message);

    pf_error_code_e error_code;
    std::string filename;
    std::string where;
    std::string message;
};

#endif // PFEXC_HH
