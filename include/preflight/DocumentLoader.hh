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

#ifndef DOCUMENTLOADER_HH
#define DOCUMENTLOADER_HH

#include <preflight/DLL.h>

#include <qpdf/PDFVersion.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>

#include <memory>
#include <string>

// Opens PDF files held in memory with qpdf. Damage that qpdf can
// recover from is recorded as QPDF warnings; anything else is raised
// as a PFExc with pf_e_damaged_pdf, or pf_e_password when the file is
// encrypted and neither the empty password nor the one given opens
// it.
namespace DocumentLoader
{
    PREFLIGHT_DLL
    std::shared_ptr<QPDF> load(
        std::string const& data,
        std::string const& file_name,
        std::string const& password = "",
        std::shared_ptr<QPDFLogger> log = nullptr);

    // The document's version: the header version, or the catalog's
    // /Version if that is later.
    PREFLIGHT_DLL
    PDFVersion getVersion(QPDF&);

    // "1.4". A non-zero extension level is appended as "1.7 (extension
    // level 3)".
    PREFLIGHT_DLL
    std::string unparseVersion(PDFVersion const&);

    // Parse "M.m". Anything that isn't a version gives 1.0.
    PREFLIGHT_DLL
    PDFVersion parseVersion(std::string const&);
}; // namespace DocumentLoader

#endif // DOCUMENTLOADER_HH
