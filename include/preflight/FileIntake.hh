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


#ifndef FILEINTAKE_HH
#define FILEINTAKE_HH

#include <preflight/DLL.h>

#include <string>

// Checks done on a file before it is handed to the analysis: that it
// claims to be a PDF and starts like one.
class FileIntake
{
  public:
    static constexpr char const* pdf_mime_type = "application/pdf";

    // Returns true if the file may be analysed. Otherwise message is
    // set to a message for the user. mime_type is ignored if empty.
    PREFLIGHT_DLL
    static bool validate(
        std::string const& name,
        std::string const& data,
        std::string const& mime_type,
        std::string& message);

    // Read a whole file. Throws PFExc with pf_e_system and a message
    // for the user on failure.
    PREFLIGHT_DLL
    static std::string readFile(std::string const& filename);

    // "512 B", "1.5 KB", "2.0 MB"
    PREFLIGHT_DLL
    static std::string formatSize(size_t bytes);
};

#endif // FILEINTAKE_HH
