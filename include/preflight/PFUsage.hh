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

#ifndef PFUSAGE_HH
#define PFUSAGE_HH

#include <preflight/DLL.h>

#include <stdexcept>
#include <string>

// Thrown for command-line and job configuration errors. The message is
// suitable for showing to the user, followed by a pointer to --help.
class PREFLIGHT_DLL_CLASS PFUsage: public std::runtime_error
{
  public:
    PREFLIGHT_DLL
    PFUsage(std::string const& msg);
    ~PFUsage() noexcept override = default;
};

#endif // PFUSAGE_HH
