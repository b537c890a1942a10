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

#ifndef PREFLIGHT_DLL_HH
#define PREFLIGHT_DLL_HH

#define PREFLIGHT_MAJOR_VERSION 1
#define PREFLIGHT_MINOR_VERSION 0
#define PREFLIGHT_PATCH_VERSION 0
#define PREFLIGHT_VERSION "1.0.0"

/*
 * This file defines symbols that control which functions, classes,
 * and methods are exposed to the public ABI.
 *
 * Use PREFLIGHT_DLL_CLASS to export classes that are thrown, derived
 * from, or used with dynamic_cast across the library boundary,
 * PREFLIGHT_DLL to export functions and methods, and
 * PREFLIGHT_DLL_PRIVATE to hide private methods of exported classes.
 * The library is built with hidden visibility by default, so anything
 * not marked is not part of the ABI. libpreflight_EXPORTS is only
 * consulted for Windows builds.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libpreflight_EXPORTS
#  define PREFLIGHT_DLL __declspec(dllexport)
# else
#  define PREFLIGHT_DLL
# endif
# define PREFLIGHT_DLL_PRIVATE
#elif defined __GNUC__
# define PREFLIGHT_DLL __attribute__((visibility("default")))
# define PREFLIGHT_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define PREFLIGHT_DLL
# define PREFLIGHT_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define PREFLIGHT_DLL_CLASS PREFLIGHT_DLL
#else
# define PREFLIGHT_DLL_CLASS
#endif

#endif /* PREFLIGHT_DLL_HH */
