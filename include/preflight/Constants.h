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

#ifndef PREFLIGHT_CONSTANTS_H
#define PREFLIGHT_CONSTANTS_H

/*
 * REMEMBER:
 *
 * Keep this file 'C' compatible so it can be used from C callers and
 * from foreign function interfaces. New values must be added at the
 * end of each enumeration so that no existing value changes.
 */

/* Exit codes from PreflightJob and the pdfpreflight CLI */

enum pf_exit_code_e {
    pf_exit_success = 0,
    /* Normal exit codes */
    pf_exit_error = 2,
    pf_exit_warning = 3,
};

enum pf_error_code_e {
    pf_e_success = 0,
    pf_e_internal,    /* logic/programming error -- indicates bug */
    pf_e_system,      /* I/O error, memory error, etc. */
    pf_e_unsupported, /* input preflight does not accept */
    pf_e_damaged_pdf, /* the input is not a readable PDF (ParseError) */
    pf_e_password,    /* the security handler prevents reading */
    pf_e_content,     /* content stream analysis is not available */
    pf_e_analysis,    /* unexpected fault while scanning */
};

/* Issue taxonomy */

enum pf_severity_e {
    pf_sev_error = 0,
    pf_sev_warning,
    pf_sev_info,
};

enum pf_category_e {
    pf_cat_document = 0,
    pf_cat_geometry,
    pf_cat_fonts,
    pf_cat_colour,
    pf_cat_images,
    pf_cat_transparency,
};

#endif /* PREFLIGHT_CONSTANTS_H */
