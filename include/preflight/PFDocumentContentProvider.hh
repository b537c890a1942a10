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


#ifndef PFDOCUMENTCONTENTPROVIDER_HH
#define PFDOCUMENTCONTENTPROVIDER_HH

#include <preflight/PFContentProvider.hh>

// Content provider that parses page content streams with qpdf. Named
// colour spaces are looked up in the page resources.
//
// This provider does not rasterize. render returns an all-white RGB
// bitmap with the page's scaled MediaBox size, which is enough for
// OverlayMapper. Callers that need the page's pixels supply their own
// provider.
class PREFLIGHT_DLL_CLASS PFDocumentContentProvider: public PFContentProvider
{
  public:
    // Form XObjects nested deeper than max_form_depth are not
    // expanded.
    PREFLIGHT_DLL
    PFDocumentContentProvider(int max_form_depth = 8);
    PREFLIGHT_DLL
    ~PFDocumentContentProvider() override = default;

    PREFLIGHT_DLL
    std::unique_ptr<Session> openSession(std::shared_ptr<QPDF> qpdf) override;

    // Largest preview, in pixels on a side
    static int constexpr max_render_size = 10000;

  private:
    int max_form_depth;
};

#endif // PFDOCUMENTCONTENTPROVIDER_HH
