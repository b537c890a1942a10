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


#ifndef PFCONTENTPROVIDER_HH
#define PFCONTENTPROVIDER_HH

#include <preflight/DLL.h>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <memory>
#include <string>
#include <vector>

// Source of decoded page content for the content phase of the
// analysis: the operators painted on each page and a raster preview.
// A provider opens one session per analysis run. Sessions may hold
// large resources and are released as soon as the run ends.
class PREFLIGHT_DLL_CLASS PFContentProvider
{
  public:
    enum opcode_e {
        op_other = 0,
        // Do with an image XObject
        op_paint_image,
        // Do with an image XObject that has /ImageMask true
        op_paint_image_mask,
        // BI ... ID ... EI; args are the image dictionary and data
        op_paint_inline_image,
        // cs and CS; the argument is the name of the colour space
        // family, e.g. /DeviceRGB, /CalRGB, /RGB for an ICC profile
        // with three components, /Indexed resolved to its base
        op_set_fill_colour_space,
        op_set_stroke_colour_space,
        // g, G, rg, RG, k and K, which select a device colour space
        op_set_fill_gray,
        op_set_stroke_gray,
        op_set_fill_rgb,
        op_set_stroke_rgb,
        op_set_fill_cmyk,
        op_set_stroke_cmyk,
        // Surround the operators of a Form XObject painted with Do
        op_paint_form_begin,
        op_paint_form_end,
    };

    struct Operation
    {
        opcode_e opcode{op_other};
        // Operator as it appears in the content stream
        std::string op;
        std::vector<QPDFObjectHandle> args;
    };

    // An RGB raster, 3 bytes per pixel, rows top to bottom
    struct Bitmap
    {
        int width{0};
        int height{0};
        std::string pixels;
    };

    class PREFLIGHT_DLL_CLASS Session
    {
      public:
        PREFLIGHT_DLL
        virtual ~Session() = default;

        // Operators of a page, 1-based, with Form XObjects expanded.
        // Throws PFExc with pf_e_content if the page's content can't
        // be decoded.
        virtual std::vector<Operation> getOperatorList(int page_number) = 0;

        // Produce a preview of a page at scale pixels per point. What
        // the bitmap shows depends on the provider; see
        // PFDocumentContentProvider for the built-in one.
        virtual Bitmap render(int page_number, double scale) = 0;

        // Free resources. No other methods may be called afterwards.
        // Calling release more than once is harmless.
        virtual void release() = 0;

        virtual bool isReleased() const = 0;
    };

    PREFLIGHT_DLL
    virtual ~PFContentProvider() = default;

    virtual std::unique_ptr<Session> openSession(std::shared_ptr<QPDF> qpdf) = 0;
};

#endif // PFCONTENTPROVIDER_HH
