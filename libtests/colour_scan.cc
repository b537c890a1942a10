#include <preflight/assert_test.h>

#include <preflight/ColourImageScanner.hh>

#include <iostream>

typedef PFContentProvider P;

static P::Operation
op(P::opcode_e opcode, std::string const& name = "", std::vector<QPDFObjectHandle> args = {})
{
    P::Operation result;
    result.opcode = opcode;
    result.op = name;
    result.args = args;
    return result;
}

static void
show(std::vector<PreflightIssue> const& issues)
{
    for (auto const& issue: issues) {
        std::cout << issue.unparse() << std::endl;
    }
}

static void
test_scan()
{
    auto scan = ColourImageScanner::scan({
        op(P::op_set_fill_rgb, "rg"),
        op(P::op_other, "re"),
        op(P::op_paint_image, "Do"),
        op(P::op_paint_image_mask, "Do"),
        op(P::op_paint_inline_image, "EI"),
        op(P::op_set_stroke_colour_space, "CS", {QPDFObjectHandle::newName("/Separation")}),
        op(P::op_set_fill_colour_space, "cs", {QPDFObjectHandle::newInteger(1)}),
        op(P::op_set_stroke_gray, "G"),
    });
    assert(scan.image_count == 3);
    assert((scan.colour_spaces == std::set<std::string>{"DeviceGray", "DeviceRGB", "Separation"}));
}

static void
test_report()
{
    std::vector<PreflightIssue> colour;
    std::vector<PreflightIssue> images;

    // Nothing notable
    ColourImageScanner::report(
        ColourImageScanner::scan({op(P::op_set_fill_cmyk, "k"), op(P::op_set_fill_gray, "g")}),
        1,
        colour,
        images);
    assert(colour.empty() && images.empty());

    ColourImageScanner::report(
        ColourImageScanner::scan(
            {op(P::op_set_fill_colour_space, "cs", {QPDFObjectHandle::newName("/CalRGB")}),
             op(P::op_paint_image, "Do")}),
        2,
        colour,
        images);
    show(colour);
    show(images);
    assert(colour.size() == 1);
    assert(colour.at(0).getSeverity() == pf_sev_warning);
    assert(colour.at(0).getCategory() == pf_cat_colour);
    assert(colour.at(0).getPage() == 2);
    assert(colour.at(0).getDetails() == "CalRGB");
    assert(images.size() == 1);
    assert(images.at(0).getMessage() == "1 image placed on this page");
    assert(images.at(0).getSeverity() == pf_sev_info);

    colour.clear();
    images.clear();
    ColourImageScanner::report(
        ColourImageScanner::scan(
            {op(P::op_set_fill_rgb, "rg"),
             op(P::op_set_stroke_colour_space, "CS", {QPDFObjectHandle::newName("/CMYK")}),
             op(P::op_paint_inline_image, "EI"),
             op(P::op_paint_image, "Do")}),
        3,
        colour,
        images);
    show(colour);
    assert(colour.size() == 2);
    assert(colour.at(0).getMessage().starts_with("RGB colour detected"));
    assert(colour.at(1).getMessage() == "Mixed RGB and CMYK colour spaces on the same page");
    assert(colour.at(1).getDetails() == "CMYK, DeviceRGB");
    assert(images.at(0).getMessage() == "2 images placed on this page");
}

static void
test_families()
{
    assert(ColourImageScanner::isRGBFamily("RGB"));
    assert(ColourImageScanner::isRGBFamily("DeviceRGB"));
    assert(!ColourImageScanner::isRGBFamily("DeviceCMYK"));
    assert(ColourImageScanner::isCMYKFamily("CMYK"));
    assert(!ColourImageScanner::isCMYKFamily("Gray"));
}

int
main()
{
    test_scan();
    test_report();
    test_families();
    std::cout << "colour scan tests passed" << std::endl;
    return 0;
}
