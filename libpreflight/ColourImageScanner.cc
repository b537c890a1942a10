#include <preflight/ColourImageScanner.hh>

#include <algorithm>

bool
ColourImageScanner::isRGBFamily(std::string const& name)
{
    return name == "DeviceRGB" || name == "CalRGB" || name == "RGB";
}

bool
ColourImageScanner::isCMYKFamily(std::string const& name)
{
    return name == "DeviceCMYK" || name == "CMYK";
}

ColourImageScanner::PageScan
ColourImageScanner::scan(std::vector<PFContentProvider::Operation> const& ops)
{
    PageScan result;
    for (auto const& op: ops) {
        switch (op.opcode) {
        case PFContentProvider::op_paint_image:
        case PFContentProvider::op_paint_image_mask:
        case PFContentProvider::op_paint_inline_image:
            ++result.image_count;
            break;

        case PFContentProvider::op_set_fill_colour_space:
        case PFContentProvider::op_set_stroke_colour_space:
            if (!op.args.empty()) {
                auto family = op.args.at(0);
                if (family.isName()) {
                    result.colour_spaces.insert(family.getName().substr(1));
                }
            }
            break;

        case PFContentProvider::op_set_fill_gray:
        case PFContentProvider::op_set_stroke_gray:
            result.colour_spaces.insert("DeviceGray");
            break;

        case PFContentProvider::op_set_fill_rgb:
        case PFContentProvider::op_set_stroke_rgb:
            result.colour_spaces.insert("DeviceRGB");
            break;

        case PFContentProvider::op_set_fill_cmyk:
        case PFContentProvider::op_set_stroke_cmyk:
            result.colour_spaces.insert("DeviceCMYK");
            break;

        default:
            break;
        }
    }
    return result;
}

void
ColourImageScanner::report(
    PageScan const& scan,
    int page_number,
    std::vector<PreflightIssue>& colour_issues,
    std::vector<PreflightIssue>& image_issues)
{
    auto const& spaces = scan.colour_spaces;
    bool rgb = std::any_of(spaces.begin(), spaces.end(), isRGBFamily);
    bool cmyk = std::any_of(spaces.begin(), spaces.end(), isCMYKFamily);
    std::string names;
    for (auto const& s: spaces) {
        names += (names.empty() ? "" : ", ") + s;
    }
    if (rgb) {
        colour_issues.emplace_back(
            pf_sev_warning,
            pf_cat_colour,
            "RGB colour detected; colours may shift under CMYK conversion",
            page_number,
            names);
    }
    if (rgb && cmyk) {
        colour_issues.emplace_back(
            pf_sev_warning,
            pf_cat_colour,
            "Mixed RGB and CMYK colour spaces on the same page",
            page_number,
            names);
    }
    if (scan.image_count > 0) {
        image_issues.emplace_back(
            pf_sev_info,
            pf_cat_images,
            std::to_string(scan.image_count) +
                (scan.image_count == 1 ? " image placed on this page"
                                       : " images placed on this page"),
            page_number);
    }
}
