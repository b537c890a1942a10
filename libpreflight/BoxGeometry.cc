#include <preflight/BoxGeometry.hh>

#include <preflight/PaperSizes.hh>

#include <qpdf/QUtil.hh>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace
{
    std::string
    points(double value)
    {
        return QUtil::double_to_string(value, 2);
    }

    std::string
    millimetres(double value)
    {
        return QUtil::double_to_string(value * BoxGeometry::mm_per_point, 1);
    }

    std::string
    size_string(double width, double height)
    {
        return points(width) + " x " + points(height) + " pt";
    }
} // namespace

std::vector<BoxGeometry::BoxValue>
BoxGeometry::readBoxValues(QPDFObjectHandle box)
{
    std::vector<BoxValue> result;
    if (!box.isArray()) {
        return result;
    }
    for (auto item: box.getArrayAsVector()) {
        if (item.isNumber()) {
            result.emplace_back(item.getNumericValue());
        } else if (item.isIndirect()) {
            result.emplace_back(item.getObjGen());
        } else {
            result.emplace_back(std::monostate());
        }
    }
    return result;
}

PageBox
BoxGeometry::normalize(std::vector<BoxValue> const& values, PageBox const& fallback)
{
    if (values.size() < 4) {
        return fallback;
    }
    double n[4];
    for (size_t i = 0; i < 4; ++i) {
        n[i] = std::visit(
            [](auto const& v) -> double {
                if constexpr (std::is_same_v<std::decay_t<decltype(v)>, double>) {
                    return std::isfinite(v) ? v : 0.0;
                } else {
                    return 0.0;
                }
            },
            values.at(i));
    }
    return PageBox::fromCorners(n[0], n[1], n[2], n[3]);
}

PageBox
BoxGeometry::letter()
{
    return {0.0, 0.0, letter_width, letter_height};
}

PageInfo
BoxGeometry::resolvePage(QPDFPageObjectHelper page, int page_number)
{
    PageInfo info;
    info.page_number = page_number;
    info.media_box = normalize(readBoxValues(page.getAttribute("/MediaBox", false)), letter());
    info.width = info.media_box.width;
    info.height = info.media_box.height;

    // getTrimBox and getBleedBox fall back to other boxes, so read
    // the entries directly to see whether the page has them.
    auto optional_box = [&](char const* key) -> std::optional<PageBox> {
        auto box = page.getAttribute(key, false);
        if (box.isNull()) {
            return std::nullopt;
        }
        return normalize(readBoxValues(box), info.media_box);
    };
    info.trim_box = optional_box("/TrimBox");
    info.bleed_box = optional_box("/BleedBox");
    info.crop_box = optional_box("/CropBox");

    auto rotate = page.getAttribute("/Rotate", false);
    if (rotate.isInteger()) {
        int r = static_cast<int>(rotate.getIntValue() % 360);
        if (r < 0) {
            r += 360;
        }
        info.rotate = (r % 90 == 0) ? r : 0;
    }

    // The finished size is what gets matched to a paper size.
    PageBox const& finished = info.trim_box ? *info.trim_box : info.media_box;
    if (auto size = PaperSizes::match(finished.width, finished.height)) {
        info.paper_size = size->name;
    }
    return info;
}

double
BoxGeometry::bleedMargin(PageBox const& trim, PageBox const& bleed)
{
    return std::min(
        {trim.x - bleed.x, trim.y - bleed.y, bleed.right() - trim.right(), bleed.top() - trim.top()});
}

void
BoxGeometry::checkPage(
    PageInfo const& page,
    PageInfo const& first_page,
    double bleed_threshold,
    double size_tolerance,
    std::vector<PreflightIssue>& issues)
{
    int pageno = page.page_number;
    if (page.trim_box && page.bleed_box) {
        auto const& trim = *page.trim_box;
        auto const& bleed = *page.bleed_box;
        double margin = bleedMargin(trim, bleed);
        if (margin < bleed_threshold) {
            issues.emplace_back(
                pf_sev_warning,
                pf_cat_geometry,
                "Bleed margin is " + points(margin) + "pt (" + millimetres(margin) +
                    "mm), below the recommended " + points(bleed_threshold) + "pt (" +
                    millimetres(bleed_threshold) + "mm)",
                pageno,
                "left " + points(trim.x - bleed.x) + ", bottom " + points(trim.y - bleed.y) +
                    ", right " + points(bleed.right() - trim.right()) + ", top " +
                    points(bleed.top() - trim.top()));
        }
    }
    if (!page.bleed_box) {
        issues.emplace_back(
            pf_sev_warning,
            pf_cat_geometry,
            "No BleedBox defined; artwork may not extend past the trim edge",
            pageno);
    }
    if (!page.trim_box) {
        issues.emplace_back(
            pf_sev_info,
            pf_cat_geometry,
            "No TrimBox defined; the MediaBox is used as the trim size",
            pageno);
    }
    if (pageno != first_page.page_number &&
        (std::fabs(page.width - first_page.width) > size_tolerance ||
         std::fabs(page.height - first_page.height) > size_tolerance)) {
        issues.emplace_back(
            pf_sev_warning,
            pf_cat_geometry,
            "Page size " + size_string(page.width, page.height) + " differs from page " +
                std::to_string(first_page.page_number) + " (" +
                size_string(first_page.width, first_page.height) + ")",
            pageno);
    }
}
