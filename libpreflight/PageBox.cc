#include <preflight/PageBox.hh>

#include <algorithm>
#include <cmath>

PageBox
PageBox::fromCorners(double x1, double y1, double x2, double y2)
{
    return {std::min(x1, x2), std::min(y1, y2), std::fabs(x2 - x1), std::fabs(y2 - y1)};
}

JSON
PageBox::getJSON() const
{
    auto j = JSON::makeArray();
    j.addArrayElement(JSON::makeReal(x));
    j.addArrayElement(JSON::makeReal(y));
    j.addArrayElement(JSON::makeReal(width));
    j.addArrayElement(JSON::makeReal(height));
    return j;
}

JSON
PageInfo::getJSON() const
{
    auto optional_box = [](std::optional<PageBox> const& box) {
        return box ? box->getJSON() : JSON::makeNull();
    };
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("page", JSON::makeInt(page_number));
    j.addDictionaryMember("mediabox", media_box.getJSON());
    j.addDictionaryMember("trimbox", optional_box(trim_box));
    j.addDictionaryMember("bleedbox", optional_box(bleed_box));
    j.addDictionaryMember("cropbox", optional_box(crop_box));
    j.addDictionaryMember("width", JSON::makeReal(width));
    j.addDictionaryMember("height", JSON::makeReal(height));
    j.addDictionaryMember("rotate", JSON::makeInt(rotate));
    j.addDictionaryMember(
        "papersize", paper_size.empty() ? JSON::makeNull() : JSON::makeString(paper_size));
    return j;
}
