#include <preflight/FontInventory.hh>

#include <algorithm>
#include <array>
#include <map>

namespace
{
    std::array<char const*, 14> const standard_fonts = {
        "Times-Roman",
        "Times-Bold",
        "Times-Italic",
        "Times-BoldItalic",
        "Helvetica",
        "Helvetica-Bold",
        "Helvetica-Oblique",
        "Helvetica-BoldOblique",
        "Courier",
        "Courier-Bold",
        "Courier-Oblique",
        "Courier-BoldOblique",
        "Symbol",
        "ZapfDingbats"};

    std::string
    strip_slash(std::string const& name)
    {
        return name.starts_with("/") ? name.substr(1) : name;
    }

    // Get key from a dictionary. Null for anything else, so that a
    // malformed font doesn't add warnings to the document.
    QPDFObjectHandle
    dict_key(QPDFObjectHandle obj, std::string const& key)
    {
        if (obj.isStream()) {
            obj = obj.getDict();
        }
        return obj.isDictionary() ? obj.getKey(key) : QPDFObjectHandle::newNull();
    }

    std::map<std::string, QPDFObjectHandle>
    dict_items(QPDFObjectHandle obj)
    {
        return obj.isDictionary() ? obj.getDictAsMap() : std::map<std::string, QPDFObjectHandle>();
    }
} // namespace

JSON
FontInfo::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("name", JSON::makeString(name));
    j.addDictionaryMember("subtype", JSON::makeString(subtype));
    j.addDictionaryMember("embedded", JSON::makeBool(embedded));
    j.addDictionaryMember("firstpage", JSON::makeInt(first_page));
    return j;
}

FontInventory::FontInventory(int max_form_depth) :
    max_form_depth(max_form_depth)
{
}

std::vector<FontInfo> const&
FontInventory::getFonts() const
{
    return fonts;
}

std::string
FontInventory::stripSubsetPrefix(std::string const& name)
{
    if (name.size() >= 7 && name.at(6) == '+' &&
        std::all_of(name.begin(), name.begin() + 6, [](char c) { return c >= 'A' && c <= 'Z'; })) {
        return name.substr(7);
    }
    return name;
}

bool
FontInventory::isStandard14(std::string const& name)
{
    return std::any_of(standard_fonts.begin(), standard_fonts.end(), [&name](char const* f) {
        return name == f;
    });
}

bool
FontInventory::hasFontFile(QPDFObjectHandle font)
{
    auto descriptor = dict_key(font, "/FontDescriptor");
    if (!descriptor.isDictionary()) {
        return false;
    }
    return descriptor.hasKey("/FontFile") || descriptor.hasKey("/FontFile2") ||
        descriptor.hasKey("/FontFile3");
}

bool
FontInventory::isEmbedded(QPDFObjectHandle font, std::string const& clean_name)
{
    if (hasFontFile(font)) {
        return true;
    }
    if (isStandard14(clean_name)) {
        return true;
    }
    auto descendants = dict_key(font, "/DescendantFonts");
    if (dict_key(font, "/Subtype").isNameAndEquals("/Type0") && descendants.isArray()) {
        for (auto d: descendants.getArrayAsVector()) {
            if (hasFontFile(d)) {
                return true;
            }
        }
    }
    return false;
}

void
FontInventory::addFont(
    int page_number,
    std::string const& key,
    QPDFObjectHandle font,
    std::vector<PreflightIssue>& issues)
{
    auto base_font = dict_key(font, "/BaseFont");
    std::string name = stripSubsetPrefix(
        strip_slash(base_font.isName() ? base_font.getName() : key));
    auto subtype_obj = dict_key(font, "/Subtype");
    std::string subtype = subtype_obj.isName() ? strip_slash(subtype_obj.getName()) : "Unknown";

    if (!seen.emplace(name, subtype).second) {
        return;
    }
    FontInfo info;
    info.name = name;
    info.subtype = subtype;
    info.embedded = isEmbedded(font, name);
    info.first_page = page_number;
    fonts.push_back(info);

    if (!info.embedded) {
        issues.emplace_back(
            pf_sev_error,
            pf_cat_fonts,
            "Font \"" + name + "\" is not embedded",
            page_number,
            "subtype " + subtype);
    }
    if (subtype == "Type3") {
        issues.emplace_back(
            pf_sev_warning,
            pf_cat_fonts,
            "Font \"" + name + "\" is a Type 3 font; its glyphs may not rasterize cleanly",
            page_number);
    }
}

void
FontInventory::addResources(
    int page_number,
    QPDFObjectHandle resources,
    int depth,
    QPDFObjGen::set& visited,
    std::vector<PreflightIssue>& issues)
{
    if (!resources.isDictionary()) {
        return;
    }
    for (auto [key, font]: dict_items(resources.getKey("/Font"))) {
        if (font.isDictionary()) {
            addFont(page_number, key, font, issues);
        }
    }

    if (depth >= max_form_depth) {
        return;
    }
    for (auto [key, xobject]: dict_items(resources.getKey("/XObject"))) {
        if (!(xobject.isStream() && dict_key(xobject, "/Subtype").isNameAndEquals("/Form"))) {
            continue;
        }
        if (!visited.add(xobject.getObjGen())) {
            continue;
        }
        addResources(
            page_number, xobject.getDict().getKey("/Resources"), depth + 1, visited, issues);
    }
}

void
FontInventory::addPage(
    int page_number, QPDFObjectHandle resources, std::vector<PreflightIssue>& issues)
{
    QPDFObjGen::set visited;
    addResources(page_number, resources, 0, visited, issues);
}
