#include <preflight/TransparencyDetector.hh>

#include <preflight/DocumentLoader.hh>

#include <qpdf/QUtil.hh>

PDFVersion
TransparencyDetector::minimumVersion()
{
    return {1, 4};
}

bool
TransparencyDetector::usesTransparency(QPDFObjectHandle gs, std::string& details)
{
    details.clear();
    if (!gs.isDictionary()) {
        return false;
    }
    auto add = [&details](std::string const& s) {
        if (!details.empty()) {
            details += ", ";
        }
        details += s;
    };
    for (auto key: {"/ca", "/CA"}) {
        double alpha = 1.0;
        if (gs.getKey(key).getValueAsNumber(alpha) && alpha < 1.0) {
            add(std::string(key + 1) + " " + QUtil::double_to_string(alpha, 3));
        }
    }
    auto smask = gs.getKey("/SMask");
    if (!smask.isNull() && !smask.isNameAndEquals("/None")) {
        add("soft mask");
    }
    return !details.empty();
}

void
TransparencyDetector::checkPage(
    QPDFPageObjectHelper page,
    int page_number,
    PDFVersion const& version,
    std::vector<PreflightIssue>& issues)
{
    bool unsupported = version < minimumVersion();
    std::string required = "requires PDF " + DocumentLoader::unparseVersion(minimumVersion()) +
        " but the document is PDF " + DocumentLoader::unparseVersion(version);

    auto group = page.getAttribute("/Group", false);
    if (group.isDictionary() && group.getKey("/S").isNameAndEquals("/Transparency")) {
        if (unsupported) {
            issues.emplace_back(
                pf_sev_error,
                pf_cat_transparency,
                "Page has a transparency group, which " + required,
                page_number);
        } else {
            issues.emplace_back(
                pf_sev_info,
                pf_cat_transparency,
                "Page has a transparency group; it will be flattened for print",
                page_number);
        }
    }

    auto resources = page.getAttribute("/Resources", false);
    if (!resources.isDictionary()) {
        return;
    }
    auto ext_g_states = resources.getKey("/ExtGState");
    if (!ext_g_states.isDictionary()) {
        return;
    }
    for (auto const& [key, gs]: ext_g_states.getDictAsMap()) {
        std::string details;
        if (!usesTransparency(gs, details)) {
            continue;
        }
        if (unsupported) {
            issues.emplace_back(
                pf_sev_error,
                pf_cat_transparency,
                "Graphics state " + key + " uses transparency, which " + required,
                page_number,
                details);
        } else {
            issues.emplace_back(
                pf_sev_info,
                pf_cat_transparency,
                "Graphics state " + key + " uses transparency",
                page_number,
                details);
        }
    }
}
