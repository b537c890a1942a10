#include <preflight/PreflightReport.hh>

#include <preflight/DocumentLoader.hh>
#include <preflight/FileIntake.hh>

#include <qpdf/Pipeline.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>

std::string const&
PreflightReport::getFileName() const
{
    return file_name;
}

size_t
PreflightReport::getFileSize() const
{
    return file_size;
}

PDFVersion
PreflightReport::getVersion() const
{
    return version;
}

int
PreflightReport::getPageCount() const
{
    return page_count;
}

bool
PreflightReport::isEncrypted() const
{
    return encrypted;
}

bool
PreflightReport::isDegraded() const
{
    return degraded;
}

std::vector<PageInfo> const&
PreflightReport::getPages() const
{
    return pages;
}

std::vector<FontInfo> const&
PreflightReport::getFonts() const
{
    return fonts;
}

std::vector<PreflightIssue> const&
PreflightReport::getIssues() const
{
    return issues;
}

size_t
PreflightReport::countIssues(pf_severity_e severity) const
{
    return static_cast<size_t>(
        std::count_if(issues.begin(), issues.end(), [severity](PreflightIssue const& i) {
            return i.getSeverity() == severity;
        }));
}

bool
PreflightReport::passes() const
{
    return countIssues(pf_sev_error) == 0;
}

JSON
PreflightReport::getJSON() const
{
    auto j = JSON::makeDictionary();
    auto file = j.addDictionaryMember("file", JSON::makeDictionary());
    file.addDictionaryMember("name", JSON::makeString(file_name));
    file.addDictionaryMember("size", JSON::makeInt(static_cast<long long>(file_size)));
    file.addDictionaryMember("version", JSON::makeString(DocumentLoader::unparseVersion(version)));
    file.addDictionaryMember("pagecount", JSON::makeInt(page_count));
    file.addDictionaryMember("encrypted", JSON::makeBool(encrypted));

    j.addDictionaryMember("ready", JSON::makeBool(passes()));
    j.addDictionaryMember("degraded", JSON::makeBool(degraded));
    auto summary = j.addDictionaryMember("summary", JSON::makeDictionary());
    summary.addDictionaryMember(
        "errors", JSON::makeInt(static_cast<long long>(countIssues(pf_sev_error))));
    summary.addDictionaryMember(
        "warnings", JSON::makeInt(static_cast<long long>(countIssues(pf_sev_warning))));
    summary.addDictionaryMember(
        "infos", JSON::makeInt(static_cast<long long>(countIssues(pf_sev_info))));

    auto j_pages = j.addDictionaryMember("pages", JSON::makeArray());
    for (auto const& page: pages) {
        j_pages.addArrayElement(page.getJSON());
    }
    auto j_fonts = j.addDictionaryMember("fonts", JSON::makeArray());
    for (auto const& font: fonts) {
        j_fonts.addArrayElement(font.getJSON());
    }
    auto j_issues = j.addDictionaryMember("issues", JSON::makeArray());
    for (auto const& issue: issues) {
        j_issues.addArrayElement(issue.getJSON());
    }
    return j;
}

void
PreflightReport::writeText(Pipeline* p, bool verbose) const
{
    auto box = [](PageBox const& b) {
        return QUtil::double_to_string(b.width, 2) + " x " +
            QUtil::double_to_string(b.height, 2) + " pt";
    };

    *p << "file: " << file_name << " (" << FileIntake::formatSize(file_size) << ")\n";
    *p << "PDF version: " << DocumentLoader::unparseVersion(version) << "\n";
    *p << "pages: " << page_count << "\n";
    *p << "encrypted: " << (encrypted ? "yes" : "no") << "\n";
    if (verbose) {
        for (auto const& page: pages) {
            *p << "page " << page.page_number << ": " << box(page.media_box);
            if (!page.paper_size.empty()) {
                *p << " (" << page.paper_size << ")";
            }
            if (page.trim_box) {
                *p << ", trim " << box(*page.trim_box);
            }
            if (page.bleed_box) {
                *p << ", bleed " << box(*page.bleed_box);
            }
            if (page.rotate) {
                *p << ", rotated " << page.rotate;
            }
            *p << "\n";
        }
    }
    if (!fonts.empty()) {
        *p << "fonts:\n";
        for (auto const& font: fonts) {
            *p << "  " << font.name << " (" << font.subtype << ")"
               << (font.embedded ? "" : ", not embedded") << "\n";
        }
    }
    if (!issues.empty()) {
        *p << "issues:\n";
        for (auto const& issue: issues) {
            *p << "  " << issue.unparse() << "\n";
        }
    }
    *p << "result: " << (passes() ? "ready for print" : "not ready for print") << " ("
       << countIssues(pf_sev_error) << " errors, " << countIssues(pf_sev_warning)
       << " warnings, " << countIssues(pf_sev_info) << " infos)\n";
}
