#include <preflight/ReportAggregator.hh>

#include <preflight/DocumentLoader.hh>

#include <algorithm>
#include <stdexcept>

ReportAggregator::ReportAggregator(std::string const& file_name, size_t file_size)
{
    report.file_name = file_name;
    report.file_size = file_size;
}

void
ReportAggregator::setDocumentInfo(
    PDFVersion const& version, bool encrypted, size_t recovered_problems)
{
    report.version = version;
    report.encrypted = encrypted;
    this->recovered_problems = recovered_problems;
}

void
ReportAggregator::addPage(PageInfo const& info)
{
    report.pages.push_back(info);
    report.page_count = static_cast<int>(report.pages.size());
}

void
ReportAggregator::setFonts(std::vector<FontInfo> const& fonts)
{
    report.fonts = fonts;
}

void
ReportAggregator::addPageIssues(std::vector<PreflightIssue> const& issues)
{
    for (auto const& issue: issues) {
        if (!issue.getPage()) {
            throw std::logic_error("ReportAggregator::addPageIssues called with a document issue");
        }
        page_issues[*issue.getPage()].push_back(issue);
    }
}

void
ReportAggregator::setContentUnavailable(std::string const& reason)
{
    content_unavailable = reason;
}

int
ReportAggregator::categoryRank(pf_category_e category)
{
    switch (category) {
    case pf_cat_geometry:
        return 0;
    case pf_cat_fonts:
        return 1;
    case pf_cat_transparency:
        return 2;
    case pf_cat_colour:
        return 3;
    case pf_cat_images:
        return 4;
    case pf_cat_document:
        return 5;
    }
    return 6;
}

PreflightReport
ReportAggregator::assemble() const
{
    PreflightReport result = report;
    for (auto const& [page, issues]: page_issues) {
        auto sorted = issues;
        std::stable_sort(
            sorted.begin(), sorted.end(), [](PreflightIssue const& a, PreflightIssue const& b) {
                return categoryRank(a.getCategory()) < categoryRank(b.getCategory());
            });
        result.issues.insert(result.issues.end(), sorted.begin(), sorted.end());
    }

    if (result.encrypted) {
        result.issues.emplace_back(
            pf_sev_warning,
            pf_cat_document,
            "Document is encrypted; some print workflows may reject it");
    }
    if (result.page_count == 0) {
        result.issues.emplace_back(pf_sev_error, pf_cat_document, "Document has no pages");
    }
    if (result.version < PDFVersion(1, 3)) {
        result.issues.emplace_back(
            pf_sev_info,
            pf_cat_document,
            "PDF version " + DocumentLoader::unparseVersion(result.version) +
                " is older than 1.3; some print workflows expect 1.3 or later");
    }
    if (recovered_problems > 0) {
        result.issues.emplace_back(
            pf_sev_info,
            pf_cat_document,
            "The file is damaged; " + std::to_string(recovered_problems) +
                (recovered_problems == 1 ? " problem was" : " problems were") +
                " worked around while reading it");
    }
    if (content_unavailable) {
        result.degraded = true;
        result.issues.emplace_back(
            pf_sev_warning,
            pf_cat_document,
            "Previews and image analysis unavailable: " + *content_unavailable);
    }
    return result;
}
