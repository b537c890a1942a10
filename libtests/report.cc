#include <preflight/assert_test.h>

#include <preflight/ReportAggregator.hh>

#include <qpdf/Pl_String.hh>

#include <iostream>
#include <stdexcept>

static PageInfo
page(int n, double width = 612, double height = 792)
{
    PageInfo info;
    info.page_number = n;
    info.media_box = PageBox{0, 0, width, height};
    info.width = width;
    info.height = height;
    info.paper_size = "Letter";
    return info;
}

static ReportAggregator
make_aggregator()
{
    ReportAggregator agg("doc.pdf", 2048);
    agg.setDocumentInfo(PDFVersion(1, 4), false, 0);
    agg.addPage(page(1));
    auto p2 = page(2);
    p2.trim_box = PageBox{9, 9, 594, 774};
    p2.rotate = 90;
    agg.addPage(p2);
    FontInfo font;
    font.name = "CustomSans";
    font.subtype = "Type1";
    font.first_page = 2;
    agg.setFonts({font});

    // Content findings arrive after the structural ones and for pages
    // in any order.
    agg.addPageIssues(
        {PreflightIssue(pf_sev_warning, pf_cat_geometry, "No BleedBox defined", 2),
         PreflightIssue(
             pf_sev_error, pf_cat_fonts, "Font \"CustomSans\" is not embedded", 2, "subtype Type1"),
         PreflightIssue(pf_sev_info, pf_cat_transparency, "Transparent", 2)});
    agg.addPageIssues(
        {PreflightIssue(pf_sev_info, pf_cat_images, "1 image placed on this page", 2),
         PreflightIssue(pf_sev_warning, pf_cat_colour, "RGB colour detected", 2),
         PreflightIssue(pf_sev_warning, pf_cat_colour, "RGB colour detected", 1)});
    agg.addPageIssues({PreflightIssue(pf_sev_warning, pf_cat_geometry, "No BleedBox defined", 1)});
    return agg;
}

static void
test_order()
{
    auto report = make_aggregator().assemble();
    std::vector<std::string> lines;
    for (auto const& issue: report.getIssues()) {
        lines.push_back(issue.unparse());
    }
    std::vector<std::string> expected = {
        "warning [geometry] page 1: No BleedBox defined",
        "warning [colour] page 1: RGB colour detected",
        "warning [geometry] page 2: No BleedBox defined",
        "error [fonts] page 2: Font \"CustomSans\" is not embedded (subtype Type1)",
        "info [transparency] page 2: Transparent",
        "warning [colour] page 2: RGB colour detected",
        "info [images] page 2: 1 image placed on this page",
    };
    assert(lines == expected);
    assert(!report.passes());
    assert(report.countIssues(pf_sev_error) == 1);
    assert(report.countIssues(pf_sev_warning) == 4);
    assert(report.countIssues(pf_sev_info) == 2);
    assert(report.getPageCount() == 2);
    assert(!report.isDegraded());

    bool threw = false;
    try {
        ReportAggregator("x.pdf", 1).addPageIssues(
            {PreflightIssue(pf_sev_info, pf_cat_document, "no page")});
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);
}

static void
test_document_issues()
{
    ReportAggregator agg("old.pdf", 10);
    agg.setDocumentInfo(PDFVersion(1, 2), true, 1);
    agg.setContentUnavailable("unsupported stream filter /JBIG2Decode");
    auto report = agg.assemble();
    for (auto const& issue: report.getIssues()) {
        std::cout << issue.unparse() << std::endl;
        assert(issue.getCategory() == pf_cat_document);
        assert(!issue.getPage());
    }
    auto const& issues = report.getIssues();
    assert(issues.size() == 5);
    assert(issues.at(0).getMessage() == "Document is encrypted; some print workflows may reject it");
    assert(issues.at(1).getSeverity() == pf_sev_error);
    assert(issues.at(1).getMessage() == "Document has no pages");
    assert(
        issues.at(2).getMessage() ==
        "PDF version 1.2 is older than 1.3; some print workflows expect 1.3 or later");
    assert(
        issues.at(3).getMessage() ==
        "The file is damaged; 1 problem was worked around while reading it");
    assert(
        issues.at(4).getMessage() ==
        "Previews and image analysis unavailable: unsupported stream filter /JBIG2Decode");
    assert(report.isDegraded());
    assert(report.isEncrypted());
    assert(!report.passes());

    // Warnings alone still pass.
    ReportAggregator agg2("ok.pdf", 10);
    agg2.setDocumentInfo(PDFVersion(1, 6), false, 3);
    agg2.addPage(page(1));
    report = agg2.assemble();
    assert(report.passes());
    assert(report.getIssues().size() == 1);
    assert(report.getIssues().at(0).getMessage().find("3 problems were") != std::string::npos);
}

static void
test_text()
{
    auto report = make_aggregator().assemble();
    std::string out;
    Pl_String p("text", nullptr, out);
    report.writeText(&p, true);
    p.finish();
    std::string expected = "file: doc.pdf (2.0 KB)\n"
                           "PDF version: 1.4\n"
                           "pages: 2\n"
                           "encrypted: no\n"
                           "page 1: 612 x 792 pt (Letter)\n"
                           "page 2: 612 x 792 pt (Letter), trim 594 x 774 pt, rotated 90\n"
                           "fonts:\n"
                           "  CustomSans (Type1), not embedded\n"
                           "issues:\n"
                           "  warning [geometry] page 1: No BleedBox defined\n"
                           "  warning [colour] page 1: RGB colour detected\n"
                           "  warning [geometry] page 2: No BleedBox defined\n"
                           "  error [fonts] page 2: Font \"CustomSans\" is not embedded "
                           "(subtype Type1)\n"
                           "  info [transparency] page 2: Transparent\n"
                           "  warning [colour] page 2: RGB colour detected\n"
                           "  info [images] page 2: 1 image placed on this page\n"
                           "result: not ready for print (1 errors, 4 warnings, 2 infos)\n";
    if (out != expected) {
        std::cout << out;
    }
    assert(out == expected);

    // Without verbose, the per-page lines are left out.
    out.clear();
    Pl_String p2("text", nullptr, out);
    report.writeText(&p2);
    p2.finish();
    assert(out.find("page 1: 612") == std::string::npos);
}

static void
test_json()
{
    auto j1 = make_aggregator().assemble().getJSON().unparse();
    auto j2 = make_aggregator().assemble().getJSON().unparse();
    assert(j1 == j2);
    assert(j1.find("\"ready\": false") != std::string::npos);
    assert(j1.find("\"degraded\": false") != std::string::npos);
    assert(j1.find("\"errors\": 1") != std::string::npos);
    assert(j1.find("\"size\": 2048") != std::string::npos);
    assert(j1.find("\"version\": \"1.4\"") != std::string::npos);
    std::cout << j1 << std::endl;
}

int
main()
{
    test_order();
    test_document_issues();
    test_text();
    test_json();
    std::cout << "report tests passed" << std::endl;
    return 0;
}
