#include <preflight/assert_test.h>

#include "test_pdf.hh"

#include <preflight/DocumentLoader.hh>
#include <preflight/TransparencyDetector.hh>

#include <qpdf/QPDFPageDocumentHelper.hh>

#include <iostream>

static std::vector<PreflightIssue>
check(std::string const& page_entries, std::string const& version)
{
    auto qpdf = DocumentLoader::load(make_pages_pdf({page_entries}, version), "transparency.pdf");
    std::vector<PreflightIssue> issues;
    TransparencyDetector::checkPage(
        QPDFPageDocumentHelper(*qpdf).getAllPages().at(0),
        1,
        DocumentLoader::getVersion(*qpdf),
        issues);
    for (auto const& issue: issues) {
        std::cout << issue.unparse() << std::endl;
    }
    return issues;
}

static void
test_group()
{
    std::string group = "/Group << /Type /Group /S /Transparency /CS /DeviceRGB >>";
    auto issues = check(group, "1.3");
    assert(issues.size() == 1);
    assert(issues.at(0).getSeverity() == pf_sev_error);
    assert(issues.at(0).getCategory() == pf_cat_transparency);
    assert(
        issues.at(0).getMessage() ==
        "Page has a transparency group, which requires PDF 1.4 but the document is PDF 1.3");

    issues = check(group, "1.4");
    assert(issues.size() == 1);
    assert(issues.at(0).getSeverity() == pf_sev_info);

    // Other group types are not transparency.
    assert(check("/Group << /S /Other >>", "1.3").empty());
}

static void
test_ext_g_state()
{
    std::string resources = "/Resources << /ExtGState << /GS0 << /ca 0.5 >> /GS1 << /CA 1 >> "
                            "/GS2 << /SMask /None /LW 2 >> /GS3 << /SMask << /S /Luminosity >> "
                            "/CA 0.25 >> >> >>";
    auto issues = check(resources, "1.6");
    assert(issues.size() == 2);
    assert(issues.at(0).getMessage() == "Graphics state /GS0 uses transparency");
    assert(issues.at(0).getDetails() == "ca 0.5");
    assert(issues.at(0).getSeverity() == pf_sev_info);
    assert(issues.at(1).getMessage() == "Graphics state /GS3 uses transparency");
    assert(issues.at(1).getDetails() == "CA 0.25, soft mask");

    issues = check(resources, "1.2");
    assert(issues.size() == 2);
    for (auto const& issue: issues) {
        assert(issue.getSeverity() == pf_sev_error);
        assert(issue.getMessage().ends_with("which requires PDF 1.4 but the document is PDF 1.2"));
    }

    assert(check("/Resources << /ExtGState << /GS0 << /LW 1 >> >> >>", "1.2").empty());
}

int
main()
{
    test_group();
    test_ext_g_state();
    std::cout << "transparency tests passed" << std::endl;
    return 0;
}
