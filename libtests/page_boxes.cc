#include <preflight/assert_test.h>

#include "test_pdf.hh"

#include <preflight/BoxGeometry.hh>
#include <preflight/DocumentLoader.hh>

#include <qpdf/QPDFPageDocumentHelper.hh>

#include <iostream>

static std::vector<PageInfo>
load_pages(std::vector<std::string> const& page_entries)
{
    auto qpdf = DocumentLoader::load(make_pages_pdf(page_entries), "boxes.pdf");
    std::vector<PageInfo> result;
    int n = 0;
    for (auto const& page: QPDFPageDocumentHelper(*qpdf).getAllPages()) {
        result.push_back(BoxGeometry::resolvePage(page, ++n));
    }
    return result;
}

static std::vector<PreflightIssue>
check(std::vector<PageInfo> const& pages, double threshold = 8.5)
{
    std::vector<PreflightIssue> issues;
    for (auto const& page: pages) {
        BoxGeometry::checkPage(page, pages.at(0), threshold, 1.0, issues);
    }
    for (auto const& issue: issues) {
        std::cout << issue.unparse() << std::endl;
    }
    return issues;
}

static void
test_resolve()
{
    auto pages = load_pages({
        "/MediaBox [0 0 595.28 841.89]",
        "/MediaBox [612 792 0 0] /Rotate -90",
        "/MediaBox [0 0 100] /Rotate 45",
        "/MediaBox [0 0 800 800] /TrimBox [10 10 429.53 605.28] /CropBox [0 0 1]",
    });
    assert(pages.size() == 4);

    assert(pages.at(0).page_number == 1);
    assert(pages.at(0).paper_size == "A4");
    assert(!pages.at(0).trim_box && !pages.at(0).bleed_box && !pages.at(0).crop_box);

    assert(pages.at(1).media_box == BoxGeometry::letter());
    assert(pages.at(1).rotate == 270);
    assert(pages.at(1).paper_size == "Letter");

    // Short arrays fall back to US Letter.
    assert(pages.at(2).media_box == BoxGeometry::letter());
    assert(pages.at(2).rotate == 0);

    // The trim box decides the paper size. A short CropBox falls back
    // to the MediaBox.
    assert(pages.at(3).width == 800);
    assert(pages.at(3).trim_box);
    assert(pages.at(3).paper_size == "A5");
    assert(pages.at(3).crop_box == pages.at(3).media_box);
}

static void
test_inherited()
{
    // MediaBox and Rotate come from the page tree unless the page
    // has its own.
    TestPDF pdf;
    int p1 = pdf.add("<< /Type /Page >>");
    int p2 = pdf.add("<< /Type /Page /MediaBox [0 0 612 792] /Rotate 0 >>");
    auto qpdf = DocumentLoader::load(
        finish_pdf(pdf, {p1, p2}, "/MediaBox [0 0 420.94 595.28] /Rotate 90"), "tree.pdf");
    auto helpers = QPDFPageDocumentHelper(*qpdf).getAllPages();
    auto first = BoxGeometry::resolvePage(helpers.at(0), 1);
    auto second = BoxGeometry::resolvePage(helpers.at(1), 2);
    assert(first.paper_size == "A5");
    assert(first.rotate == 90);
    assert(second.paper_size == "Letter");
    assert(second.rotate == 0);
}

static void
test_box_values()
{
    auto qpdf = QPDF::create();
    qpdf->emptyPDF();
    auto name = qpdf->makeIndirectObject(QPDFObjectHandle::newString("five"));
    auto box = QPDFObjectHandle::newArray(
        {QPDFObjectHandle::newInteger(0),
         QPDFObjectHandle::newReal("0.0"),
         name,
         QPDFObjectHandle::newName("/Foo")});
    auto values = BoxGeometry::readBoxValues(box);
    assert(values.size() == 4);
    assert(std::get<double>(values.at(0)) == 0.0);
    assert(std::get<QPDFObjGen>(values.at(2)) == name.getObjGen());
    assert(std::holds_alternative<std::monostate>(values.at(3)));
    // Entries that aren't numbers count as 0.
    assert(BoxGeometry::normalize(values, BoxGeometry::letter()) == PageBox());
    assert(BoxGeometry::readBoxValues(QPDFObjectHandle::newInteger(3)).empty());

    PageBox trim{10, 10, 100, 100};
    assert(BoxGeometry::bleedMargin(trim, PageBox{0, 0, 120, 120}) == 10.0);
    assert(BoxGeometry::bleedMargin(trim, PageBox{0, 0, 115, 120}) == 5.0);
    assert(BoxGeometry::bleedMargin(trim, PageBox{20, 0, 120, 120}) == -10.0);
}

static void
test_trim_and_bleed()
{
    // Both boxes with enough bleed
    auto issues = check(load_pages({"/MediaBox [0 0 612 792] /TrimBox [9 9 603 783] "
                                    "/BleedBox [0 0 612 792]"}));
    assert(issues.empty());

    // Exactly at the threshold is fine.
    issues = check(load_pages({"/MediaBox [0 0 612 792] /TrimBox [8.5 8.5 603.5 783.5] "
                               "/BleedBox [0 0 612 792]"}));
    assert(issues.empty());

    issues = check(load_pages({"/MediaBox [0 0 612 792] /TrimBox [8.49 8.49 603.51 783.51] "
                               "/BleedBox [0 0 612 792]"}));
    assert(issues.size() == 1);
    assert(issues.at(0).getSeverity() == pf_sev_warning);
    assert(issues.at(0).getCategory() == pf_cat_geometry);
    assert(issues.at(0).getPage() == 1);
    assert(
        issues.at(0).getMessage() ==
        "Bleed margin is 8.49pt (3mm), below the recommended 8.5pt (3mm)");

    // A lower threshold accepts it.
    issues = check(
        load_pages({"/MediaBox [0 0 612 792] /TrimBox [8.49 8.49 603.51 783.51] "
                    "/BleedBox [0 0 612 792]"}),
        3.0);
    assert(issues.empty());

    // Trim only
    issues = check(load_pages({"/MediaBox [0 0 612 792] /TrimBox [9 9 603 783]"}));
    assert(issues.size() == 1);
    assert(issues.at(0).getMessage().starts_with("No BleedBox defined"));

    // Bleed only
    issues = check(load_pages({"/MediaBox [0 0 612 792] /BleedBox [0 0 612 792]"}));
    assert(issues.size() == 1);
    assert(issues.at(0).getSeverity() == pf_sev_info);
    assert(issues.at(0).getMessage().starts_with("No TrimBox defined"));

    // Neither
    issues = check(load_pages({"/MediaBox [0 0 612 792]"}));
    assert(issues.size() == 2);
}

static void
test_page_sizes()
{
    std::string boxes = " /TrimBox [9 9 603 783] /BleedBox [0 0 612 792]";
    auto issues = check(load_pages({
        "/MediaBox [0 0 612 792]" + boxes,
        "/MediaBox [0 0 612.5 792.9]" + boxes,
        "/MediaBox [0 0 792 612]" + boxes,
    }));
    assert(issues.size() == 1);
    assert(issues.at(0).getPage() == 3);
    assert(
        issues.at(0).getMessage() ==
        "Page size 792 x 612 pt differs from page 1 (612 x 792 pt)");
}

int
main()
{
    test_resolve();
    test_inherited();
    test_box_values();
    test_trim_and_bleed();
    test_page_sizes();
    std::cout << "page box tests passed" << std::endl;
    return 0;
}
