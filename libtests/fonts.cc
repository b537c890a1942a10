#include <preflight/assert_test.h>

#include "test_pdf.hh"

#include <preflight/DocumentLoader.hh>
#include <preflight/FontInventory.hh>

#include <qpdf/QPDFPageDocumentHelper.hh>

#include <iostream>

struct Result
{
    std::vector<FontInfo> fonts;
    std::vector<PreflightIssue> issues;
};

static Result
inventory(std::string const& data)
{
    auto qpdf = DocumentLoader::load(data, "fonts.pdf");
    FontInventory inv;
    Result result;
    int n = 0;
    for (auto& page: QPDFPageDocumentHelper(*qpdf).getAllPages()) {
        inv.addPage(++n, page.getAttribute("/Resources", false), result.issues);
    }
    result.fonts = inv.getFonts();
    // Malformed fonts are skipped without warnings.
    assert(qpdf->numWarnings() == 0);
    for (auto const& issue: result.issues) {
        std::cout << issue.unparse() << std::endl;
    }
    return result;
}

static void
test_names()
{
    assert(FontInventory::stripSubsetPrefix("ABCDEF+Helvetica") == "Helvetica");
    assert(FontInventory::stripSubsetPrefix("ABCDEf+Helvetica") == "ABCDEf+Helvetica");
    assert(FontInventory::stripSubsetPrefix("ABCDE+Helvetica") == "ABCDE+Helvetica");
    // A tag with nothing after it leaves an empty name.
    assert(FontInventory::stripSubsetPrefix("ABCDEF+") == "");
    assert(FontInventory::stripSubsetPrefix("ABCDEF") == "ABCDEF");
    assert(FontInventory::isStandard14("ZapfDingbats"));
    assert(FontInventory::isStandard14("Times-Roman"));
    assert(!FontInventory::isStandard14("Arial"));
}

static void
test_shared_font()
{
    // The same subset font on two pages is one font with one issue.
    TestPDF pdf;
    int font = pdf.add("<< /Type /Font /Subtype /TrueType /BaseFont /ABCDEF+Helvetica-Light >>");
    std::string resources = "/Resources << /Font << /F1 " + TestPDF::ref(font) + " >> >>";
    int p1 = pdf.add("<< /Type /Page /MediaBox [0 0 10 10] " + resources + " >>");
    int p2 = pdf.add("<< /Type /Page /MediaBox [0 0 10 10] " + resources + " >>");
    auto r = inventory(finish_pdf(pdf, {p1, p2}));
    assert(r.fonts.size() == 1);
    assert(r.fonts.at(0).name == "Helvetica-Light");
    assert(r.fonts.at(0).subtype == "TrueType");
    assert(!r.fonts.at(0).embedded);
    assert(r.fonts.at(0).first_page == 1);
    assert(r.issues.size() == 1);
    assert(r.issues.at(0).getSeverity() == pf_sev_error);
    assert(r.issues.at(0).getCategory() == pf_cat_fonts);
    assert(r.issues.at(0).getMessage() == "Font \"Helvetica-Light\" is not embedded");
    assert(r.issues.at(0).getDetails() == "subtype TrueType");
}

static void
test_embedding()
{
    TestPDF pdf;
    int file = pdf.addStream("", "font program");
    int descriptor =
        pdf.add("<< /Type /FontDescriptor /FontName /Embedded /FontFile2 " + TestPDF::ref(file) +
                " >>");
    int cid = pdf.add(
        "<< /Type /Font /Subtype /CIDFontType2 /BaseFont /Embedded /FontDescriptor " +
        TestPDF::ref(descriptor) + " >>");
    int page = pdf.add(
        "<< /Type /Page /MediaBox [0 0 10 10] /Resources << /Font <<"
        " /F1 << /Type /Font /Subtype /Type1 /BaseFont /Times-Roman >>"
        " /F2 << /Type /Font /Subtype /Type1 /BaseFont /CustomSans >>"
        " /F3 << /Type /Font /Subtype /Type0 /BaseFont /QWERTY+Embedded /DescendantFonts [" +
        TestPDF::ref(cid) +
        "] >>"
        " /F4 << /Type /Font /Subtype /Type3 >>"
        " >> >> >>");
    auto r = inventory(finish_pdf(pdf, {page}));
    assert(r.fonts.size() == 4);
    // Dictionary keys are visited in sorted order.
    assert(r.fonts.at(0).name == "Times-Roman" && r.fonts.at(0).embedded);
    assert(r.fonts.at(1).name == "CustomSans" && !r.fonts.at(1).embedded);
    assert(r.fonts.at(2).name == "Embedded" && r.fonts.at(2).subtype == "Type0");
    assert(r.fonts.at(2).embedded);
    // Without /BaseFont, the resource name stands in.
    assert(r.fonts.at(3).name == "F4" && r.fonts.at(3).subtype == "Type3");

    assert(r.issues.size() == 3);
    assert(r.issues.at(0).getMessage() == "Font \"CustomSans\" is not embedded");
    assert(r.issues.at(1).getMessage() == "Font \"F4\" is not embedded");
    assert(r.issues.at(2).getSeverity() == pf_sev_warning);
    assert(r.issues.at(2).getMessage().starts_with("Font \"F4\" is a Type 3 font"));
}

static void
test_forms()
{
    // Fonts used only inside a Form XObject count, and a form that
    // refers to itself is visited once.
    TestPDF pdf;
    int form = pdf.reserve();
    pdf.set(
        form,
        TestPDF::streamBody(
            "/Type /XObject /Subtype /Form /BBox [0 0 10 10] /Resources << /Font << /F9 "
            "<< /Type /Font /Subtype /Type1 /BaseFont /FormFont >> >> /XObject << /X0 " +
                TestPDF::ref(form) + " >> >>",
            "BT /F9 12 Tf ET"));
    int page = pdf.add(
        "<< /Type /Page /MediaBox [0 0 10 10] /Resources << /XObject << /X1 " +
        TestPDF::ref(form) + " >> >> >>");
    auto r = inventory(finish_pdf(pdf, {page}));
    assert(r.fonts.size() == 1);
    assert(r.fonts.at(0).name == "FormFont");
    assert(r.issues.size() == 1);
}

static void
test_malformed()
{
    // Resources, font lists and descriptors of the wrong type are
    // ignored.
    TestPDF pdf;
    int page = pdf.add(
        "<< /Type /Page /MediaBox [0 0 10 10] /Resources << /Font << /F1 5 /F2 << /Type /Font "
        "/Subtype /TrueType /BaseFont /Odd /FontDescriptor [1 2] >> /F3 << /Subtype /Type0 "
        "/BaseFont /NoKids /DescendantFonts 7 >> >> /XObject [1 2 3] >> >>");
    auto r = inventory(finish_pdf(pdf, {page}));
    assert(r.fonts.size() == 2);
    assert(r.fonts.at(0).name == "Odd" && !r.fonts.at(0).embedded);
    assert(r.fonts.at(1).name == "NoKids" && !r.fonts.at(1).embedded);
    assert(r.issues.size() == 2);
}

int
main()
{
    test_names();
    test_shared_font();
    test_embedding();
    test_forms();
    test_malformed();
    std::cout << "font tests passed" << std::endl;
    return 0;
}
