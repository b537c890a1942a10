#include <preflight/assert_test.h>

#include "test_pdf.hh"

#include <preflight/DocumentLoader.hh>
#include <preflight/PFDocumentContentProvider.hh>
#include <preflight/PFExc.hh>

#include <iostream>
#include <stdexcept>

typedef PFContentProvider P;

static std::shared_ptr<QPDF>
make_document()
{
    TestPDF pdf;
    int icc = pdf.addStream("/N 4", "profile");
    int image = pdf.addStream(
        "/Type /XObject /Subtype /Image /Width 1 /Height 1 /ColorSpace /DeviceGray "
        "/BitsPerComponent 8",
        "\x80");
    int mask = pdf.addStream(
        "/Type /XObject /Subtype /Image /Width 1 /Height 1 /ImageMask true", "\x80");
    int form = pdf.addStream(
        "/Type /XObject /Subtype /Form /BBox [0 0 10 10]",
        "0 0 1 RG BI /W 1 /H 1 /CS /RGB /BPC 8 ID abc EI /Im1 Do");
    int content = pdf.addStream("", "q 1 0 0 rg /CS0 cs /Im1 Do /Fm1 Do Q");
    int second = pdf.addStream("", "/Mask Do\n0.5 g /Missing Do");
    int page1 = pdf.add(
        "<< /Type /Page /MediaBox [0 0 200 100] /Contents " + TestPDF::ref(content) +
        " /Resources << /ColorSpace << /CS0 [/ICCBased " + TestPDF::ref(icc) +
        "] >> /XObject << /Im1 " + TestPDF::ref(image) + " /Fm1 " + TestPDF::ref(form) +
        " /Mask " + TestPDF::ref(mask) + " >> >> >>");
    int page2 = pdf.add(
        "<< /Type /Page /MediaBox [0 0 50 50] /Contents [" + TestPDF::ref(second) + "] >>");
    int page3 = pdf.add("<< /Type /Page /MediaBox [0 0 50 50] /Contents 42 >>");
    return DocumentLoader::load(finish_pdf(pdf, {page1, page2, page3}), "content.pdf");
}

static std::string
describe(std::vector<P::Operation> const& ops)
{
    std::string result;
    for (auto const& op: ops) {
        result += std::to_string(op.opcode) + ":" + op.op;
        for (auto arg: op.args) {
            result += " " + (arg.isInlineImage() ? "<inline>" : arg.unparse());
        }
        result += "\n";
    }
    std::cout << result;
    return result;
}

static void
test_operators()
{
    auto doc = make_document();
    PFDocumentContentProvider provider;
    auto session = provider.openSession(doc);

    auto ops = session->getOperatorList(1);
    describe(ops);
    std::vector<P::opcode_e> expected = {
        P::op_other,                  // q
        P::op_set_fill_rgb,           // rg
        P::op_set_fill_colour_space,  // cs
        P::op_paint_image,            // Do /Im1
        P::op_paint_form_begin,       // Do /Fm1
        P::op_set_stroke_rgb,         // RG in the form
        P::op_paint_inline_image,     // EI in the form
        P::op_paint_image,            // /Im1 through the page's resources
        P::op_paint_form_end,
        P::op_other,                  // Q
    };
    assert(ops.size() == expected.size());
    for (size_t i = 0; i < ops.size(); ++i) {
        assert(ops.at(i).opcode == expected.at(i));
    }
    assert(ops.at(1).args.size() == 3);
    // The ICC profile has four components.
    assert(ops.at(2).args.at(0).getName() == "/CMYK");
    auto& inline_image = ops.at(6);
    assert(inline_image.args.size() == 2);
    assert(inline_image.args.at(0).getKey("/CS").getName() == "/RGB");
    assert(inline_image.args.at(1).getInlineImageValue().starts_with("abc"));

    ops = session->getOperatorList(2);
    assert(ops.size() == 3);
    // No resources: the name doesn't resolve to an image.
    assert(ops.at(0).opcode == P::op_other);
    assert(ops.at(1).opcode == P::op_set_fill_gray);
    assert(ops.at(2).opcode == P::op_other);

    for (int bad: {3, 4, 0}) {
        bool threw = false;
        try {
            session->getOperatorList(bad);
        } catch (PFExc& e) {
            std::cout << e.what() << std::endl;
            assert(e.getErrorCode() == pf_e_content);
            threw = true;
        }
        assert(threw);
    }
}

static void
test_render()
{
    auto doc = make_document();
    PFDocumentContentProvider provider;
    auto session = provider.openSession(doc);
    // The built-in provider doesn't rasterize: the preview is white
    // even though page 1 paints an image.
    auto bitmap = session->render(1, 0.5);
    assert(bitmap.width == 100);
    assert(bitmap.height == 50);
    assert(bitmap.pixels.size() == 100 * 50 * 3);
    assert(bitmap.pixels.find_first_not_of('\xff') == std::string::npos);

    bool threw = false;
    try {
        session->render(1, 0.0);
    } catch (PFExc& e) {
        assert(e.getErrorCode() == pf_e_content);
        threw = true;
    }
    assert(threw);

    assert(!session->isReleased());
    session->release();
    session->release();
    assert(session->isReleased());
    threw = false;
    try {
        session->getOperatorList(1);
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);
}

int
main()
{
    test_operators();
    test_render();
    std::cout << "content provider tests passed" << std::endl;
    return 0;
}
