#include <preflight/assert_test.h>

#include "test_pdf.hh"

#include <preflight/DocumentLoader.hh>
#include <preflight/FileIntake.hh>
#include <preflight/PFExc.hh>

#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFJob.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

static void
expect_load_error(
    std::string const& data, std::string const& password, pf_error_code_e code)
{
    bool threw = false;
    try {
        DocumentLoader::load(data, "loader.pdf", password);
    } catch (PFExc& e) {
        std::cout << e.what() << std::endl;
        assert(e.getErrorCode() == code);
        assert(e.getFilename() == "loader.pdf");
        threw = true;
    }
    assert(threw);
}

static void
test_versions()
{
    assert(DocumentLoader::parseVersion("1.7") == PDFVersion(1, 7));
    assert(DocumentLoader::parseVersion("2.0") == PDFVersion(2, 0));
    assert(DocumentLoader::parseVersion("1.") == PDFVersion(1, 0));
    assert(DocumentLoader::parseVersion("x.4") == PDFVersion(1, 0));
    assert(DocumentLoader::parseVersion("") == PDFVersion(1, 0));
    assert(DocumentLoader::unparseVersion(PDFVersion(1, 4)) == "1.4");
    assert(DocumentLoader::unparseVersion(PDFVersion(1, 7, 3)) == "1.7 (extension level 3)");

    auto qpdf = DocumentLoader::load(make_pages_pdf({"/MediaBox [0 0 10 10]"}, "1.3"), "v.pdf");
    assert(DocumentLoader::getVersion(*qpdf) == PDFVersion(1, 3));

    // The catalog can raise the version but not lower it.
    TestPDF pdf("1.4");
    int page = pdf.add("<< /Type /Page /MediaBox [0 0 10 10] >>");
    qpdf = DocumentLoader::load(finish_pdf(pdf, {page}, "", "/Version /1.7"), "v.pdf");
    assert(DocumentLoader::getVersion(*qpdf) == PDFVersion(1, 7));
    TestPDF pdf2("1.6");
    page = pdf2.add("<< /Type /Page /MediaBox [0 0 10 10] >>");
    qpdf = DocumentLoader::load(finish_pdf(pdf2, {page}, "", "/Version /1.2"), "v.pdf");
    assert(DocumentLoader::getVersion(*qpdf) == PDFVersion(1, 6));
}

static void
test_damage()
{
    auto good = make_pages_pdf({"/MediaBox [0 0 10 10]", "/MediaBox [0 0 20 20]"});
    auto qpdf = DocumentLoader::load(good, "good.pdf");
    assert(qpdf->numWarnings() == 0);
    assert(!qpdf->isEncrypted());
    assert(QPDFPageDocumentHelper(*qpdf).getAllPages().size() == 2);

    // A wrong startxref is recovered from and counted.
    auto pos = good.rfind("startxref\n");
    assert(pos != std::string::npos);
    auto damaged = good.substr(0, pos) + "startxref\n7\n%%EOF\n";
    qpdf = DocumentLoader::load(damaged, "damaged.pdf");
    assert(qpdf->numWarnings() > 0);
    assert(QPDFPageDocumentHelper(*qpdf).getAllPages().size() == 2);

    expect_load_error("this is not a PDF", "", pf_e_damaged_pdf);
    expect_load_error("", "", pf_e_damaged_pdf);
}

static void
test_encrypted()
{
    {
        std::ofstream f("loader-plain.pdf", std::ios::binary);
        f << make_pages_pdf({"/MediaBox [0 0 10 10]"}, "1.7");
    }
    QPDFJob j;
    char const* argv[] = {
        "qpdf",
        "loader-plain.pdf",
        "--encrypt",
        "secret",
        "owner",
        "256",
        "--",
        "loader-enc.pdf",
        nullptr};
    j.initializeFromArgv(argv);
    j.run();
    auto data = FileIntake::readFile("loader-enc.pdf");
    remove("loader-plain.pdf");
    remove("loader-enc.pdf");

    expect_load_error(data, "", pf_e_password);
    expect_load_error(data, "wrong", pf_e_password);
    auto qpdf = DocumentLoader::load(data, "loader.pdf", "secret");
    assert(qpdf->isEncrypted());
    assert(QPDFPageDocumentHelper(*qpdf).getAllPages().size() == 1);
}

static void
test_exceptions()
{
    PFExc e1(pf_e_content, "file.pdf", "page 2", "no operators");
    assert(std::string(e1.what()) == "file.pdf (page 2): no operators");
    PFExc e2(pf_e_content, "", "page 2", "no operators");
    assert(std::string(e2.what()) == "page 2: no operators");
    PFExc e3(pf_e_analysis, "no operators");
    assert(std::string(e3.what()) == "no operators");
    assert(e3.getFilename().empty() && e3.getWhere().empty());

    auto e = PFExc::fromException(
        QPDFExc(qpdf_e_pages, "in.pdf", "object 3 0", 120, "bad page tree"),
        "file.pdf",
        pf_e_analysis);
    assert(e.getErrorCode() == pf_e_damaged_pdf);
    assert(e.getFilename() == "file.pdf");
    assert(e.getWhere() == "object 3 0, offset 120");
    assert(e.getMessageDetail() == "bad page tree");

    e = PFExc::fromException(
        QPDFExc(qpdf_e_password, "in.pdf", "", 0, "invalid password"), "file.pdf", pf_e_analysis);
    assert(e.getErrorCode() == pf_e_password);
    assert(std::string(e.what()) == "file.pdf: invalid password");

    e = PFExc::fromException(std::runtime_error("out of range"), "file.pdf", pf_e_analysis);
    assert(e.getErrorCode() == pf_e_analysis);
    assert(e.getMessageDetail() == "out of range");

    // A PFExc keeps its own classification.
    e = PFExc::fromException(e1, "other.pdf", pf_e_analysis);
    assert(e.getErrorCode() == pf_e_content);
    assert(e.getFilename() == "file.pdf");

    assert(std::string(PFExc::errorName(pf_e_damaged_pdf)) == "ParseError");
    assert(std::string(PFExc::errorName(pf_e_password)) == "EncryptedUnreadable");
}

int
main()
{
    test_versions();
    test_damage();
    test_encrypted();
    test_exceptions();
    std::cout << "loader tests passed" << std::endl;
    return 0;
}
