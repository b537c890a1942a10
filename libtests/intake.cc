#include <preflight/assert_test.h>

#include <preflight/FileIntake.hh>
#include <preflight/PFExc.hh>

#include <cstdio>
#include <fstream>
#include <iostream>

static void
test_validate()
{
    std::string message;
    assert(FileIntake::validate("report.pdf", "%PDF-1.7\n", "application/pdf", message));
    assert(message.empty());
    assert(FileIntake::validate("REPORT.PDF", "%PDF-1.4", "", message));

    assert(!FileIntake::validate("report.pdf", "%PDF-1.7", "image/png", message));
    assert(message == "Please upload a PDF file.");
    assert(!FileIntake::validate("report.txt", "%PDF-1.7", "", message));
    assert(message == "Please upload a file with a .pdf extension.");
    assert(!FileIntake::validate("pdf", "%PDF-1.7", "", message));
    assert(!FileIntake::validate("report.pdf", "<html>", "", message));
    assert(message == "The file does not appear to be a valid PDF.");
    assert(!FileIntake::validate("report.pdf", "", "", message));
}

static void
test_format_size()
{
    assert(FileIntake::formatSize(0) == "0 B");
    assert(FileIntake::formatSize(1023) == "1023 B");
    assert(FileIntake::formatSize(1024) == "1.0 KB");
    assert(FileIntake::formatSize(1536) == "1.5 KB");
    assert(FileIntake::formatSize(2 * 1024 * 1024) == "2.0 MB");
    assert(FileIntake::formatSize(5 * 1024 * 1024 + 300 * 1024) == "5.3 MB");
}

static void
test_read()
{
    char const* filename = "intake-test.pdf";
    {
        std::ofstream f(filename, std::ios::binary);
        f << "%PDF-1.4\n\0binary";
    }
    assert(FileIntake::readFile(filename).starts_with("%PDF-1.4\n"));
    remove(filename);

    bool threw = false;
    try {
        FileIntake::readFile("no/such/file.pdf");
    } catch (PFExc& e) {
        std::cout << e.what() << std::endl;
        assert(e.getErrorCode() == pf_e_system);
        assert(e.getMessageDetail() == "Failed to read the file. Please try again.");
        threw = true;
    }
    assert(threw);
}

int
main()
{
    test_validate();
    test_format_size();
    test_read();
    std::cout << "intake tests passed" << std::endl;
    return 0;
}
