#ifndef TEST_PDF_HH
#define TEST_PDF_HH

// Builds small PDF files for tests. Objects are numbered from 1 in
// the order they are added or reserved; the cross-reference table is
// computed when the file is built.

#include <cstdio>
#include <map>
#include <string>
#include <vector>

class TestPDF
{
  public:
    TestPDF(std::string const& version = "1.4") :
        version(version)
    {
    }

    // Reserve an object number to be filled in later with set.
    int
    reserve()
    {
        bodies.emplace_back();
        return static_cast<int>(bodies.size());
    }

    int
    add(std::string const& body)
    {
        int n = reserve();
        set(n, body);
        return n;
    }

    void
    set(int n, std::string const& body)
    {
        bodies.at(static_cast<size_t>(n - 1)) = body;
    }

    std::string const&
    get(int n) const
    {
        return bodies.at(static_cast<size_t>(n - 1));
    }

    // A stream with the given extra dictionary entries. /Length is
    // added.
    int
    addStream(std::string const& dict_entries, std::string const& data)
    {
        return add(streamBody(dict_entries, data));
    }

    static std::string
    streamBody(std::string const& dict_entries, std::string const& data)
    {
        return "<< " + dict_entries + " /Length " + std::to_string(data.size()) +
            " >>\nstream\n" + data + "\nendstream";
    }

    static std::string
    ref(int n)
    {
        return std::to_string(n) + " 0 R";
    }

    // A complete file with a classic cross-reference table.
    std::string
    build(std::string const& trailer_entries) const
    {
        std::string out = "%PDF-" + version + "\n%\xe2\xe3\xcf\xd3\n";
        std::vector<size_t> offsets;
        for (size_t i = 0; i < bodies.size(); ++i) {
            offsets.push_back(out.size());
            out += std::to_string(i + 1) + " 0 obj\n" + bodies.at(i) + "\nendobj\n";
        }
        size_t xref = out.size();
        out += "xref\n0 " + std::to_string(bodies.size() + 1) + "\n";
        out += "0000000000 65535 f \n";
        for (auto offset: offsets) {
            char buf[32];
            snprintf(buf, sizeof(buf), "%010zu 00000 n \n", offset);
            out += buf;
        }
        out += "trailer\n<< /Size " + std::to_string(bodies.size() + 1) + " " + trailer_entries +
            " >>\nstartxref\n" + std::to_string(xref) + "\n%%EOF\n";
        return out;
    }

    // A complete file whose cross-reference data is an uncompressed
    // cross-reference stream with /W [1 4 2].
    std::string
    buildWithXRefStream(std::string const& trailer_entries) const
    {
        std::string out = "%PDF-" + version + "\n%\xe2\xe3\xcf\xd3\n";
        std::vector<size_t> offsets;
        for (size_t i = 0; i < bodies.size(); ++i) {
            offsets.push_back(out.size());
            out += std::to_string(i + 1) + " 0 obj\n" + bodies.at(i) + "\nendobj\n";
        }
        size_t xref = out.size();
        offsets.push_back(xref);
        auto entry = [](int type, size_t field2, int field3) {
            std::string e;
            e += static_cast<char>(type);
            for (int shift = 24; shift >= 0; shift -= 8) {
                e += static_cast<char>((field2 >> shift) & 0xff);
            }
            e += static_cast<char>((field3 >> 8) & 0xff);
            e += static_cast<char>(field3 & 0xff);
            return e;
        };
        std::string data = entry(0, 0, 0xffff);
        for (auto offset: offsets) {
            data += entry(1, offset, 0);
        }
        size_t size = offsets.size() + 1;
        out += std::to_string(size - 1) + " 0 obj\n<< /Type /XRef /W [1 4 2] /Size " +
            std::to_string(size) + " " + trailer_entries + " /Length " +
            std::to_string(data.size()) + " >>\nstream\n" + data + "\nendstream\nendobj\n";
        out += "startxref\n" + std::to_string(xref) + "\n%%EOF\n";
        return out;
    }

  private:
    std::string version;
    std::vector<std::string> bodies;
};

// Add a page tree with the given page objects and a catalog, and
// build the file. /Parent is added to the page dictionaries, which
// must start with "<<".
inline std::string
finish_pdf(
    TestPDF& pdf,
    std::vector<int> const& pages,
    std::string const& tree_entries = "",
    std::string const& catalog_entries = "")
{
    int tree = pdf.reserve();
    std::string kids;
    for (auto page: pages) {
        kids += TestPDF::ref(page) + " ";
        std::string body = pdf.get(page);
        if (body.starts_with("<<")) {
            pdf.set(page, "<< /Parent " + TestPDF::ref(tree) + body.substr(2));
        }
    }
    pdf.set(
        tree,
        "<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages.size()) + " " +
            tree_entries + " >>");
    int catalog =
        pdf.add("<< /Type /Catalog /Pages " + TestPDF::ref(tree) + " " + catalog_entries + " >>");
    return pdf.build("/Root " + TestPDF::ref(catalog));
}

// A document with one page per entry of page_entries. Each entry is
// added to that page's dictionary.
inline std::string
make_pages_pdf(
    std::vector<std::string> const& page_entries,
    std::string const& version = "1.4",
    std::string const& tree_entries = "")
{
    TestPDF pdf(version);
    std::vector<int> pages;
    for (auto const& entries: page_entries) {
        pages.push_back(pdf.add("<< /Type /Page " + entries + " >>"));
    }
    return finish_pdf(pdf, pages, tree_entries);
}

#endif // TEST_PDF_HH
