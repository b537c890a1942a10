#include <preflight/DocumentLoader.hh>

#include <preflight/PFExc.hh>

#include <qpdf/Buffer.hh>
#include <qpdf/BufferInputSource.hh>
#include <qpdf/QUtil.hh>

#include <cstring>

std::shared_ptr<QPDF>
DocumentLoader::load(
    std::string const& data,
    std::string const& file_name,
    std::string const& password,
    std::shared_ptr<QPDFLogger> log)
{
    auto qpdf = QPDF::create();
    if (log) {
        qpdf->setLogger(log);
    }
    // Recovered damage is counted, not printed.
    qpdf->setSuppressWarnings(true);
    auto buf = new Buffer(data.size());
    if (!data.empty()) {
        memcpy(buf->getBuffer(), data.data(), data.size());
    }
    auto is = std::make_shared<BufferInputSource>(file_name, buf, true);
    try {
        qpdf->processInputSource(is, password.empty() ? nullptr : password.c_str());
        // Force the page tree to be read so that a broken tree is a
        // load failure rather than an analysis failure.
        qpdf->getAllPages();
    } catch (std::exception& e) {
        throw PFExc::fromException(e, file_name, pf_e_damaged_pdf);
    }
    return qpdf;
}

PDFVersion
DocumentLoader::getVersion(QPDF& qpdf)
{
    PDFVersion v = parseVersion(qpdf.getPDFVersion());
    auto root = qpdf.getRoot();
    if (root.isDictionary()) {
        auto catalog_version = root.getKey("/Version");
        if (catalog_version.isName()) {
            // /Version is a name like /1.7.
            v.updateIfGreater(parseVersion(catalog_version.getName().substr(1)));
        }
    }
    return v;
}

std::string
DocumentLoader::unparseVersion(PDFVersion const& v)
{
    std::string version;
    int extension_level = 0;
    v.getVersion(version, extension_level);
    if (extension_level) {
        version += " (extension level " + std::to_string(extension_level) + ")";
    }
    return version;
}

PDFVersion
DocumentLoader::parseVersion(std::string const& s)
{
    auto dot = s.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= s.size()) {
        return {1, 0};
    }
    for (size_t i = 0; i < s.size(); ++i) {
        if (i != dot && !QUtil::is_digit(s.at(i))) {
            return {1, 0};
        }
    }
    return {QUtil::string_to_int(s.substr(0, dot).c_str()),
            QUtil::string_to_int(s.substr(dot + 1).c_str())};
}
