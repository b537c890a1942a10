#include <preflight/FileIntake.hh>

#include <preflight/PFExc.hh>

#include <qpdf/QUtil.hh>

#include <memory>
#include <stdexcept>

bool
FileIntake::validate(
    std::string const& name,
    std::string const& data,
    std::string const& mime_type,
    std::string& message)
{
    if (!mime_type.empty() && mime_type != pdf_mime_type) {
        message = "Please upload a PDF file.";
        return false;
    }
    if (name.size() < 4 || QUtil::str_compare_nocase(name.c_str() + name.size() - 4, ".pdf") != 0) {
        message = "Please upload a file with a .pdf extension.";
        return false;
    }
    if (!data.starts_with("%PDF")) {
        message = "The file does not appear to be a valid PDF.";
        return false;
    }
    message.clear();
    return true;
}

std::string
FileIntake::readFile(std::string const& filename)
{
    std::shared_ptr<char> buf;
    size_t size = 0;
    try {
        QUtil::read_file_into_memory(filename.c_str(), buf, size);
    } catch (std::runtime_error&) {
        throw PFExc(pf_e_system, filename, "", "Failed to read the file. Please try again.");
    }
    return {buf.get(), size};
}

std::string
FileIntake::formatSize(size_t bytes)
{
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    if (bytes < 1024 * 1024) {
        return QUtil::double_to_string(static_cast<double>(bytes) / 1024.0, 1, false) + " KB";
    }
    return QUtil::double_to_string(static_cast<double>(bytes) / (1024.0 * 1024.0), 1, false) +
        " MB";
}
