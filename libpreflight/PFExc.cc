#include <preflight/PFExc.hh>

#include <qpdf/QPDFExc.hh>

PFExc::PFExc(
    pf_error_code_e error_code,
    std::string const& filename,
    std::string const& where,
    std::string const& message) :
    std::runtime_error(createWhat(filename, where, message)),
    error_code(error_code),
    filename(filename),
    where(where),
    message(message)
{
}

PFExc::PFExc(pf_error_code_e error_code, std::string const& message) :
    PFExc(error_code, "", "", message)
{
}

std::string
PFExc::createWhat(
    std::string const& filename, std::string const& where, std::string const& message)
{
    std::string result = filename;
    if (!where.empty()) {
        result += filename.empty() ? where : " (" + where + ")";
    }
    return result.empty() ? message : result + ": " + message;
}

PFExc
PFExc::fromException(
    std::exception const& e, std::string const& filename, pf_error_code_e error_code)
{
    if (auto pe = dynamic_cast<PFExc const*>(&e)) {
        return *pe;
    }
    auto qe = dynamic_cast<QPDFExc const*>(&e);
    if (!qe) {
        return {error_code, filename, "", e.what()};
    }
    pf_error_code_e code = error_code;
    switch (qe->getErrorCode()) {
    case qpdf_e_password:
        code = pf_e_password;
        break;
    case qpdf_e_damaged_pdf:
    case qpdf_e_pages:
    case qpdf_e_object:
        code = pf_e_damaged_pdf;
        break;
    case qpdf_e_unsupported:
        code = pf_e_unsupported;
        break;
    case qpdf_e_system:
        code = pf_e_system;
        break;
    default:
        break;
    }
    std::string where = qe->getObject();
    if (qe->getFilePosition() > 0) {
        where += (where.empty() ? "" : ", ") + std::string("offset ") +
            std::to_string(qe->getFilePosition());
    }
    return {code, filename, where, qe->getMessageDetail()};
}

pf_error_code_e
PFExc::getErrorCode() const
{
    return error_code;
}

std::string const&
PFExc::getFilename() const
{
    return filename;
}

std::string const&
PFExc::getWhere() const
{
    return where;
}

std::string const&
PFExc::getMessageDetail() const
{
    return message;
}

char const*
PFExc::errorName(pf_error_code_e code)
{
    switch (code) {
    case pf_e_success:
        return "Success";
    case pf_e_internal:
        return "InternalError";
    case pf_e_system:
        return "SystemError";
    case pf_e_unsupported:
        return "Unsupported";
    case pf_e_damaged_pdf:
        return "ParseError";
    case pf_e_password:
        return "EncryptedUnreadable";
    case pf_e_content:
        return "ContentAnalysisUnavailable";
    case pf_e_analysis:
        return "AnalysisException";
    }
    return "UnknownError";
}
