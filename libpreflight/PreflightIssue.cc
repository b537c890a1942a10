#include <preflight/PreflightIssue.hh>

PreflightIssue::PreflightIssue(
    pf_severity_e severity,
    pf_category_e category,
    std::string const& message,
    std::optional<int> page,
    std::optional<std::string> details) :
    severity(severity),
    category(category),
    message(message),
    page(page),
    details(std::move(details))
{
}

pf_severity_e
PreflightIssue::getSeverity() const
{
    return severity;
}

pf_category_e
PreflightIssue::getCategory() const
{
    return category;
}

std::string const&
PreflightIssue::getMessage() const
{
    return message;
}

std::optional<int>
PreflightIssue::getPage() const
{
    return page;
}

std::optional<std::string> const&
PreflightIssue::getDetails() const
{
    return details;
}

char const*
PreflightIssue::severityName(pf_severity_e severity)
{
    switch (severity) {
    case pf_sev_error:
        return "error";
    case pf_sev_warning:
        return "warning";
    case pf_sev_info:
        return "info";
    }
    return "unknown";
}

char const*
PreflightIssue::categoryName(pf_category_e category)
{
    switch (category) {
    case pf_cat_document:
        return "document";
    case pf_cat_geometry:
        return "geometry";
    case pf_cat_fonts:
        return "fonts";
    case pf_cat_colour:
        return "colour";
    case pf_cat_images:
        return "images";
    case pf_cat_transparency:
        return "transparency";
    }
    return "unknown";
}

std::string
PreflightIssue::unparse() const
{
    std::string result = std::string(severityName(severity)) + " [" + categoryName(category) + "]";
    if (page) {
        result += " page " + std::to_string(*page);
    }
    result += ": " + message;
    if (details) {
        result += " (" + *details + ")";
    }
    return result;
}

JSON
PreflightIssue::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("severity", JSON::makeString(severityName(severity)));
    j.addDictionaryMember("category", JSON::makeString(categoryName(category)));
    j.addDictionaryMember("message", JSON::makeString(message));
    j.addDictionaryMember("page", page ? JSON::makeInt(*page) : JSON::makeNull());
    j.addDictionaryMember("details", details ? JSON::makeString(*details) : JSON::makeNull());
    return j;
}
