#include <preflight/PaperSizes.hh>

#include <qpdf/QUtil.hh>

#include <cmath>

namespace
{
    PaperSize
    inches(char const* name, double width, double height)
    {
        return {
            name, "US Classic", width * PaperSizes::mm_per_inch, height * PaperSizes::mm_per_inch};
    }

    std::vector<PaperSize>
    make_table()
    {
        return {
            {"4A0", "ISO A", 1682, 2378},
            {"2A0", "ISO A", 1189, 1682},
            {"A0", "ISO A", 841, 1189},
            {"A1", "ISO A", 594, 841},
            {"A2", "ISO A", 420, 594},
            {"A3", "ISO A", 297, 420},
            {"A4", "ISO A", 210, 297},
            {"A5", "ISO A", 148, 210},
            {"A6", "ISO A", 105, 148},
            {"A7", "ISO A", 74, 105},
            {"A8", "ISO A", 52, 74},
            {"A9", "ISO A", 37, 52},
            {"A10", "ISO A", 26, 37},
            {"B0", "ISO B", 1000, 1414},
            {"B1", "ISO B", 707, 1000},
            {"B2", "ISO B", 500, 707},
            {"B3", "ISO B", 353, 500},
            {"B4", "ISO B", 250, 353},
            {"B5", "ISO B", 176, 250},
            {"B6", "ISO B", 125, 176},
            {"B7", "ISO B", 88, 125},
            {"B8", "ISO B", 62, 88},
            {"B9", "ISO B", 44, 62},
            {"B10", "ISO B", 31, 44},
            {"C0", "ISO C", 917, 1297},
            {"C1", "ISO C", 648, 917},
            {"C2", "ISO C", 458, 648},
            {"C3", "ISO C", 324, 458},
            {"C4", "ISO C", 229, 324},
            {"C5", "ISO C", 162, 229},
            {"C6", "ISO C", 114, 162},
            {"C7", "ISO C", 81, 114},
            {"C8", "ISO C", 57, 81},
            {"RA0", "RA", 860, 1220},
            {"RA1", "RA", 610, 860},
            {"RA2", "RA", 430, 610},
            {"RA3", "RA", 305, 430},
            {"RA4", "RA", 215, 305},
            {"SRA0", "SRA", 900, 1280},
            {"SRA1", "SRA", 640, 900},
            {"SRA2", "SRA", 450, 640},
            {"SRA3", "SRA", 320, 450},
            {"SRA4", "SRA", 225, 320},
            inches("Letter", 8.5, 11),
            inches("Legal", 8.5, 14),
            inches("Tabloid", 11, 17),
            inches("Junior Legal", 5, 8),
            inches("Half Letter", 5.5, 8.5),
            inches("Government Letter", 8, 10.5),
            inches("Government Legal", 8.5, 13),
            {"ANSI A", "ANSI", 216, 279},
            {"ANSI B", "ANSI", 279, 432},
            {"ANSI C", "ANSI", 432, 559},
            {"ANSI D", "ANSI", 559, 864},
            {"ANSI E", "ANSI", 864, 1118},
        };
    }
} // namespace

std::vector<PaperSize> const&
PaperSizes::all()
{
    static auto const table = make_table();
    return table;
}

PaperSize const*
PaperSizes::find(std::string const& name)
{
    for (auto const& size: all()) {
        if (QUtil::str_compare_nocase(size.name.c_str(), name.c_str()) == 0) {
            return &size;
        }
    }
    return nullptr;
}

double
PaperSizes::pointsToMm(double points)
{
    return points * mm_per_inch / points_per_inch;
}

PaperSize const*
PaperSizes::match(double width_pt, double height_pt, double tolerance_mm)
{
    double w = pointsToMm(width_pt);
    double h = pointsToMm(height_pt);
    auto close = [tolerance_mm](double a, double b) { return std::fabs(a - b) <= tolerance_mm; };
    for (auto const& size: all()) {
        if ((close(w, size.width_mm) && close(h, size.height_mm)) ||
            (close(w, size.height_mm) && close(h, size.width_mm))) {
            return &size;
        }
    }
    return nullptr;
}

std::string
PaperSizes::formatDimensions(PaperSize const& size, bool in_inches)
{
    if (in_inches) {
        return QUtil::double_to_string(size.width_mm / mm_per_inch, 2) + " x " +
            QUtil::double_to_string(size.height_mm / mm_per_inch, 2) + " in";
    }
    return std::to_string(std::lround(size.width_mm)) + " x " +
        std::to_string(std::lround(size.height_mm)) + " mm";
}
