#include <preflight/assert_test.h>

#include <preflight/PaperSizes.hh>

#include <cmath>
#include <iostream>

static void
test_match()
{
    // A4 is 595.28 x 841.89 points.
    auto a4 = PaperSizes::match(595.28, 841.89);
    assert(a4 && a4->name == "A4");
    assert(a4->series == "ISO A");
    // Landscape matches too.
    assert(PaperSizes::match(841.89, 595.28) == a4);
    // Letter comes before the nearly identical ANSI A.
    auto letter = PaperSizes::match(612, 792);
    assert(letter && letter->name == "Letter");
    assert(PaperSizes::match(1224, 792)->name == "Tabloid");
    assert(PaperSizes::match(100, 100) == nullptr);
    // 2 mm off is outside the default tolerance but inside a wider one.
    double off = 2.0 * PaperSizes::points_per_inch / PaperSizes::mm_per_inch;
    assert(PaperSizes::match(595.28 + off, 841.89) == nullptr);
    assert(PaperSizes::match(595.28 + off, 841.89, 2.5) == a4);
}

static void
test_find_and_format()
{
    auto sra3 = PaperSizes::find("sra3");
    assert(sra3 && sra3->name == "SRA3");
    assert(PaperSizes::formatDimensions(*sra3) == "320 x 450 mm");
    auto legal = PaperSizes::find("LEGAL");
    assert(legal);
    assert(PaperSizes::formatDimensions(*legal) == "216 x 356 mm");
    assert(PaperSizes::formatDimensions(*legal, true) == "8.5 x 14 in");
    assert(PaperSizes::find("A11") == nullptr);

    assert(std::fabs(PaperSizes::pointsToMm(72) - 25.4) < 1e-9);
    for (auto const& size: PaperSizes::all()) {
        assert(size.width_mm <= size.height_mm);
        assert(PaperSizes::find(size.name) == &size);
    }
    std::cout << PaperSizes::all().size() << " paper sizes" << std::endl;
}

int
main()
{
    test_match();
    test_find_and_format();
    std::cout << "paper size tests passed" << std::endl;
    return 0;
}
