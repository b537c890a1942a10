#include <preflight/assert_test.h>

#include <preflight/OverlayMapper.hh>

#include <iostream>

typedef OverlayMapper::Rect Rect;

static void
test_map()
{
    // A 200 x 100 point page rendered at 2 pixels per point
    OverlayMapper mapper(PageBox{0, 0, 200, 100}, 2.0, 200);
    assert(mapper.map(PageBox{0, 0, 200, 100}) == (Rect{0, 0, 400, 200}));
    // The trim box's top edge is 10 points below the top of the page.
    assert(mapper.map(PageBox{10, 10, 180, 80}) == (Rect{20, 20, 360, 160}));
    assert(mapper.map(PageBox{0, 0, 50, 50}) == (Rect{0, 100, 100, 100}));
}

static void
test_offset_media_box()
{
    // Coordinates are relative to the MediaBox origin.
    OverlayMapper mapper(PageBox{100, 50, 100, 100}, 1.0, 100);
    assert(mapper.map(PageBox{110, 60, 80, 80}) == (Rect{10, 10, 80, 80}));
}

static void
test_page()
{
    PageInfo page;
    page.media_box = PageBox{0, 0, 100, 100};
    page.trim_box = PageBox{5, 5, 90, 90};
    page.crop_box = PageBox{0, 0, 100, 100};
    OverlayMapper mapper(page.media_box, 0.5, 50);
    auto overlay = mapper.map(page);
    assert(overlay.trim == (Rect{2.5, 2.5, 45, 45}));
    assert(!overlay.bleed);
    assert(overlay.crop == (Rect{0, 0, 50, 50}));
}

int
main()
{
    test_map();
    test_offset_media_box();
    test_page();
    std::cout << "overlay tests passed" << std::endl;
    return 0;
}
