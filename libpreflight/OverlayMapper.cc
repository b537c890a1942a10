#include <preflight/OverlayMapper.hh>

OverlayMapper::OverlayMapper(PageBox const& media_box, double scale, int bitmap_height) :
    media_box(media_box),
    scale(scale),
    bitmap_height(bitmap_height)
{
}

OverlayMapper::Rect
OverlayMapper::map(PageBox const& box) const
{
    Rect r;
    r.x = (box.x - media_box.x) * scale;
    r.y = bitmap_height - (box.y + box.height - media_box.y) * scale;
    r.width = box.width * scale;
    r.height = box.height * scale;
    return r;
}

OverlayMapper::Overlay
OverlayMapper::map(PageInfo const& page) const
{
    Overlay result;
    if (page.trim_box) {
        result.trim = map(*page.trim_box);
    }
    if (page.bleed_box) {
        result.bleed = map(*page.bleed_box);
    }
    if (page.crop_box) {
        result.crop = map(*page.crop_box);
    }
    return result;
}
