#include "border_render.h"

#include <cmath>

static float clampf(float v, float lo, float hi)
{
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

static int pct_to_px(float pct, int len)
{
    const int px = static_cast<int>(lroundf(pct * static_cast<float>(len) / 100.0f));
    if (px < 0) return 0;
    if (px > len) return len;
    return px;
}

// Signed distance to a rounded box centered at (cx, cy); negative inside.
static float sd_rounded_box(float px, float py, float cx, float cy, float hw, float hh, float r)
{
    const float dx = fabsf(px - cx) - hw + r;
    const float dy = fabsf(py - cy) - hh + r;
    const float mx = fmaxf(dx, 0.0f);
    const float my = fmaxf(dy, 0.0f);
    return fminf(fmaxf(dx, dy), 0.0f) + sqrtf(mx * mx + my * my) - r;
}

// Coverage of pixel center (px, py) against a quarter circle centered at
// (ccx, ccy) with radius r. 1 well inside, 0 outside, AA over one pixel.
static float corner_coverage(float px, float py, float ccx, float ccy, float r)
{
    const float dx = px - ccx;
    const float dy = py - ccy;
    const float dist = sqrtf(dx * dx + dy * dy);
    return clampf(r + 0.5f - dist, 0.0f, 1.0f);
}

PixelRect border_segment_rect(const BorderSegment& seg, const PixelRect& box, int width_px)
{
    const bool horizontal = (seg.side == BorderSide::TOP || seg.side == BorderSide::BOTTOM);
    const int  side_len = horizontal ? box.w : box.h;
    const int  a0 = pct_to_px(seg.offset_pct, side_len);
    const int  a1 = pct_to_px(seg.offset_pct + seg.length_pct, side_len);
    const int  span = a1 - a0;

    switch (seg.side) {
    case BorderSide::TOP:
        return PixelRect{box.x + a0, box.y, span, width_px};
    case BorderSide::RIGHT:
        return PixelRect{box.x + box.w - width_px, box.y + a0, width_px, span};
    case BorderSide::BOTTOM:
        return PixelRect{box.x + box.w - a1, box.y + box.h - width_px, span, width_px};
    case BorderSide::LEFT:
        return PixelRect{box.x, box.y + box.h - a1, width_px, span};
    }
    return PixelRect{};
}

CornerRadii border_segment_radii(const BorderSegment& seg, const PixelRect& rect, float radius_px)
{
    CornerRadii r;
    const float rad = fmaxf(radius_px, 0.0f);
    if (seg.corners & CORNER_TOP_LEFT) r.top_left = rad;
    if (seg.corners & CORNER_TOP_RIGHT) r.top_right = rad;
    if (seg.corners & CORNER_BOTTOM_RIGHT) r.bottom_right = rad;
    if (seg.corners & CORNER_BOTTOM_LEFT) r.bottom_left = rad;

    float      f = 1.0f;
    const auto fit = [&f](float len, float sum) {
        if (sum > 0.0f && len / sum < f) f = len / sum;
    };
    const float w = static_cast<float>(rect.w);
    const float h = static_cast<float>(rect.h);
    fit(w, r.top_left + r.top_right);
    fit(w, r.bottom_left + r.bottom_right);
    fit(h, r.top_left + r.bottom_left);
    fit(h, r.top_right + r.bottom_right);

    if (f < 1.0f) {
        r.top_left *= f;
        r.top_right *= f;
        r.bottom_right *= f;
        r.bottom_left *= f;
    }
    return r;
}

void canvas_fill_rect(Canvas& cv, const PixelRect& r, Rgb color)
{
    if (!cv.buf) return;
    const pixel_t p = px_from(color);
    for (int y = r.y; y < r.y + r.h; y++) {
        if (y < 0 || y >= cv.h) continue;
        for (int x = r.x; x < r.x + r.w; x++) {
            if (x < 0 || x >= cv.w) continue;
            cv.at(x, y) = p;
        }
    }
}

void canvas_fill_rounded_rect(Canvas& cv, const PixelRect& r, const CornerRadii& radii, Rgb color)
{
    if (!cv.buf || r.w <= 0 || r.h <= 0) return;

    const float x0 = static_cast<float>(r.x);
    const float y0 = static_cast<float>(r.y);
    const float x1 = static_cast<float>(r.x + r.w);
    const float y1 = static_cast<float>(r.y + r.h);

    for (int y = r.y; y < r.y + r.h; y++) {
        if (y < 0 || y >= cv.h) continue;
        const float py = static_cast<float>(y) + 0.5f;
        for (int x = r.x; x < r.x + r.w; x++) {
            if (x < 0 || x >= cv.w) continue;
            const float px = static_cast<float>(x) + 0.5f;

            float a = 1.0f;
            if (radii.top_left > 0.0f && px < x0 + radii.top_left && py < y0 + radii.top_left) {
                a = corner_coverage(px, py, x0 + radii.top_left, y0 + radii.top_left, radii.top_left);
            } else if (radii.top_right > 0.0f && px > x1 - radii.top_right && py < y0 + radii.top_right) {
                a = corner_coverage(px, py, x1 - radii.top_right, y0 + radii.top_right, radii.top_right);
            } else if (radii.bottom_right > 0.0f && px > x1 - radii.bottom_right && py > y1 - radii.bottom_right) {
                a = corner_coverage(px, py, x1 - radii.bottom_right, y1 - radii.bottom_right, radii.bottom_right);
            } else if (radii.bottom_left > 0.0f && px < x0 + radii.bottom_left && py > y1 - radii.bottom_left) {
                a = corner_coverage(px, py, x0 + radii.bottom_left, y1 - radii.bottom_left, radii.bottom_left);
            }

            if (a <= 0.0f) continue;
            cv.at(x, y) = px_blend(cv.at(x, y), color, a);
        }
    }
}

void border_render_segments(Canvas& cv, const PixelRect& box, const BorderSegment* segs, std::size_t count,
                            int width_px, float radius_px)
{
    if (!cv.buf || !segs || width_px <= 0) return;
    for (std::size_t i = 0; i < count; i++) {
        const PixelRect rect = border_segment_rect(segs[i], box, width_px);
        if (rect.w <= 0 || rect.h <= 0) continue;
        canvas_fill_rounded_rect(cv, rect, border_segment_radii(segs[i], rect, radius_px), segs[i].color);
    }
}

void border_render_glow(Canvas& cv, const PixelRect& box, float radius_px, Rgb color, int spread_px, float opacity)
{
    if (!cv.buf || spread_px <= 0 || opacity <= 0.0f) return;

    const float hw = static_cast<float>(box.w) / 2.0f;
    const float hh = static_cast<float>(box.h) / 2.0f;
    const float cx = static_cast<float>(box.x) + hw;
    const float cy = static_cast<float>(box.y) + hh;
    const float r = clampf(radius_px, 0.0f, fminf(hw, hh));
    const float spread = static_cast<float>(spread_px);
    const float op = clampf(opacity, 0.0f, 1.0f);

    for (int y = box.y - spread_px; y < box.y + box.h + spread_px; y++) {
        if (y < 0 || y >= cv.h) continue;
        const float py = static_cast<float>(y) + 0.5f;
        for (int x = box.x - spread_px; x < box.x + box.w + spread_px; x++) {
            if (x < 0 || x >= cv.w) continue;
            // d <= 0 is the box itself (border + content), left untouched.
            const float d = sd_rounded_box(static_cast<float>(x) + 0.5f, py, cx, cy, hw, hh, r);
            if (d <= 0.0f || d >= spread) continue;
            const float t = 1.0f - d / spread;
            cv.at(x, y) = px_blend(cv.at(x, y), color, t * t * op);
        }
    }
}
