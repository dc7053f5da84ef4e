#include "evidenceforge/draw.hpp"
#include "evidenceforge/font5x7.hpp"

#include <algorithm>

namespace ef {

void fill_rect(Raster& img, int x0, int y0, int x1, int y1, Rgb8 c)
{
    if (img.empty()) return;
    x0 = std::max(x0,0); y0 = std::max(y0,0);
    x1 = std::min(x1,img.width-1); y1 = std::min(y1,img.height-1);
    for (int y=y0; y<=y1; ++y)
        for (int x=x0; x<=x1; ++x) img.set(x,y,c);
}

void draw_rect(Raster& img, int x0, int y0, int x1, int y1, Rgb8 c)
{
    if (img.empty()) return;
    x0 = std::clamp(x0,0,img.width-1);  x1 = std::clamp(x1,0,img.width-1);
    y0 = std::clamp(y0,0,img.height-1); y1 = std::clamp(y1,0,img.height-1);
    if (x0>x1 || y0>y1) return;
    for (int x=x0; x<=x1; ++x){ img.set(x,y0,c); img.set(x,y1,c); }
    for (int y=y0; y<=y1; ++y){ img.set(x0,y,c); img.set(x1,y,c); }
}

void draw_hline(Raster& img, int x0, int x1, int y, Rgb8 c, int thickness)
{
    int half = thickness/2;
    fill_rect(img, std::min(x0,x1), y-half, std::max(x0,x1), y-half+thickness-1, c);
}

void draw_vline(Raster& img, int x, int y0, int y1, Rgb8 c, int thickness)
{
    int half = thickness/2;
    fill_rect(img, x-half, std::min(y0,y1), x-half+thickness-1, std::max(y0,y1), c);
}

int text_width(const std::string& text, int scale)
{
    if (text.empty()) return 0;
    return int(text.size()) * font5x7::ADVANCE * scale - scale;
}

int text_height(int scale) { return font5x7::GLYPH_H * scale; }

void draw_text(Raster& img, int x, int y, const std::string& text, Rgb8 c, int scale)
{
    int pen = x;
    for (char ch : text) {
        const font5x7::Glyph g = font5x7::glyph(ch);
        for (int row=0; row<font5x7::GLYPH_H; ++row)
            for (int col=0; col<font5x7::GLYPH_W; ++col) {
                if (!font5x7::bit(g,row,col)) continue;
                for (int sy=0; sy<scale; ++sy)
                    for (int sx=0; sx<scale; ++sx) {
                        int px = pen + col*scale + sx, py = y + row*scale + sy;
                        if (img.contains(px,py)) img.set(px,py,c);
                    }
            }
        pen += font5x7::ADVANCE * scale;
    }
}

void draw_label(Raster& img, int x, int y, const std::string& text, Rgb8 c, int pad)
{
    fill_rect(img, x, y, x + text_width(text) + 2*pad - 1, y + text_height() + 2*pad - 1, palette::black);
    draw_text(img, x + pad, y + pad, text, c);
}

void paste(Raster& dst, const Raster& src, int x, int y)
{
    for (int sy=0; sy<src.height; ++sy) {
        int dy = y + sy;
        if (dy < 0 || dy >= dst.height) continue;
        for (int sx=0; sx<src.width; ++sx) {
            int dx = x + sx;
            if (dx < 0 || dx >= dst.width) continue;
            const uint8_t* s = src.px(sx,sy);
            uint8_t* d = dst.px(dx,dy);
            d[0]=s[0]; d[1]=s[1]; d[2]=s[2];
        }
    }
}

} // namespace ef
