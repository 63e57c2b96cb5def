#include "sdl_painter.h"
#include "draw_utils.h"
#include "viewport.h"
#include "our_debug.h"

#include <SDL.h>
#include <SDL_ttf.h>

#include <cmath>

static void draw_text(SDL_Renderer* ren, TTF_Font* font, const DrawCmd& c)
{
    if (!font || c.text.empty() || c.points.empty()) return;
    SDL_Color col{c.color.r, c.color.g, c.color.b, c.alpha};
    SDL_Surface* s = TTF_RenderUTF8_Blended(font, c.text.c_str(), col);
    if (!s) { DBG("TTF_RenderUTF8_Blended: %s", TTF_GetError()); return; }
    SDL_Texture* t = SDL_CreateTextureFromSurface(ren, s);
    if (t) {
        SDL_Rect dst{(int)c.points[0].x, (int)c.points[0].y, s->w, s->h};
        SDL_RenderCopy(ren, t, nullptr, &dst);
        SDL_DestroyTexture(t);
    }
    SDL_FreeSurface(s);
}

void SdlPainter::present(const DrawList& dl)
{
    SDL_Renderer* ren = vp_.renderer();
    if (!ren) return;
    TTF_Font* font = vp_.font();

    for (const auto& c : dl) {
        SDL_SetRenderDrawColor(ren, c.color.r, c.color.g, c.color.b, c.alpha);
        switch (c.kind) {
            case DrawCmd::Kind::CLEAR:
                SDL_RenderClear(ren);
                break;
            case DrawCmd::Kind::FILL_CIRCLE:
                if (!c.points.empty())
                    draw_circle_filled(ren, (int)c.points[0].x, (int)c.points[0].y, c.radius);
                break;
            case DrawCmd::Kind::FILL_POLYGON:
                fill_polygon(ren, c.points);
                break;
            case DrawCmd::Kind::OUTLINE_POLYGON:
                draw_polygon_outline(ren, c.points, c.width);
                break;
            case DrawCmd::Kind::LINE:
                if (c.points.size() >= 2)
                    draw_thick_line(ren, c.points[0].x, c.points[0].y, c.points[1].x, c.points[1].y, c.width);
                break;
            case DrawCmd::Kind::TEXT:
                draw_text(ren, font, c);
                break;
        }
    }
    SDL_RenderPresent(ren);
}
