#include <doctest/doctest.h>

#include "scene_renderer.h"
#include "color_table.h"

#include <cmath>
#include <vector>

namespace {

double dist(const Vec2& a, const Vec2& b) { return std::hypot(a.x - b.x, a.y - b.y); }

SceneSnapshot centered_snapshot() {
    SceneSnapshot s;
    s.player_x = 400.0;
    s.player_y = 300.0;
    return s;
}

} // namespace

TEST_CASE("SceneRenderer: star polygons have 8 and 12 vertices")
{
    CHECK(star_polygon(0, 0, 10, 4).size() == 8);
    CHECK(star_polygon(0, 0, 10, 6).size() == 12);
}

TEST_CASE("SceneRenderer: star polygon alternates outer and inner radii")
{
    auto pts = star_polygon(50, 60, 10, 4);
    const Vec2 c{50, 60};
    for (size_t i = 0; i < pts.size(); ++i) {
        CHECK(dist(pts[i], c) == doctest::Approx(i % 2 == 0 ? 10.0 : 4.0));
    }
    // First outer point at -45 degrees.
    CHECK(pts[0].x == doctest::Approx(50 + 10 * std::cos(-M_PI / 4)));
    CHECK(pts[0].y == doctest::Approx(60 + 10 * std::sin(-M_PI / 4)));
    // First inner point at 0 degrees.
    CHECK(pts[1].x == doctest::Approx(54.0));
    CHECK(pts[1].y == doctest::Approx(60.0));

    auto six = star_polygon(0, 0, 10, 6);
    CHECK(six[0].x == doctest::Approx(10 * std::cos(-M_PI / 6)));
    CHECK(six[1].x == doctest::Approx(4.0));
    CHECK(six[2].y == doctest::Approx(10 * std::sin(M_PI / 6)));
}

TEST_CASE("SceneRenderer: ship triangle points up at heading 0")
{
    auto tri = ship_triangle(100, 100, 0.0, 1.0);
    CHECK(tri[0].x == doctest::Approx(100));
    CHECK(tri[0].y == doctest::Approx(90));
    CHECK(tri[1].x == doctest::Approx(107.5));
    CHECK(tri[1].y == doctest::Approx(110));
    CHECK(tri[2].x == doctest::Approx(92.5));

    auto right = ship_triangle(100, 100, M_PI / 2, 2.0);
    CHECK(right[0].x == doctest::Approx(120));
    CHECK(right[0].y == doctest::Approx(100));
}

TEST_CASE("SceneRenderer: gun angle is independent of hull rotation")
{
    const double gun_angle = 0.3;
    for (double heading : {0.0, 1.0, -2.0, M_PI}) {
        Vec2 m = gun_mount(200, 200, heading, PHYS_LEFT_GUN_X, PHYS_LEFT_GUN_Y, 1.5);
        Vec2 t = gun_tip(m, gun_angle, 1.5);
        CHECK(std::atan2(t.y - m.y, t.x - m.x) == doctest::Approx(gun_angle));
        CHECK(dist(m, t) == doctest::Approx(15.0));
        // Mount rides on the hull: distance from ship center is fixed.
        CHECK(dist(m, Vec2{200, 200}) == doctest::Approx(12.5 * 1.5));
    }
}

TEST_CASE("SceneRenderer: turning only the guns leaves the hull vertices in place")
{
    SceneSnapshot a = centered_snapshot();
    a.player_rotation = 0.7;
    a.left_gun_angle = -1.0;
    a.right_gun_angle = -2.0;
    SceneSnapshot b = a;
    b.left_gun_angle = 0.5;
    b.right_gun_angle = 2.5;

    const ViewportState vp = make_viewport(1200, 900);
    DrawList da = render_scene(a, vp, RenderStyle());
    DrawList db = render_scene(b, vp, RenderStyle());

    auto layer_cmds = [](const DrawList& dl, Layer layer) {
        std::vector<const DrawCmd*> out;
        for (const auto& c : dl) if (c.layer == layer) out.push_back(&c);
        return out;
    };

    auto ship_a = layer_cmds(da, Layer::SHIP);
    auto ship_b = layer_cmds(db, Layer::SHIP);
    REQUIRE(ship_a.size() == 2);
    REQUIRE(ship_b.size() == 2);
    for (size_t i = 0; i < ship_a.size(); ++i) {
        CHECK(ship_a[i]->kind == ship_b[i]->kind);
        REQUIRE(ship_a[i]->points.size() == 3);
        REQUIRE(ship_b[i]->points.size() == 3);
        for (size_t k = 0; k < 3; ++k) {
            CHECK(ship_a[i]->points[k].x == ship_b[i]->points[k].x);
            CHECK(ship_a[i]->points[k].y == ship_b[i]->points[k].y);
        }
    }

    auto guns_a = layer_cmds(da, Layer::GUNS);
    auto guns_b = layer_cmds(db, Layer::GUNS);
    REQUIRE(guns_a.size() == 2);
    REQUIRE(guns_b.size() == 2);
    for (size_t i = 0; i < 2; ++i) {
        REQUIRE(guns_a[i]->points.size() == 2);
        REQUIRE(guns_b[i]->points.size() == 2);
        // Same mount, different tip.
        CHECK(guns_a[i]->points[0].x == doctest::Approx(guns_b[i]->points[0].x));
        CHECK(guns_a[i]->points[0].y == doctest::Approx(guns_b[i]->points[0].y));
        CHECK(dist(guns_a[i]->points[1], guns_b[i]->points[1]) > 1.0);
    }
}

TEST_CASE("SceneRenderer: gun mounts follow the hull heading")
{
    Vec2 m0 = gun_mount(0, 0, 0.0, PHYS_LEFT_GUN_X, PHYS_LEFT_GUN_Y, 1.0);
    CHECK(m0.x == doctest::Approx(7.5));
    CHECK(m0.y == doctest::Approx(10.0));
    Vec2 m1 = gun_mount(0, 0, M_PI, PHYS_LEFT_GUN_X, PHYS_LEFT_GUN_Y, 1.0);
    CHECK(m1.x == doctest::Approx(-7.5));
    CHECK(m1.y == doctest::Approx(-10.0));
}

TEST_CASE("SceneRenderer: draw order is background, stars, guns, ship, projectiles, HUD")
{
    SceneSnapshot s = centered_snapshot();
    s.stars.push_back(StarView{});
    s.projectiles.push_back(ProjectileView{});
    DrawList dl = render_scene(s, make_viewport(800, 600), RenderStyle());

    REQUIRE(dl.size() >= 7);
    CHECK(dl.front().kind == DrawCmd::Kind::CLEAR);
    for (size_t i = 1; i < dl.size(); ++i) CHECK((int)dl[i - 1].layer <= (int)dl[i].layer);

    int counts[6] = {0, 0, 0, 0, 0, 0};
    for (const auto& c : dl) counts[(int)c.layer]++;
    CHECK(counts[(int)Layer::BACKGROUND] == 1);
    CHECK(counts[(int)Layer::STARS] == 1);
    CHECK(counts[(int)Layer::GUNS] == 2);
    CHECK(counts[(int)Layer::SHIP] == 2);
    CHECK(counts[(int)Layer::PROJECTILES] == 1);
    CHECK(counts[(int)Layer::HUD] == (int)hud_lines(s).size());
}

TEST_CASE("SceneRenderer: ship body is filled black and outlined in the player color")
{
    RenderStyle style;
    style.player = Rgb{1, 2, 3};
    DrawList dl = render_scene(centered_snapshot(), make_viewport(1600, 1200), style);
    const DrawCmd* fill = nullptr;
    const DrawCmd* outline = nullptr;
    for (const auto& c : dl) {
        if (c.layer != Layer::SHIP) continue;
        if (c.kind == DrawCmd::Kind::FILL_POLYGON) fill = &c;
        if (c.kind == DrawCmd::Kind::OUTLINE_POLYGON) outline = &c;
    }
    REQUIRE(fill);
    REQUIRE(outline);
    CHECK(fill->color == Rgb{0, 0, 0});
    CHECK(outline->color == Rgb{1, 2, 3});
    CHECK(outline->width == 3);
    CHECK(fill->points.size() == 3);
}

TEST_CASE("SceneRenderer: logical points are scaled and offset by the camera")
{
    SceneSnapshot s;
    s.camera_x = 100.0;
    s.camera_y = 50.0;
    StarView st;
    st.x = 150.0;
    st.y = 80.0;
    st.size = 3.0;
    st.shape = StarShape::CIRCLE;
    st.twinkle = 1.0;
    s.stars.push_back(st);

    DrawList dl = render_scene(s, make_viewport(1600, 1200), RenderStyle());
    const DrawCmd& c = dl[1];
    REQUIRE(c.kind == DrawCmd::Kind::FILL_CIRCLE);
    CHECK(c.points[0].x == doctest::Approx(100.0));
    CHECK(c.points[0].y == doctest::Approx(60.0));
    CHECK(c.radius == 6);
    CHECK(c.color == Rgb{255, 255, 255});
}

TEST_CASE("SceneRenderer: star shapes and twinkle colors")
{
    SceneSnapshot s;
    StarView a; a.shape = StarShape::FOUR_POINT; a.color = StarColor::WHITE; a.twinkle = 0.0;
    StarView b; b.shape = StarShape::SIX_POINT; b.color = StarColor::CYAN; b.twinkle = 1.0;
    s.stars = {a, b};
    DrawList dl = render_scene(s, make_viewport(800, 600), RenderStyle());
    CHECK(dl[1].kind == DrawCmd::Kind::FILL_POLYGON);
    CHECK(dl[1].points.size() == 8);
    CHECK(dl[1].color == Rgb{127, 127, 127});
    CHECK(dl[2].points.size() == 12);
    CHECK(dl[2].color == Rgb{0, 255, 255});
}

TEST_CASE("SceneRenderer: projectile segment is centered with half its logical length")
{
    SceneSnapshot s;
    ProjectileView p;
    p.x = 200.0;
    p.y = 100.0;
    p.length = 12.0;
    p.width = 6.0;
    p.rotation = 0.0;
    p.color = Rgb{100, 150, 255};
    s.projectiles.push_back(p);

    DrawList dl = render_scene(s, make_viewport(1600, 1200), RenderStyle());
    const DrawCmd* line = nullptr;
    for (const auto& c : dl) if (c.layer == Layer::PROJECTILES) line = &c;
    REQUIRE(line);
    CHECK(line->kind == DrawCmd::Kind::LINE);
    CHECK(dist(line->points[0], line->points[1]) == doctest::Approx(12.0));
    CHECK((line->points[0].x + line->points[1].x) / 2 == doctest::Approx(400.0));
    CHECK((line->points[0].y + line->points[1].y) / 2 == doctest::Approx(200.0));
    CHECK(line->width == 18);
    CHECK(line->color == Rgb{100, 150, 255});
}

TEST_CASE("SceneRenderer: stroke width never drops below one device pixel")
{
    CHECK(stroke_width(1.0, 0.1) == 1);
    CHECK(stroke_width(3.0, 1.0) == 5);
    CHECK(stroke_width(1.0, 2.0) == 3);
}

TEST_CASE("SceneRenderer: HUD lines sit at the fixed anchor and ignore scale")
{
    SceneSnapshot s = centered_snapshot();
    s.left_gun_spool = 0.5;
    s.right_gun_spool = 1.0;
    RenderStyle style;
    DrawList dl = render_scene(s, make_viewport(2400, 1800), style);
    int i = 0;
    for (const auto& c : dl) {
        if (c.layer != Layer::HUD) continue;
        CHECK(c.kind == DrawCmd::Kind::TEXT);
        CHECK(c.points[0].x == doctest::Approx(10.0));
        CHECK(c.points[0].y == doctest::Approx(10.0 + 30.0 * i));
        ++i;
    }
    auto lines = hud_lines(s);
    CHECK(lines[0] == "Player: (400.0, 300.0)");
    CHECK(lines[2].find("50%") != std::string::npos);
    CHECK(lines[2].find("100%") != std::string::npos);
}
