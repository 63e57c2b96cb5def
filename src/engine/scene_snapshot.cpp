#include "scene_snapshot.h"

#include <cmath>

namespace {

int fix_finite(double& v, double def) {
    if (std::isfinite(v)) return 0;
    v = def;
    return 1;
}

int fix_range(double& v, double lo, double hi, double def) {
    if (!std::isfinite(v)) { v = def; return 1; }
    if (v < lo) { v = lo; return 1; }
    if (v > hi) { v = hi; return 1; }
    return 0;
}

int fix_size(double& v) {
    if (std::isfinite(v) && v >= 0.0) return 0;
    v = 0.0;
    return 1;
}

} // namespace

int sanitize_snapshot(SceneSnapshot& snap)
{
    const SceneSnapshot def;
    int fixed = 0;
    fixed += fix_finite(snap.player_x, def.player_x);
    fixed += fix_finite(snap.player_y, def.player_y);
    fixed += fix_finite(snap.player_rotation, def.player_rotation);
    fixed += fix_finite(snap.player_vx, def.player_vx);
    fixed += fix_finite(snap.player_vy, def.player_vy);
    fixed += fix_finite(snap.camera_x, def.camera_x);
    fixed += fix_finite(snap.camera_y, def.camera_y);
    fixed += fix_finite(snap.left_gun_angle, def.left_gun_angle);
    fixed += fix_finite(snap.right_gun_angle, def.right_gun_angle);
    fixed += fix_range(snap.left_gun_spool, 0.0, 1.0, def.left_gun_spool);
    fixed += fix_range(snap.right_gun_spool, 0.0, 1.0, def.right_gun_spool);

    for (auto& s : snap.stars) {
        fixed += fix_finite(s.x, 0.0);
        fixed += fix_finite(s.y, 0.0);
        fixed += fix_size(s.size);
        fixed += fix_range(s.twinkle, 0.0, 1.0, 1.0);
    }
    for (auto& p : snap.projectiles) {
        fixed += fix_finite(p.x, 0.0);
        fixed += fix_finite(p.y, 0.0);
        fixed += fix_finite(p.rotation, 0.0);
        fixed += fix_size(p.length);
        fixed += fix_size(p.width);
    }
    return fixed;
}
