// Device side of rendering: executes a DrawList and presents the frame.
#pragma once

#include "draw_list.h"

class ViewportScaler;

class Presenter {
public:
    virtual ~Presenter() = default;
    virtual void present(const DrawList& dl) = 0;
};

// Paints through whatever renderer and font the scaler currently owns, so a
// resize between frames is picked up without rebinding.
class SdlPainter : public Presenter {
public:
    explicit SdlPainter(const ViewportScaler& vp) : vp_(vp) {}
    void present(const DrawList& dl) override;

private:
    const ViewportScaler& vp_;
};
