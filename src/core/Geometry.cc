#include "dojo/core/Geometry.hh"

namespace dojo {

Rect::Rect(float x, float y, float w, float h) : x(x), y(y), w(w), h(h) {}

float Rect::left() const {
    return x;
}

float Rect::right() const {
    return x + w;
}

float Rect::top() const {
    return y;
}

float Rect::bottom() const {
    return y + h;
}

float Rect::centerX() const {
    return x + w * 0.5f;
}

float Rect::centerY() const {
    return y + h * 0.5f;
}

bool Rect::intersects(const Rect& other) const {
    return x < other.x + other.w && x + w > other.x && y < other.y + other.h && y + h > other.y;
}

bool Rect::contains(float px, float py) const {
    return px >= x && px <= x + w && py >= y && py <= y + h;
}

} // namespace dojo
