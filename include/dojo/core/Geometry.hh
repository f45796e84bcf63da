#pragma once

namespace dojo {

// Screen-space axis-aligned rectangle: (x, y) is the top-left corner, y grows downward.
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    Rect() = default;
    Rect(float x, float y, float w, float h);

    float left() const;
    float right() const;
    float top() const;
    float bottom() const;
    float centerX() const;
    float centerY() const;

    // Strict overlap: touching edges do not intersect.
    bool intersects(const Rect& other) const;
    bool contains(float px, float py) const;
};

} // namespace dojo
