#include "vellum/shapes.hpp"
#include <algorithm>

namespace vellum {

void Shape::bounds(Point& min, Point& max) const {
    switch (kind) {
        case Kind::Circle: {
            const Circle& c = data.circle;
            min = {c.center.x - c.radius, c.center.y - c.radius};
            max = {c.center.x + c.radius, c.center.y + c.radius};
            break;
        }
        case Kind::Rectangle:
            min = {std::min(data.rect.a.x, data.rect.b.x), std::min(data.rect.a.y, data.rect.b.y)};
            max = {std::max(data.rect.a.x, data.rect.b.x), std::max(data.rect.a.y, data.rect.b.y)};
            break;
        case Kind::RoundedRectangle:
            min = {std::min(data.rounded.a.x, data.rounded.b.x),
                   std::min(data.rounded.a.y, data.rounded.b.y)};
            max = {std::max(data.rounded.a.x, data.rounded.b.x),
                   std::max(data.rounded.a.y, data.rounded.b.y)};
            break;
    }
}

bool operator==(const Shape& a, const Shape& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case Shape::Kind::Circle:
            return a.data.circle.center == b.data.circle.center &&
                   a.data.circle.radius == b.data.circle.radius;
        case Shape::Kind::Rectangle:
            return a.data.rect.a == b.data.rect.a && a.data.rect.b == b.data.rect.b;
        case Shape::Kind::RoundedRectangle:
            return a.data.rounded.a == b.data.rounded.a &&
                   a.data.rounded.b == b.data.rounded.b &&
                   a.data.rounded.radius == b.data.rounded.radius;
    }
    return false;
}

} // namespace vellum
