#include "switchyard/variants/shapes.h"

namespace switchyard {
namespace variants {

std::string Circle::perform() {
    return "Drawing a circle";
}

std::string Square::perform() {
    return "Drawing a square";
}

std::string Triangle::perform() {
    return "Drawing a triangle";
}

void registerShapeVariants(core::Registry<ShapeCapability>& registry) {
    registry.registerType<Circle>("circle");
    registry.registerType<Square>("square");
    registry.registerType<Triangle>("triangle");
}

} // namespace variants
} // namespace switchyard
