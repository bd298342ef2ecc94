#pragma once

#include "switchyard/core/capability.h"
#include "switchyard/core/registry.h"
#include <string>

namespace switchyard {
namespace variants {

/// Draws a shape and describes what was drawn.
using ShapeCapability = core::Capability<void, std::string>;

class Circle : public ShapeCapability {
public:
    std::string name() const override { return "circle"; }
    std::string perform() override;
};

class Square : public ShapeCapability {
public:
    std::string name() const override { return "square"; }
    std::string perform() override;
};

class Triangle : public ShapeCapability {
public:
    std::string name() const override { return "triangle"; }
    std::string perform() override;
};

/// Registers "circle", "square" and "triangle".
void registerShapeVariants(core::Registry<ShapeCapability>& registry);

} // namespace variants
} // namespace switchyard
