/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLAT_WORLD_HPP
#define FLAT_WORLD_HPP

#include "world/SpatialQuery.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace SwarmForge {

struct BoxObstacle {
    uint32_t id{0};
    Vector3D min;
    Vector3D max;
    bool solid{true};
    std::string tag;

    bool contains(const Vector3D& p) const {
        return p.getX() >= min.getX() && p.getX() <= max.getX() &&
               p.getY() >= min.getY() && p.getY() <= max.getY() &&
               p.getZ() >= min.getZ() && p.getZ() <= max.getZ();
    }
};

/**
 * @brief Ground plane plus axis-aligned boxes.
 *
 * Rays starting inside a box ignore that box, so an agent standing on a
 * surface can always cast out of it.
 */
class FlatWorld : public ISpatialQuery {
public:
    explicit FlatWorld(float groundHeight = 0.0f) : m_groundHeight(groundHeight) {}

    std::optional<RaycastHit> raycast(const Vector3D& origin, const Vector3D& direction,
                                      float length, const RaycastFilter& filter) const override;

    uint32_t addBox(const Vector3D& min, const Vector3D& max, bool solid = true,
                    const std::string& tag = {});
    bool removeBox(uint32_t id);
    bool moveBox(uint32_t id, const Vector3D& min, const Vector3D& max);
    void clearBoxes() { m_boxes.clear(); }

    const BoxObstacle* getBox(uint32_t id) const;
    const std::vector<BoxObstacle>& getBoxes() const { return m_boxes; }
    float getGroundHeight() const { return m_groundHeight; }
    void setGroundHeight(float height) { m_groundHeight = height; }

private:
    std::vector<BoxObstacle> m_boxes;
    float m_groundHeight;
    uint32_t m_nextId{1};
};

} // namespace SwarmForge

#endif // FLAT_WORLD_HPP
