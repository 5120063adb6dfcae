/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/NavGrid.hpp"
#include "ai/pathfinding/PathSmoother.hpp"
#include "core/Logger.hpp"
#include "world/SpatialQueryAdapter.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>

namespace SwarmForge {

namespace {
// Search radius (cells) when a start or goal lands inside geometry
constexpr int NUDGE_RADIUS = 4;
} // namespace

NavGrid::NavGrid(int width, int depth, float cellSize, const Vector3D& origin)
    : m_w(std::max(1, width)), m_d(std::max(1, depth)),
      m_cell(cellSize > 0.0f ? cellSize : 1.0f), m_origin(origin),
      m_cells(static_cast<size_t>(m_w * m_d), Cell::Open),
      m_surface(static_cast<size_t>(m_w * m_d), origin.getY()) {}

bool NavGrid::inBounds(int gx, int gz) const {
    return gx >= 0 && gx < m_w && gz >= 0 && gz < m_d;
}

bool NavGrid::isBlocked(int gx, int gz) const {
    if (!inBounds(gx, gz)) return true;
    return m_cells[index(gx, gz)] == Cell::Blocked;
}

bool NavGrid::isJump(int gx, int gz) const {
    return inBounds(gx, gz) && m_cells[index(gx, gz)] == Cell::Jump;
}

void NavGrid::setCell(int gx, int gz, Cell cell) {
    if (!inBounds(gx, gz)) return;
    m_cells[index(gx, gz)] = cell;
}

NavGrid::Cell NavGrid::getCell(int gx, int gz) const {
    return inBounds(gx, gz) ? m_cells[index(gx, gz)] : Cell::Blocked;
}

bool NavGrid::isWorldBlocked(const Vector3D& pos) const {
    auto [gx, gz] = worldToGrid(pos);
    return isBlocked(gx, gz);
}

std::pair<int, int> NavGrid::worldToGrid(const Vector3D& w) const {
    int gx = static_cast<int>(std::floor((w.getX() - m_origin.getX()) / m_cell));
    int gz = static_cast<int>(std::floor((w.getZ() - m_origin.getZ()) / m_cell));
    return {gx, gz};
}

Vector3D NavGrid::gridToWorld(int gx, int gz) const {
    float wx = m_origin.getX() + gx * m_cell + m_cell * 0.5f;
    float wz = m_origin.getZ() + gz * m_cell + m_cell * 0.5f;
    float wy = inBounds(gx, gz) ? m_surface[index(gx, gz)] : m_origin.getY();
    return Vector3D(wx, wy, wz);
}

void NavGrid::rebuildFromWorld(const SpatialQueryAdapter& queries, float stepHeight,
                               float maxJumpHeight, float scanHeight) {
    const float base = m_origin.getY();
    size_t blocked = 0;
    size_t jumps = 0;

    for (int gz = 0; gz < m_d; ++gz) {
        for (int gx = 0; gx < m_w; ++gx) {
            const Vector3D center = gridToWorld(gx, gz);
            const Vector3D top(center.getX(), base + scanHeight, center.getZ());
            auto ground = queries.findGround(top, scanHeight + maxJumpHeight + 10.0f);

            const size_t i = index(gx, gz);
            if (!ground) {
                m_cells[i] = Cell::Blocked;
                m_surface[i] = base;
                ++blocked;
                continue;
            }

            const float height = ground->getY() - base;
            m_surface[i] = ground->getY();
            if (height <= stepHeight) {
                m_cells[i] = Cell::Open;
            } else if (height <= maxJumpHeight) {
                m_cells[i] = Cell::Jump;
                ++jumps;
            } else {
                m_cells[i] = Cell::Blocked;
                ++blocked;
            }
        }
    }

    PATHFIND_INFO(std::format("NavGrid rebuilt: {}x{} cells, {} blocked, {} jump", m_w, m_d,
                              blocked, jumps));
}

bool NavGrid::findNearestOpen(int gx, int gz, int maxRadius, int& outGX, int& outGZ) const {
    if (inBounds(gx, gz) && !isBlocked(gx, gz)) { outGX = gx; outGZ = gz; return true; }
    for (int r = 1; r <= maxRadius; ++r) {
        for (int dz = -r; dz <= r; ++dz) {
            int z = gz + dz;
            int x1 = gx - r;
            int x2 = gx + r;
            if (inBounds(x1, z) && !isBlocked(x1, z)) { outGX = x1; outGZ = z; return true; }
            if (inBounds(x2, z) && !isBlocked(x2, z)) { outGX = x2; outGZ = z; return true; }
        }
        for (int dx = -r + 1; dx <= r - 1; ++dx) {
            int x = gx + dx;
            int z1 = gz - r;
            int z2 = gz + r;
            if (inBounds(x, z1) && !isBlocked(x, z1)) { outGX = x; outGZ = z1; return true; }
            if (inBounds(x, z2) && !isBlocked(x, z2)) { outGX = x; outGZ = z2; return true; }
        }
    }
    return false;
}

// Jump cells break sight lines so shortcuts never skip the take-off point
bool NavGrid::hasLineOfSight(int sx, int sz, int ex, int ez) const {
    int dx = std::abs(ex - sx), dz = std::abs(ez - sz);
    int x = sx, z = sz;
    int xStep = (ex > sx) ? 1 : -1;
    int zStep = (ez > sz) ? 1 : -1;
    const bool startOnJump = isJump(sx, sz);

    auto passable = [&](int cx, int cz) {
        if (isBlocked(cx, cz)) return false;
        if (cx == sx && cz == sz) return true;
        return !startOnJump && !isJump(cx, cz);
    };

    if (dx > dz) {
        int err = dx / 2;
        while (x != ex) {
            if (!passable(x, z)) return false;
            err -= dz;
            if (err < 0) { z += zStep; err += dx; }
            x += xStep;
        }
    } else {
        int err = dz / 2;
        while (z != ez) {
            if (!passable(x, z)) return false;
            err -= dx;
            if (err < 0) { x += xStep; err += dz; }
            z += zStep;
        }
    }

    return passable(ex, ez);
}

void NavGrid::shortcutPath(std::vector<std::pair<int, int>>& cells) const {
    if (cells.size() <= 2) return;

    std::vector<std::pair<int, int>> smoothed;
    smoothed.reserve(cells.size());
    smoothed.push_back(cells[0]);

    size_t i = 0;
    while (i < cells.size() - 1) {
        size_t farthest = i + 1;
        for (size_t j = i + 2; j < cells.size(); ++j) {
            if (hasLineOfSight(cells[i].first, cells[i].second, cells[j].first, cells[j].second)) {
                farthest = j;
            } else {
                break;
            }
        }
        smoothed.push_back(cells[farthest]);
        i = farthest;
    }

    cells = std::move(smoothed);
}

void NavGrid::emitWaypoints(const std::vector<std::pair<int, int>>& cells, const Vector3D& start,
                            const Vector3D& goal, bool exactGoal,
                            std::vector<Waypoint>& outPath) const {
    outPath.clear();
    outPath.reserve(cells.size() + 1);

    for (size_t i = 0; i < cells.size(); ++i) {
        auto [cx, cz] = cells[i];
        Waypoint wp;
        wp.position = gridToWorld(cx, cz);
        if (i == 0) {
            wp.position = start.withY(wp.position.getY());
        } else if (i + 1 == cells.size() && exactGoal) {
            wp.position = goal.withY(wp.position.getY());
        }
        if (i > 0 && isJump(cx, cz) && !isJump(cells[i - 1].first, cells[i - 1].second)) {
            wp.action = WaypointAction::Jump;
        }
        outPath.push_back(wp);
    }

    // A single-cell route still needs a distinct goal waypoint
    if (cells.size() == 1) {
        Waypoint last;
        last.position = exactGoal ? goal.withY(outPath.front().position.getY())
                                  : gridToWorld(cells[0].first, cells[0].second);
        outPath.push_back(last);
    }

    PathSmoother::simplify(outPath);
}

PathfindingResult NavGrid::computePath(const Vector3D& start, const Vector3D& goal,
                                       std::vector<Waypoint>& outPath) {
    outPath.clear();
    m_stats.totalRequests++;

    auto [sx, sz] = worldToGrid(start);
    auto [gx, gz] = worldToGrid(goal);

    if (!inBounds(sx, sz)) {
        PATHFIND_DEBUG(std::format("computePath: INVALID_START - grid coords ({},{}) out of bounds",
                                   sx, sz));
        m_stats.invalidStarts++;
        return PathfindingResult::INVALID_START;
    }
    if (!inBounds(gx, gz)) {
        PATHFIND_DEBUG(std::format("computePath: INVALID_GOAL - grid coords ({},{}) out of bounds",
                                   gx, gz));
        m_stats.invalidGoals++;
        return PathfindingResult::INVALID_GOAL;
    }

    // Nudge start/goal if blocked (agents pressed against walls)
    int nsx = sx, nsz = sz, ngx = gx, ngz = gz;
    if (!findNearestOpen(sx, sz, NUDGE_RADIUS, nsx, nsz)) {
        m_stats.invalidStarts++;
        return PathfindingResult::INVALID_START;
    }
    if (!findNearestOpen(gx, gz, NUDGE_RADIUS, ngx, ngz)) {
        m_stats.noPathFound++;
        return PathfindingResult::NO_PATH_FOUND;
    }
    const bool exactGoal = (ngx == gx && ngz == gz);
    sx = nsx; sz = nsz; gx = ngx; gz = ngz;

    std::vector<std::pair<int, int>> cells;

    if (sx == gx && sz == gz) {
        cells.emplace_back(sx, sz);
        emitWaypoints(cells, start, goal, exactGoal, outPath);
        m_stats.successfulPaths++;
        m_stats.totalIterations += 1;
        return PathfindingResult::SUCCESS;
    }

    // Line-of-sight shortcut: direct path over open terrain
    if (hasLineOfSight(sx, sz, gx, gz)) {
        cells.emplace_back(sx, sz);
        cells.emplace_back(gx, gz);
        emitWaypoints(cells, start, goal, exactGoal, outPath);
        m_stats.successfulPaths++;
        m_stats.totalIterations += 2;
        return PathfindingResult::SUCCESS;
    }

    const int W = m_w;
    auto idx = [&](int x, int z) { return z * W + x; };
    auto h = [&](int x, int z) {
        int dx = std::abs(x - gx); int dz = std::abs(z - gz);
        int dmin = std::min(dx, dz); int dmax = std::max(dx, dz);
        return m_costDiagonal * dmin + m_costStraight * (dmax - dmin);
    };

    m_pool.reset(static_cast<size_t>(m_w * m_d));
    auto& open = m_pool.openQueue;
    auto& gScore = m_pool.gScoreBuffer;
    auto& parent = m_pool.parentBuffer;
    auto& closed = m_pool.closedBuffer;

    const int sIdx = idx(sx, sz);
    gScore[static_cast<size_t>(sIdx)] = 0.0f;
    open.push(NodePool::Node{sx, sz, h(sx, sz)});

    int iterations = 0;
    const int dirs = m_allowDiagonal ? 8 : 4;
    constexpr int dx8[8] = {1, -1, 0, 0, 1, 1, -1, -1};
    constexpr int dz8[8] = {0, 0, 1, -1, 1, -1, 1, -1};

    while (!open.empty() && iterations++ < m_maxIterations) {
        NodePool::Node cur = open.top(); open.pop();

        const int cIndex = idx(cur.x, cur.z);
        if (closed[static_cast<size_t>(cIndex)]) continue;
        closed[static_cast<size_t>(cIndex)] = 1;

        if (cur.x == gx && cur.z == gz) {
            int cx = cur.x, cz = cur.z;
            while (!(cx == sx && cz == sz)) {
                cells.emplace_back(cx, cz);
                int p = parent[static_cast<size_t>(idx(cx, cz))];
                if (p < 0) break;
                cz = p / W; cx = p % W;
            }
            cells.emplace_back(sx, sz);
            std::reverse(cells.begin(), cells.end());

            shortcutPath(cells);
            emitWaypoints(cells, start, goal, exactGoal, outPath);

            m_stats.successfulPaths++;
            m_stats.totalIterations += static_cast<uint64_t>(iterations);
            uint64_t totalPathLength = static_cast<uint64_t>(m_stats.avgPathLength) *
                                       (m_stats.successfulPaths - 1) + outPath.size();
            m_stats.avgPathLength = static_cast<uint32_t>(totalPathLength / m_stats.successfulPaths);
            return PathfindingResult::SUCCESS;
        }

        const float gCur = gScore[static_cast<size_t>(cIndex)];

        for (int i = 0; i < dirs; ++i) {
            const int nx = cur.x + dx8[i];
            const int nz = cur.z + dz8[i];
            if (!inBounds(nx, nz)) continue;

            const size_t nIndex = static_cast<size_t>(idx(nx, nz));
            if (closed[nIndex] || isBlocked(nx, nz)) continue;

            // No corner cutting: both orthogonal neighbours must be open
            if (i >= 4 && (isBlocked(cur.x + dx8[i], cur.z) || isBlocked(cur.x, cur.z + dz8[i]))) {
                continue;
            }

            float step = (i < 4) ? m_costStraight : m_costDiagonal;
            if (isJump(nx, nz) && !isJump(cur.x, cur.z)) {
                step += m_costJump;
            }
            const float tentative = gCur + step;
            if (tentative < gScore[nIndex]) {
                parent[nIndex] = cIndex;
                gScore[nIndex] = tentative;
                open.push(NodePool::Node{nx, nz, tentative + h(nx, nz)});
            }
        }
    }

    m_stats.totalIterations += static_cast<uint64_t>(iterations);
    if (!open.empty()) {
        m_stats.timeouts++;
        return PathfindingResult::TIMEOUT;
    }
    m_stats.noPathFound++;
    return PathfindingResult::NO_PATH_FOUND;
}

} // namespace SwarmForge
