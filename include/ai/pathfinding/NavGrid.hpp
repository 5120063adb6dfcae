/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAV_GRID_HPP
#define NAV_GRID_HPP

#include "ai/pathfinding/PathfindingRequest.hpp"
#include <cstdint>
#include <limits>
#include <queue>
#include <utility>
#include <vector>

namespace SwarmForge {

class SpatialQueryAdapter;

/**
 * @brief A* over a uniform grid laid on the XZ ground plane.
 *
 * Cells are open, blocked or jump cells. A jump cell is walkable but sits on
 * a raised obstacle, so entering it from an open cell emits a Jump waypoint.
 */
class NavGrid : public IWaypointPathfinder {
public:
    enum class Cell : uint8_t { Open = 0, Jump = 1, Blocked = 2 };

    /**
     * @param width Cells along X
     * @param depth Cells along Z
     * @param cellSize World units per cell edge
     * @param origin World position of the (0,0) cell corner; Y is the base ground height
     */
    NavGrid(int width, int depth, float cellSize, const Vector3D& origin);

    PathfindingResult computePath(const Vector3D& start, const Vector3D& goal,
                                  std::vector<Waypoint>& outPath) override;

    /**
     * @brief Classify every cell by casting down from scanHeight above the base.
     * @param stepHeight Surfaces up to this above the base are walked onto
     * @param maxJumpHeight Surfaces up to this are jump cells; higher ones block
     */
    void rebuildFromWorld(const SpatialQueryAdapter& queries, float stepHeight,
                          float maxJumpHeight, float scanHeight = 50.0f);

    void setAllowDiagonal(bool allow) { m_allowDiagonal = allow; }
    void setMaxIterations(int maxIters) { m_maxIterations = maxIters; }

    void setCell(int gx, int gz, Cell cell);
    Cell getCell(int gx, int gz) const;
    void setBlocked(int gx, int gz, bool blocked) { setCell(gx, gz, blocked ? Cell::Blocked : Cell::Open); }
    bool isWorldBlocked(const Vector3D& pos) const;

    std::pair<int, int> worldToGrid(const Vector3D& w) const;
    Vector3D gridToWorld(int gx, int gz) const;

    float getCellSize() const { return m_cell; }
    int getWidth() const { return m_w; }
    int getDepth() const { return m_d; }
    const Vector3D& getOrigin() const { return m_origin; }

    struct PathfindingStats {
        uint64_t totalRequests{0};
        uint64_t successfulPaths{0};
        uint64_t timeouts{0};
        uint64_t invalidStarts{0};
        uint64_t invalidGoals{0};
        uint64_t noPathFound{0};
        uint64_t totalIterations{0};
        uint32_t avgPathLength{0};
    };

    void resetStats() { m_stats = PathfindingStats{}; }
    const PathfindingStats& getStats() const { return m_stats; }

private:
    int m_w, m_d;
    float m_cell;
    Vector3D m_origin;
    std::vector<Cell> m_cells;
    std::vector<float> m_surface;    // Ground height per cell

    bool m_allowDiagonal{true};
    int m_maxIterations{12000};
    float m_costStraight{1.0f};
    float m_costDiagonal{1.41421356f};
    float m_costJump{2.0f};          // Extra cost for entering a jump cell

    PathfindingStats m_stats{};

    bool inBounds(int gx, int gz) const;
    bool isBlocked(int gx, int gz) const;
    bool isJump(int gx, int gz) const;
    size_t index(int gx, int gz) const { return static_cast<size_t>(gz * m_w + gx); }

    bool findNearestOpen(int gx, int gz, int maxRadius, int& outGX, int& outGZ) const;
    bool hasLineOfSight(int sx, int sz, int ex, int ez) const;
    void emitWaypoints(const std::vector<std::pair<int, int>>& cells, const Vector3D& start,
                       const Vector3D& goal, bool exactGoal, std::vector<Waypoint>& outPath) const;
    void shortcutPath(std::vector<std::pair<int, int>>& cells) const;

    struct NodePool {
        struct Node { int x; int z; float f; };
        struct Cmp { bool operator()(const Node& a, const Node& b) const { return a.f > b.f; } };

        std::priority_queue<Node, std::vector<Node>, Cmp> openQueue;
        std::vector<float> gScoreBuffer;
        std::vector<int> parentBuffer;
        std::vector<uint8_t> closedBuffer;

        void reset(size_t gridSize) {
            while (!openQueue.empty()) openQueue.pop();
            gScoreBuffer.assign(gridSize, std::numeric_limits<float>::infinity());
            parentBuffer.assign(gridSize, -1);
            closedBuffer.assign(gridSize, 0);
        }
    };

    NodePool m_pool;
};

} // namespace SwarmForge

#endif // NAV_GRID_HPP
