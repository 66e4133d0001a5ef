#pragma once
#include "Bounds.hpp"
#include <array>
#include <cstdint>
#include <vector>

class ParticleSystem;

// Point-region quadtree rebuilt from scratch every tick. Nodes live in one
// arena and refer to their children by index; no node outlives a rebuild.
class QuadTree {
public:
    static constexpr uint32_t NO_NODE = UINT32_MAX;
    static constexpr size_t DEFAULT_LEAF_CAPACITY = 4;
    static constexpr size_t DEFAULT_DEPTH_LIMIT = 16;

    struct Node {
        double min_x, min_y, size;      // square region, half-open on both axes
        double total_mass;
        double com_x, com_y;
        std::array<uint32_t, 4> children;  // SW, SE, NW, NE
        std::vector<uint32_t> particles;   // leaf residents (non-owning indices)
        uint16_t depth;
        bool is_leaf;

        Node()
            : min_x(0.0), min_y(0.0), size(0.0)
            , total_mass(0.0), com_x(0.0), com_y(0.0)
            , children{NO_NODE, NO_NODE, NO_NODE, NO_NODE}
            , depth(0), is_leaf(true)
        {}

        geom::Square region() const { return geom::Square{min_x, min_y, size}; }
    };

    struct QuadTreeBox {
        double min_x, min_y, max_x, max_y;
        int depth;
        int particle_count;
        bool is_leaf;

        QuadTreeBox(double minX, double minY, double maxX, double maxY, int d, int count, bool leaf)
            : min_x(minX), min_y(minY), max_x(maxX), max_y(maxY)
            , depth(d), particle_count(count), is_leaf(leaf) {}
    };

    explicit QuadTree(size_t leaf_capacity = DEFAULT_LEAF_CAPACITY,
                      size_t depth_limit = DEFAULT_DEPTH_LIMIT);

    // Drops every node and inserts all particles of `particles` into `region`.
    void build(const ParticleSystem& particles, const geom::Square& region);

    // Starts an empty tree over `region`; insert() then adds particles one at a time.
    void reset(const ParticleSystem& particles, const geom::Square& region);
    void insert(uint32_t particle_index);

    void clear();

    bool empty() const { return nodes_.empty(); }
    uint32_t root() const { return nodes_.empty() ? NO_NODE : 0u; }
    const Node& node(uint32_t index) const { return nodes_[index]; }
    const std::vector<Node>& nodes() const { return nodes_; }
    size_t node_count() const { return nodes_.size(); }
    size_t leaf_capacity() const { return leaf_capacity_; }
    size_t depth_limit() const { return depth_limit_; }
    int max_depth() const;

    // Leaf that holds (or would hold) the point
    uint32_t locate(double x, double y) const;

    std::vector<QuadTreeBox> get_quadtree_boxes() const;

private:
    uint32_t create_node(const geom::Square& region, uint16_t depth);
    void insert_into(uint32_t node_index, uint32_t particle_index);
    void subdivide(uint32_t node_index);
    int child_slot(const Node& node, double x, double y) const;
    void refresh_leaf(uint32_t node_index);
    void refresh_internal(uint32_t node_index);

    size_t leaf_capacity_;
    size_t depth_limit_;
    std::vector<Node> nodes_;

    // Source arrays of the current build
    const double* pos_x_;
    const double* pos_y_;
    const double* mass_;
};
