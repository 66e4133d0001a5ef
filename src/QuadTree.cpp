#include "QuadTree.h"
#include "ParticleSystem.h"
#include <Eigen/Dense>
#include <algorithm>
#include <utility>

QuadTree::QuadTree(size_t leaf_capacity, size_t depth_limit)
    : leaf_capacity_(std::max<size_t>(1, leaf_capacity)),
      depth_limit_(std::max<size_t>(1, depth_limit)),
      pos_x_(nullptr), pos_y_(nullptr), mass_(nullptr) {
    nodes_.reserve(64);
}

void QuadTree::clear() {
    nodes_.clear();
    pos_x_ = pos_y_ = mass_ = nullptr;
}

void QuadTree::reset(const ParticleSystem& particles, const geom::Square& region) {
    nodes_.clear();
    pos_x_ = particles.get_positions_x().data();
    pos_y_ = particles.get_positions_y().data();
    mass_ = particles.get_masses().data();
    create_node(region, 0);
}

void QuadTree::build(const ParticleSystem& particles, const geom::Square& region) {
    const size_t N = particles.get_particle_count();
    nodes_.reserve(std::max<size_t>(64, (N * 8) / leaf_capacity_));
    reset(particles, region);
    for (size_t i = 0; i < N; ++i) {
        insert(static_cast<uint32_t>(i));
    }
}

void QuadTree::insert(uint32_t particle_index) {
    if (nodes_.empty()) return;
    insert_into(0, particle_index);
}

uint32_t QuadTree::create_node(const geom::Square& region, uint16_t depth) {
    Node node;
    node.min_x = region.min_x;
    node.min_y = region.min_y;
    node.size = region.size;
    node.com_x = region.center_x();
    node.com_y = region.center_y();
    node.depth = depth;
    nodes_.push_back(std::move(node));
    return static_cast<uint32_t>(nodes_.size() - 1);
}

// Equivalent to the half-open contains() test for points inside the node;
// points outside the root land in the nearest quadrant instead of being lost.
int QuadTree::child_slot(const Node& node, double x, double y) const {
    const double cx = node.min_x + 0.5 * node.size;
    const double cy = node.min_y + 0.5 * node.size;
    const int east = (x >= cx) ? 1 : 0;
    const int north = (y >= cy) ? 1 : 0;
    return (north << 1) | east;
}

void QuadTree::insert_into(uint32_t node_index, uint32_t particle_index) {
    {
        Node& node = nodes_[node_index];
        if (node.is_leaf) {
            const bool at_depth_limit = node.depth >= depth_limit_;
            if (node.particles.size() < leaf_capacity_ || at_depth_limit) {
                node.particles.push_back(particle_index);
                refresh_leaf(node_index);
                return;
            }
            subdivide(node_index);
        }
    }

    // nodes_ may have grown in subdivide(); never hold a reference across it
    const Node& node = nodes_[node_index];
    const uint32_t child = node.children[child_slot(node, pos_x_[particle_index], pos_y_[particle_index])];
    insert_into(child, particle_index);
    refresh_internal(node_index);
}

void QuadTree::subdivide(uint32_t node_index) {
    const geom::Square region = nodes_[node_index].region();
    const uint16_t child_depth = static_cast<uint16_t>(nodes_[node_index].depth + 1);

    for (int quad = 0; quad < 4; ++quad) {
        const uint32_t child = create_node(region.quadrant(quad), child_depth);
        nodes_[node_index].children[quad] = child;
    }

    std::vector<uint32_t> residents;
    residents.swap(nodes_[node_index].particles);
    nodes_[node_index].is_leaf = false;

    for (uint32_t p : residents) {
        const Node& node = nodes_[node_index];
        insert_into(node.children[child_slot(node, pos_x_[p], pos_y_[p])], p);
    }
}

void QuadTree::refresh_leaf(uint32_t node_index) {
    Node& node = nodes_[node_index];
    double m = 0.0;
    Eigen::Vector2d weighted = Eigen::Vector2d::Zero();
    for (uint32_t p : node.particles) {
        m += mass_[p];
        weighted += mass_[p] * Eigen::Vector2d(pos_x_[p], pos_y_[p]);
    }
    node.total_mass = m;
    if (m > 0.0) {
        node.com_x = weighted.x() / m;
        node.com_y = weighted.y() / m;
    }
}

void QuadTree::refresh_internal(uint32_t node_index) {
    double m = 0.0;
    Eigen::Vector2d weighted = Eigen::Vector2d::Zero();
    for (uint32_t c : nodes_[node_index].children) {
        const Node& child = nodes_[c];
        m += child.total_mass;
        weighted += child.total_mass * Eigen::Vector2d(child.com_x, child.com_y);
    }
    Node& node = nodes_[node_index];
    node.total_mass = m;
    if (m > 0.0) {
        node.com_x = weighted.x() / m;
        node.com_y = weighted.y() / m;
    }
}

uint32_t QuadTree::locate(double x, double y) const {
    if (nodes_.empty()) return NO_NODE;
    uint32_t index = 0;
    while (!nodes_[index].is_leaf) {
        const Node& node = nodes_[index];
        index = node.children[child_slot(node, x, y)];
    }
    return index;
}

int QuadTree::max_depth() const {
    int d = 0;
    for (const auto& n : nodes_) d = std::max<int>(d, n.depth);
    return d;
}

std::vector<QuadTree::QuadTreeBox> QuadTree::get_quadtree_boxes() const {
    std::vector<QuadTreeBox> boxes;
    boxes.reserve(nodes_.size());
    for (const auto& n : nodes_) {
        boxes.emplace_back(n.min_x, n.min_y, n.min_x + n.size, n.min_y + n.size,
                           n.depth, static_cast<int>(n.particles.size()), n.is_leaf);
    }
    return boxes;
}
