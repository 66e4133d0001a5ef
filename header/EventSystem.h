#pragma once
#include <vector>
#include <unordered_map>
#include <functional>
#include <string>
#include <cstdint>

// Event system for decoupled communication with the UI/render collaborators
class EventBus {
public:
    using EventHandler = std::function<void(const void* data)>;
    
    template<typename T>
    void subscribe(const std::string& event_type, std::function<void(const T&)> handler) {
        handlers_[event_type].push_back([handler](const void* data) {
            handler(*static_cast<const T*>(data));
        });
    }
    
    template<typename T>
    void emit(const std::string& event_type, const T& data) {
        auto it = handlers_.find(event_type);
        if (it != handlers_.end()) {
            for (auto& handler : it->second) {
                handler(&data);
            }
        }
    }
    
    bool has_subscribers(const std::string& event_type) const {
        auto it = handlers_.find(event_type);
        return it != handlers_.end() && !it->second.empty();
    }
    
    size_t get_subscriber_count(const std::string& event_type) const {
        auto it = handlers_.find(event_type);
        return it != handlers_.end() ? it->second.size() : 0;
    }
    
private:
    std::unordered_map<std::string, std::vector<EventHandler>> handlers_;
};

struct PhysicsUpdateEvent {
    double delta_time;
    size_t particle_count;
    size_t iteration_count;
    size_t particle_contacts;
    size_t wall_contacts;
};

struct RenderUpdateEvent {
    const double* positions;  // x,y interleaved: [x0,y0,x1,y1,...]
    const double* radii;
    const double* speeds;
    size_t particle_count;
    double world_width, world_height;
};

struct ParticleAddedEvent {
    size_t particle_index;
    double pos_x, pos_y;
    double vel_x, vel_y;
    double mass;
    double radius;
};

struct SimulationPausedEvent {
    bool paused;
};

struct SimulationResetEvent {
    size_t particle_count;
    uint32_t seed;
};

// Event type constants to avoid string typos
namespace Events {
    constexpr const char* PHYSICS_UPDATE = "physics_update";
    constexpr const char* RENDER_UPDATE = "render_update";
    constexpr const char* PARTICLE_ADDED = "particle_added";
    constexpr const char* SIMULATION_PAUSED = "simulation_paused";
    constexpr const char* SIMULATION_RESET = "simulation_reset";
}
