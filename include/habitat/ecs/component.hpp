#pragma once

/// @file component.hpp
/// @brief Component kinds for habitat_ecs
///
/// Components form a closed set of concrete kinds held in a std::variant.
/// Every kind carries a fixed type tag; DynamicComponent covers open-ended
/// kinds with a caller-chosen tag and JSON fields. The tag of a Component is
/// derived from the held kind and cannot change after construction.

#include "fwd.hpp"
#include <habitat/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace habitat_ecs {

// =============================================================================
// Value Types
// =============================================================================

/// 2D point in world space
struct Point {
    float x = 0.0f;
    float y = 0.0f;

    [[nodiscard]] bool operator==(const Point& other) const noexcept {
        return x == other.x && y == other.y;
    }
    [[nodiscard]] bool operator!=(const Point& other) const noexcept {
        return !(*this == other);
    }
};

/// Footprint size in tiles
struct Extent {
    int width = 0;
    int height = 0;

    [[nodiscard]] bool operator==(const Extent& other) const noexcept {
        return width == other.width && height == other.height;
    }
};

// =============================================================================
// Concrete Component Kinds
// =============================================================================

/// World position with the value from the previous step (for interpolation)
struct PositionComponent {
    inline static const std::string TAG = "position";

    Point position;
    Point previous_position;
};

/// Sprite drawing parameters
struct RenderComponent {
    inline static const std::string TAG = "render";

    std::string sprite;
    int layer = 0;  // z-order
    bool visible = true;
    float scale = 1.0f;
    float rotation = 0.0f;
};

struct AnimalComponent {
    inline static const std::string TAG = "animal";

    std::string species;
    float hunger_level = 100.0f;     // 0-100
    float happiness_level = 100.0f;  // 0-100
    std::int64_t last_fed_time = 0;  // ms since epoch
    double maintenance_cost = 0.0;
    double visitor_appeal = 0.0;
};

/// Enclosure members are entity ids, never pointers
struct EnclosureComponent {
    inline static const std::string TAG = "enclosure";

    std::string animal_type;
    int capacity = 0;
    std::vector<EntityId> current_animals;
    double maintenance_cost = 0.0;
    double construction_cost = 0.0;
    Extent size;
};

struct VisitorComponent {
    inline static const std::string TAG = "visitor";

    float satisfaction_level = 50.0f;  // 0-100
    std::optional<EntityId> current_target;
    std::vector<Point> path_queue;
    double ticket_price = 0.0;
    double time_in_zoo = 0.0;
    std::vector<EntityId> visited_enclosures;
};

struct FinancialComponent {
    inline static const std::string TAG = "financial";

    double current_funds = 0.0;
    double daily_income = 0.0;
    double daily_expenses = 0.0;
    double ticket_price = 0.0;
    float reputation_score = 50.0f;  // 0-100
};

/// Component with a caller-chosen tag and free-form JSON fields
///
/// The tag must be non-empty and must not name a built-in kind, and the
/// fields must be a JSON object (null is taken as empty) without a "type"
/// key, so the dump parses back into the same component.
class DynamicComponent {
public:
    /// @throws std::invalid_argument if the tag or fields are rejected
    explicit DynamicComponent(std::string tag, nlohmann::json data = nlohmann::json::object());

    [[nodiscard]] const std::string& tag() const noexcept { return m_tag; }

private:
    std::string m_tag;

public:
    nlohmann::json fields;
};

// =============================================================================
// Component
// =============================================================================

/// Tagged union of all component kinds
class Component {
public:
    using Variant = std::variant<
        PositionComponent,
        RenderComponent,
        AnimalComponent,
        EnclosureComponent,
        VisitorComponent,
        FinancialComponent,
        DynamicComponent
    >;

    /// Wrap any concrete kind
    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Component> &&
                                         std::is_constructible_v<Variant, T&&>>>
    Component(T&& kind) : m_data(std::forward<T>(kind)) {}

    /// Type tag of the held kind
    [[nodiscard]] const std::string& type() const noexcept;

    /// Typed access (nullptr if a different kind is held)
    template<typename T>
    [[nodiscard]] T* get_if() noexcept {
        return std::get_if<T>(&m_data);
    }

    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&m_data);
    }

    template<typename T>
    [[nodiscard]] bool holds() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

    /// Dump including the "type" field
    [[nodiscard]] nlohmann::json to_json() const;

    /// Parse a dump; the tag is read from its "type" field
    [[nodiscard]] static habitat_core::Result<Component> from_json(const nlohmann::json& j);

    /// Parse a dump stored under a known tag
    ///
    /// Known tags produce their concrete kind, anything else a DynamicComponent.
    /// A "type" field that disagrees with @p tag is rejected.
    [[nodiscard]] static habitat_core::Result<Component> from_json(const std::string& tag,
                                                                   const nlohmann::json& j);

private:
    Variant m_data;
};

// =============================================================================
// Factories
// =============================================================================

/// Position at (x, y) with previous position equal to it
[[nodiscard]] PositionComponent make_position(float x, float y);

[[nodiscard]] RenderComponent make_render(std::string sprite, int layer = 0,
                                          float scale = 1.0f, float rotation = 0.0f);

/// Fully fed and happy animal, last fed now
[[nodiscard]] AnimalComponent make_animal(std::string species, double maintenance_cost,
                                          double visitor_appeal);

/// Enclosure with no animals yet
[[nodiscard]] EnclosureComponent make_enclosure(std::string animal_type, int capacity,
                                                double maintenance_cost, double construction_cost,
                                                Extent size);

[[nodiscard]] VisitorComponent make_visitor(double ticket_price);

[[nodiscard]] FinancialComponent make_financial(double starting_funds, double ticket_price);

/// True for the built-in component tags
[[nodiscard]] bool is_builtin_component_type(const std::string& tag);

} // namespace habitat_ecs
