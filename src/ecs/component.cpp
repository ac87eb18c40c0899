/// @file component.cpp
/// @brief Component serialization and factories

#include <habitat/ecs/component.hpp>

#include <chrono>
#include <stdexcept>

namespace habitat_ecs {

using habitat_core::Err;
using habitat_core::Error;
using habitat_core::ErrorCode;
using habitat_core::Result;

namespace {

nlohmann::json point_to_json(const Point& p) {
    return nlohmann::json{{"x", p.x}, {"y", p.y}};
}

Point point_from_json(const nlohmann::json& j) {
    Point p;
    p.x = j.at("x").get<float>();
    p.y = j.at("y").get<float>();
    return p;
}

std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// =============================================================================
// Per-kind JSON
// =============================================================================

nlohmann::json kind_to_json(const PositionComponent& c) {
    return nlohmann::json{
        {"position", point_to_json(c.position)},
        {"previous_position", point_to_json(c.previous_position)}
    };
}

nlohmann::json kind_to_json(const RenderComponent& c) {
    return nlohmann::json{
        {"sprite", c.sprite},
        {"layer", c.layer},
        {"visible", c.visible},
        {"scale", c.scale},
        {"rotation", c.rotation}
    };
}

nlohmann::json kind_to_json(const AnimalComponent& c) {
    return nlohmann::json{
        {"species", c.species},
        {"hunger_level", c.hunger_level},
        {"happiness_level", c.happiness_level},
        {"last_fed_time", c.last_fed_time},
        {"maintenance_cost", c.maintenance_cost},
        {"visitor_appeal", c.visitor_appeal}
    };
}

nlohmann::json kind_to_json(const EnclosureComponent& c) {
    return nlohmann::json{
        {"animal_type", c.animal_type},
        {"capacity", c.capacity},
        {"current_animals", c.current_animals},
        {"maintenance_cost", c.maintenance_cost},
        {"construction_cost", c.construction_cost},
        {"size", {{"width", c.size.width}, {"height", c.size.height}}}
    };
}

nlohmann::json kind_to_json(const VisitorComponent& c) {
    nlohmann::json path = nlohmann::json::array();
    for (const auto& p : c.path_queue) {
        path.push_back(point_to_json(p));
    }

    return nlohmann::json{
        {"satisfaction_level", c.satisfaction_level},
        {"current_target", c.current_target ? nlohmann::json(*c.current_target) : nlohmann::json(nullptr)},
        {"path_queue", path},
        {"ticket_price", c.ticket_price},
        {"time_in_zoo", c.time_in_zoo},
        {"visited_enclosures", c.visited_enclosures}
    };
}

nlohmann::json kind_to_json(const FinancialComponent& c) {
    return nlohmann::json{
        {"current_funds", c.current_funds},
        {"daily_income", c.daily_income},
        {"daily_expenses", c.daily_expenses},
        {"ticket_price", c.ticket_price},
        {"reputation_score", c.reputation_score}
    };
}

nlohmann::json kind_to_json(const DynamicComponent& c) {
    return c.fields;
}

// Missing fields keep their defaults; present fields of the wrong type throw
// nlohmann::json::type_error, which from_json turns into a ParseError.

PositionComponent position_from_json(const nlohmann::json& j) {
    PositionComponent c;
    if (j.contains("position")) c.position = point_from_json(j["position"]);
    c.previous_position = j.contains("previous_position") ? point_from_json(j["previous_position"]) : c.position;
    return c;
}

RenderComponent render_from_json(const nlohmann::json& j) {
    RenderComponent c;
    c.sprite = j.value("sprite", c.sprite);
    c.layer = j.value("layer", c.layer);
    c.visible = j.value("visible", c.visible);
    c.scale = j.value("scale", c.scale);
    c.rotation = j.value("rotation", c.rotation);
    return c;
}

AnimalComponent animal_from_json(const nlohmann::json& j) {
    AnimalComponent c;
    c.species = j.value("species", c.species);
    c.hunger_level = j.value("hunger_level", c.hunger_level);
    c.happiness_level = j.value("happiness_level", c.happiness_level);
    c.last_fed_time = j.value("last_fed_time", c.last_fed_time);
    c.maintenance_cost = j.value("maintenance_cost", c.maintenance_cost);
    c.visitor_appeal = j.value("visitor_appeal", c.visitor_appeal);
    return c;
}

EnclosureComponent enclosure_from_json(const nlohmann::json& j) {
    EnclosureComponent c;
    c.animal_type = j.value("animal_type", c.animal_type);
    c.capacity = j.value("capacity", c.capacity);
    if (j.contains("current_animals")) {
        c.current_animals = j["current_animals"].get<std::vector<EntityId>>();
    }
    c.maintenance_cost = j.value("maintenance_cost", c.maintenance_cost);
    c.construction_cost = j.value("construction_cost", c.construction_cost);
    if (j.contains("size")) {
        c.size.width = j["size"].at("width").get<int>();
        c.size.height = j["size"].at("height").get<int>();
    }
    return c;
}

VisitorComponent visitor_from_json(const nlohmann::json& j) {
    VisitorComponent c;
    c.satisfaction_level = j.value("satisfaction_level", c.satisfaction_level);
    if (j.contains("current_target") && !j["current_target"].is_null()) {
        c.current_target = j["current_target"].get<EntityId>();
    }
    if (j.contains("path_queue")) {
        for (const auto& p : j["path_queue"]) {
            c.path_queue.push_back(point_from_json(p));
        }
    }
    c.ticket_price = j.value("ticket_price", c.ticket_price);
    c.time_in_zoo = j.value("time_in_zoo", c.time_in_zoo);
    if (j.contains("visited_enclosures")) {
        c.visited_enclosures = j["visited_enclosures"].get<std::vector<EntityId>>();
    }
    return c;
}

FinancialComponent financial_from_json(const nlohmann::json& j) {
    FinancialComponent c;
    c.current_funds = j.value("current_funds", c.current_funds);
    c.daily_income = j.value("daily_income", c.daily_income);
    c.daily_expenses = j.value("daily_expenses", c.daily_expenses);
    c.ticket_price = j.value("ticket_price", c.ticket_price);
    c.reputation_score = j.value("reputation_score", c.reputation_score);
    return c;
}

} // anonymous namespace

// =============================================================================
// DynamicComponent
// =============================================================================

DynamicComponent::DynamicComponent(std::string tag, nlohmann::json data)
    : m_tag(std::move(tag))
    , fields(std::move(data)) {
    if (m_tag.empty()) {
        throw std::invalid_argument("Dynamic component tag must not be empty");
    }
    if (is_builtin_component_type(m_tag)) {
        throw std::invalid_argument("Dynamic component tag '" + m_tag + "' names a built-in component");
    }
    if (fields.is_null()) {
        fields = nlohmann::json::object();
    }
    if (!fields.is_object()) {
        throw std::invalid_argument("Dynamic component '" + m_tag + "' fields must be a JSON object");
    }
    if (fields.contains("type")) {
        throw std::invalid_argument("Dynamic component '" + m_tag + "' fields must not contain 'type'");
    }
}

// =============================================================================
// Component
// =============================================================================

const std::string& Component::type() const noexcept {
    return std::visit([](const auto& kind) -> const std::string& {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, DynamicComponent>) {
            return kind.tag();
        } else {
            return T::TAG;
        }
    }, m_data);
}

nlohmann::json Component::to_json() const {
    nlohmann::json j = std::visit([](const auto& kind) { return kind_to_json(kind); }, m_data);
    j["type"] = type();
    return j;
}

Result<Component> Component::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return Err<Component>(Error(ErrorCode::ParseError, "Component dump has no string 'type' field"));
    }
    return from_json(j["type"].get<std::string>(), j);
}

Result<Component> Component::from_json(const std::string& tag, const nlohmann::json& j) {
    if (tag.empty()) {
        return Err<Component>(Error(ErrorCode::ParseError, std::string("Component tag is empty")));
    }
    if (!j.is_object()) {
        return Err<Component>(Error(ErrorCode::ParseError, "Component '" + tag + "' dump is not an object"));
    }
    if (j.contains("type") && (!j["type"].is_string() || j["type"].get<std::string>() != tag)) {
        return Err<Component>(Error(ErrorCode::ValidationError,
            "Component stored under '" + tag + "' declares a different type"));
    }

    try {
        if (tag == PositionComponent::TAG) return Component(position_from_json(j));
        if (tag == RenderComponent::TAG) return Component(render_from_json(j));
        if (tag == AnimalComponent::TAG) return Component(animal_from_json(j));
        if (tag == EnclosureComponent::TAG) return Component(enclosure_from_json(j));
        if (tag == VisitorComponent::TAG) return Component(visitor_from_json(j));
        if (tag == FinancialComponent::TAG) return Component(financial_from_json(j));

        nlohmann::json fields = j;
        fields.erase("type");
        return Component(DynamicComponent(tag, std::move(fields)));
    } catch (const nlohmann::json::exception& e) {
        return Err<Component>(Error(ErrorCode::ParseError,
            "Component '" + tag + "' is malformed: " + e.what()));
    }
}

// =============================================================================
// Factories
// =============================================================================

PositionComponent make_position(float x, float y) {
    PositionComponent c;
    c.position = Point{x, y};
    c.previous_position = c.position;
    return c;
}

RenderComponent make_render(std::string sprite, int layer, float scale, float rotation) {
    RenderComponent c;
    c.sprite = std::move(sprite);
    c.layer = layer;
    c.scale = scale;
    c.rotation = rotation;
    return c;
}

AnimalComponent make_animal(std::string species, double maintenance_cost, double visitor_appeal) {
    AnimalComponent c;
    c.species = std::move(species);
    c.last_fed_time = now_ms();
    c.maintenance_cost = maintenance_cost;
    c.visitor_appeal = visitor_appeal;
    return c;
}

EnclosureComponent make_enclosure(std::string animal_type, int capacity,
                                  double maintenance_cost, double construction_cost,
                                  Extent size) {
    EnclosureComponent c;
    c.animal_type = std::move(animal_type);
    c.capacity = capacity;
    c.maintenance_cost = maintenance_cost;
    c.construction_cost = construction_cost;
    c.size = size;
    return c;
}

VisitorComponent make_visitor(double ticket_price) {
    VisitorComponent c;
    c.ticket_price = ticket_price;
    return c;
}

FinancialComponent make_financial(double starting_funds, double ticket_price) {
    FinancialComponent c;
    c.current_funds = starting_funds;
    c.ticket_price = ticket_price;
    return c;
}

bool is_builtin_component_type(const std::string& tag) {
    return tag == PositionComponent::TAG || tag == RenderComponent::TAG ||
           tag == AnimalComponent::TAG || tag == EnclosureComponent::TAG ||
           tag == VisitorComponent::TAG || tag == FinancialComponent::TAG;
}

} // namespace habitat_ecs
