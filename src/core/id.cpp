/// @file id.cpp
/// @brief Global id generators for habitat_core

#include <habitat/core/id.hpp>

namespace habitat_core {

namespace {

/// Global entity id generator
IdGenerator s_entity_id_generator;

} // anonymous namespace

IdGenerator& entity_id_generator() {
    return s_entity_id_generator;
}

std::string next_entity_name() {
    return s_entity_id_generator.next_name("entity");
}

} // namespace habitat_core
