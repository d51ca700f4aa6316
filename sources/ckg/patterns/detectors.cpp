#include "ckg/patterns/pattern_detector.hpp"

#include "ckg/utils/string_utils.hpp"

#include <algorithm>
#include <map>

namespace ckg::patterns {

    namespace {

        bool name_contains(const Node& node, const std::string_view lower_needle) {
            return string_utils::contains_lower(node.name, lower_needle);
        }

        std::size_t count_named(const graph::GraphStore& store, const std::string_view lower_needle) {
            return static_cast<std::size_t>(std::ranges::count_if(store.nodes(), [&](const Node& node) {
                return name_contains(node, lower_needle);
            }));
        }

    }  // namespace

    // ============================================================================
    // Architecture
    // ============================================================================

    std::vector<Concept> MvcDetector::detect(const graph::GraphStore& store) const {
        const bool has_controller = count_named(store, "controller") > 0;
        const bool has_model = count_named(store, "model") > 0;
        const bool has_view = std::ranges::any_of(store.nodes(), [](const Node& node) {
            return name_contains(node, "view") || name_contains(node, "component");
        });

        if (!has_controller || !has_model || !has_view) {
            return {};
        }

        Concept mvc;
        mvc.id = "pattern_mvc";
        mvc.name = "Model-View-Controller";
        mvc.description = "MVC architectural pattern detected";
        mvc.category = ConceptCategory::Architecture;
        mvc.keywords = {"mvc", "controller", "model", "view"};
        mvc.related_concepts = {"separation_of_concerns"};
        mvc.code_patterns = {"*Controller.*", "*Model.*", "*View.*"};
        mvc.confidence = 0.8;
        return {mvc};
    }

    std::vector<Concept> MicroservicesDetector::detect(const graph::GraphStore& store) const {
        if (count_named(store, "service") < min_services_) {
            return {};
        }

        Concept services;
        services.id = "pattern_microservices";
        services.name = "Microservices Architecture";
        services.description = "Microservices pattern detected based on service count";
        services.category = ConceptCategory::Architecture;
        services.keywords = {"microservices", "service", "api"};
        services.related_concepts = {"distributed_systems"};
        services.code_patterns = {"*Service.*", "services/*"};
        services.confidence = 0.7;
        return {services};
    }

    // ============================================================================
    // Design patterns and anti-patterns
    // ============================================================================

    std::vector<Concept> SingletonDetector::detect(const graph::GraphStore& store) const {
        std::vector<Concept> concepts;
        for (const auto& node : store.nodes()) {
            if (node.type != NodeType::Class) {
                continue;
            }
            if (!name_contains(node, "singleton") && !node.flag(meta::HAS_PRIVATE_CONSTRUCTOR)) {
                continue;
            }

            Concept singleton;
            singleton.id = "pattern_singleton_" + node.id;
            singleton.name = "Singleton Pattern";
            singleton.description = "Singleton pattern detected in " + node.name;
            singleton.category = ConceptCategory::DesignPattern;
            singleton.keywords = {"singleton", "instance", "private"};
            singleton.related_concepts = {"creational_patterns"};
            singleton.code_patterns = {"private constructor", "static instance"};
            singleton.confidence = 0.8;
            singleton.related_nodes = {node.id};
            concepts.push_back(std::move(singleton));
        }
        return concepts;
    }

    std::vector<Concept> FactoryDetector::detect(const graph::GraphStore& store) const {
        std::vector<Concept> concepts;
        for (const auto& node : store.nodes()) {
            if (!name_contains(node, "factory")) {
                continue;
            }

            Concept factory;
            factory.id = "pattern_factory_" + node.id;
            factory.name = "Factory Pattern";
            factory.description = "Factory pattern detected in " + node.name;
            factory.category = ConceptCategory::DesignPattern;
            factory.keywords = {"factory", "create", "instance"};
            factory.related_concepts = {"creational_patterns"};
            factory.code_patterns = {"*Factory.*", "create*"};
            factory.confidence = 0.7;
            factory.related_nodes = {node.id};
            concepts.push_back(std::move(factory));
        }
        return concepts;
    }

    std::vector<Concept> GodObjectDetector::detect(const graph::GraphStore& store) const {
        std::vector<Concept> concepts;
        for (const auto& node : store.nodes()) {
            if (node.type != NodeType::Class) {
                continue;
            }
            if (node.number(meta::LINE_COUNT).value_or(0.0) <= static_cast<double>(line_threshold_)) {
                continue;
            }

            Concept god_object;
            god_object.id = "antipattern_god_object_" + node.id;
            god_object.name = "God Object Anti-pattern";
            god_object.description = "Potential God Object detected in " + node.name;
            god_object.category = ConceptCategory::DesignPattern;
            god_object.keywords = {"god object", "large class", "complexity"};
            god_object.related_concepts = {"code_smells"};
            god_object.code_patterns = {"large classes", "high complexity"};
            god_object.confidence = 0.6;
            god_object.related_nodes = {node.id};
            concepts.push_back(std::move(god_object));
        }
        return concepts;
    }

    // ============================================================================
    // Domain concepts
    // ============================================================================

    std::vector<std::string> domain_terms(const std::string_view name) {
        std::vector<std::string> terms;
        for (const auto& term : string_utils::split_identifier(name)) {
            if (term.size() >= 3) {
                terms.push_back(string_utils::to_lower(term));
            }
        }
        return terms;
    }

    std::vector<Concept> DomainConceptDetector::detect(const graph::GraphStore& store) const {
        std::map<std::string, std::size_t> frequencies;
        for (const auto& node : store.nodes()) {
            for (auto& term : domain_terms(node.name)) {
                ++frequencies[std::move(term)];
            }
        }

        std::vector<Concept> concepts;
        for (const auto& [term, frequency] : frequencies) {
            if (frequency < min_frequency_) {
                continue;
            }

            Concept domain;
            domain.id = "domain_" + term;
            domain.name = term;
            domain.description = "Domain concept: " + term;
            domain.category = ConceptCategory::BusinessLogic;
            domain.keywords = {term};
            domain.code_patterns = {"*" + term + "*"};
            domain.confidence = std::min(0.9, static_cast<double>(frequency) / 10.0);
            concepts.push_back(std::move(domain));
        }
        return concepts;
    }

    std::vector<Concept> builtin_concepts() {
        Concept mvc;
        mvc.id = "concept_mvc";
        mvc.name = "Model-View-Controller";
        mvc.description = "Architectural pattern separating concerns";
        mvc.category = ConceptCategory::Architecture;
        mvc.keywords = {"mvc", "model", "view", "controller"};
        mvc.related_concepts = {"separation_of_concerns"};
        mvc.code_patterns = {"*Controller", "*Model", "*View"};
        mvc.confidence = 1.0;

        Concept solid;
        solid.id = "concept_solid";
        solid.name = "SOLID Principles";
        solid.description = "Five design principles for maintainable software";
        solid.category = ConceptCategory::DesignPattern;
        solid.keywords = {"solid", "srp", "ocp", "lsp", "isp", "dip"};
        solid.related_concepts = {"design_principles"};
        solid.code_patterns = {"interface", "abstract"};
        solid.confidence = 1.0;

        return {mvc, solid};
    }

}  // namespace ckg::patterns
