#include "ckg/patterns/pattern_recognizer.hpp"

#include "ckg/core/logging.hpp"

#include <algorithm>
#include <iterator>

namespace ckg::patterns {

    PatternRecognizer::PatternRecognizer(PatternConfig config)
        : config_(std::move(config)) {
        detectors_.push_back(std::make_unique<MvcDetector>());
        detectors_.push_back(std::make_unique<MicroservicesDetector>(config_.microservice_min_services));
        detectors_.push_back(std::make_unique<SingletonDetector>());
        detectors_.push_back(std::make_unique<FactoryDetector>());
        detectors_.push_back(std::make_unique<GodObjectDetector>(config_.god_object_line_threshold));
        detectors_.push_back(std::make_unique<DomainConceptDetector>(config_.domain_term_min_frequency));
    }

    void PatternRecognizer::add_detector(std::unique_ptr<IPatternDetector> detector) {
        if (detector) {
            detectors_.push_back(std::move(detector));
        }
    }

    std::vector<const IPatternDetector*> PatternRecognizer::detectors() const {
        std::vector<const IPatternDetector*> result;
        result.reserve(detectors_.size());
        for (const auto& detector : detectors_) {
            result.push_back(detector.get());
        }
        return result;
    }

    Result<std::size_t, Error> PatternRecognizer::recognize(
        graph::GraphStore& store,
        const CancellationToken& cancel
    ) const {
        std::vector<Concept> found;
        if (config_.seed_builtin_concepts) {
            found = builtin_concepts();
        }

        for (const auto& detector : detectors_) {
            if (cancel.is_cancelled()) {
                return Result<std::size_t, Error>::failure(
                    Error::cancelled("Build cancelled during pattern recognition")
                );
            }

            auto concepts = detector->detect(store);
            logging::get()->debug("Pattern detector '{}' found {} concepts", detector->name(), concepts.size());
            std::ranges::move(concepts, std::back_inserter(found));
        }

        std::size_t added = 0;
        for (auto& concept_value : found) {
            if (store.add_concept(std::move(concept_value))) {
                ++added;
            }
        }
        return Result<std::size_t, Error>::success(added);
    }

}  // namespace ckg::patterns
