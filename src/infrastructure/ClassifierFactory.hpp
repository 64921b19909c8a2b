/**
 * @file ClassifierFactory.hpp
 * @brief Chooses the classifier implementation from settings.
 */

#pragma once
#include <memory>
#include "domain/ClassifierService.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace sortwell::infrastructure {

class ClassifierFactory {
public:
    /** @return The configured classifier, or nullptr when provider is "none" or unknown. */
    static std::shared_ptr<domain::ClassifierService> Create(const Settings& settings);
};

} // namespace sortwell::infrastructure
