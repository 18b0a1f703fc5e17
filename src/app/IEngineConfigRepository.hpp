#pragma once

#include "domain/domain_model.hpp"

namespace railseat::app {

// Port/interface for reading/writing engine settings.
// Implementations live in infra (e.g. JSON file).
class IEngineConfigRepository {
public:
    virtual ~IEngineConfigRepository() = default;

    virtual railseat::domain::EngineConfig load() const = 0;
    virtual bool save(const railseat::domain::EngineConfig& config) const = 0;
};

} // namespace railseat::app
