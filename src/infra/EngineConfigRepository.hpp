#pragma once

#include <string>

#include "domain/domain_model.hpp"
#include "app/IEngineConfigRepository.hpp"

namespace railseat::infra {

class EngineConfigRepository : public railseat::app::IEngineConfigRepository {
public:
    explicit EngineConfigRepository(std::string path);

    // Load engine settings from a JSON file.
    // If the file is missing or invalid, returns defaults and logs a warning.
    // Individual non-positive numbers fall back to their default.
    railseat::domain::EngineConfig load() const override;

    // Write settings back as indented JSON.
    bool save(const railseat::domain::EngineConfig& config) const override;

private:
    std::string path_;
};

} // namespace railseat::infra
