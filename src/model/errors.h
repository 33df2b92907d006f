#pragma once

#include <stdexcept>
#include <string>

namespace fin {

// Base for every failure the generator pipeline reports. Carries the stage
// that failed and, where one exists, the offending entity id.
class PipelineError : public std::runtime_error {
public:
    PipelineError(const std::string& stage, const std::string& message,
                  const std::string& entity_id = "")
        : std::runtime_error(format(stage, message, entity_id)),
          stage_(stage), entity_id_(entity_id) {}

    const std::string& stage() const { return stage_; }
    const std::string& entity_id() const { return entity_id_; }

private:
    static std::string format(const std::string& stage, const std::string& message,
                              const std::string& entity_id) {
        std::string out = "[" + stage + "] " + message;
        if (!entity_id.empty()) out += " (id: " + entity_id + ")";
        return out;
    }

    std::string stage_;
    std::string entity_id_;
};

// Bad counts or parameters; raised before any data is produced
class ConfigurationError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

// A record points at an entity that does not exist
class IntegrityError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

} // namespace fin
