#pragma once

#include <stdexcept>
#include <string>

namespace panel_promote {

class PanelPromoteError : public std::runtime_error {
public:
    explicit PanelPromoteError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PanelPromoteError {
public:
    explicit ConfigError(const std::string& message)
        : PanelPromoteError("Config error: " + message) {}
};

class ValidationError : public PanelPromoteError {
public:
    explicit ValidationError(const std::string& message)
        : PanelPromoteError("Validation error: " + message) {}
};

class IOError : public PanelPromoteError {
public:
    explicit IOError(const std::string& message)
        : PanelPromoteError("I/O error: " + message) {}
};

// Raised inside a single panel's pipeline; caught per panel by the engine.
class PanelError : public PanelPromoteError {
public:
    explicit PanelError(const std::string& message)
        : PanelPromoteError("Panel error: " + message) {}
};

class PipelineError : public PanelPromoteError {
public:
    explicit PipelineError(const std::string& message)
        : PanelPromoteError("Pipeline error: " + message) {}
};

class StopRequested : public PanelPromoteError {
public:
    StopRequested() : PanelPromoteError("Stop requested by user") {}
};

} // namespace panel_promote
