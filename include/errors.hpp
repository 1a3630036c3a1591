#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace ragcore {

// Root of everything the retrieval core throws on purpose.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Bad or inconsistent setup: unknown backend, bad dimension, an index file
// that does not match the configured embedder. Never auto-healed.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

// A caller-supplied field failed a check the core performs itself.
class ValidationError : public Error {
public:
    ValidationError(std::string field, const std::string& what)
        : Error(what), field_(std::move(field)) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Failure reported by an embedding or index backend after construction.
class BackendError : public Error {
public:
    explicit BackendError(const std::string& what) : Error(what) {}
};

} // namespace ragcore
