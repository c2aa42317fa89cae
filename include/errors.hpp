// ===================== File: include/errors.hpp =====================
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace netprobe {

// Setup-time failures. Per-probe failures are never thrown; they travel as
// ProbeOutcome / ProbeSample status instead.
class ProbeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ResolutionError : public ProbeError {
public:
    enum class Kind { NameNotFound, TooLarge, InvalidInput };

    ResolutionError(Kind kind, const std::string& what, std::uint64_t count = 0)
        : ProbeError(what), kind_(kind), count_(count) {}

    Kind kind() const { return kind_; }
    // Usable-host count of the rejected block (TooLarge only).
    std::uint64_t count() const { return count_; }

    static ResolutionError name_not_found(const std::string& host, const std::string& reason);
    static ResolutionError too_large(std::uint64_t count, std::uint64_t limit);
    static ResolutionError invalid(const std::string& input, const std::string& reason);

private:
    Kind kind_;
    std::uint64_t count_;
};

class PermissionError : public ProbeError {
public:
    using ProbeError::ProbeError;
};

class ProtocolError : public ProbeError {
public:
    using ProbeError::ProbeError;
};

inline ResolutionError ResolutionError::name_not_found(const std::string& host, const std::string& reason) {
    return ResolutionError(Kind::NameNotFound, "cannot resolve " + host + ": " + reason);
}

inline ResolutionError ResolutionError::too_large(std::uint64_t count, std::uint64_t limit) {
    return ResolutionError(Kind::TooLarge,
                           "address range too large: " + std::to_string(count) +
                               " hosts (limit " + std::to_string(limit) + ")",
                           count);
}

inline ResolutionError ResolutionError::invalid(const std::string& input, const std::string& reason) {
    return ResolutionError(Kind::InvalidInput, "invalid target '" + input + "': " + reason);
}

} // namespace netprobe
