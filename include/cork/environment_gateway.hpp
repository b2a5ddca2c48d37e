#pragma once

#include "cork/result.hpp"
#include "cork/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace cork {

// ============================================================================
// Environment Gateway
// ============================================================================

struct EnvironmentInfo {
    std::string name;
    std::string prefix_path;
    bool created = false;  // True when this call created the environment
};

/**
 * Typed boundary over the external environment manager.
 *
 * Every operation blocks until the external tool returns or its timeout
 * expires. Failures come back as Error values carrying the stage they
 * belong to; raw process output never reaches callers.
 */
class EnvironmentGateway {
public:
    virtual ~EnvironmentGateway() = default;

    /// Look up the named environment, creating it when absent. Idempotent.
    virtual Result<EnvironmentInfo> ensureEnvironment(const std::string& name) = 0;

    /// Expose a disk image's contents for `env` and return the primary installer binary
    virtual Result<std::string> mountImage(const std::string& env, const std::string& image_path) = 0;

    /// Recursively copy src into dest, creating dest as needed
    virtual Result<void> copyTree(const std::string& src, const std::string& dest) = 0;

    virtual Result<void> installComponent(const std::string& env, const std::string& component_id) = 0;

    /// Returns the process exit status
    virtual Result<int> runBinary(const std::string& env, const std::string& binary_path,
                                  std::chrono::seconds timeout) = 0;

    virtual Result<std::vector<ShortcutEntry>> listNativeShortcuts(const std::string& env) = 0;

    virtual Result<void> createNativeShortcut(const std::string& env, const std::string& display_name,
                                              const std::string& binary_path) = 0;

    /// Managed storage root of an environment (its prefix directory)
    virtual std::string storagePath(const std::string& env) const = 0;
};

} // namespace cork
