#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cork {

// ============================================================================
// PE/COFF Import Table Reading
// ============================================================================

struct ImportReadResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> imports;  // Library names in table order, as written in the binary
};

// Read the import and delay-import directories of a PE32 or PE32+ image.
ImportReadResult read_pe_imports(const std::string& binary_path);

ImportReadResult read_pe_imports(const std::vector<uint8_t>& binary_data);

} // namespace cork
