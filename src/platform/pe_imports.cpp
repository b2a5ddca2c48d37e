#include "cork/pe_imports.hpp"
#include "cork/platform.hpp"

#include <cstdint>
#include <cstring>

namespace cork {

namespace {

// ============================================================================
// PE/COFF Format Structures
// ============================================================================

#pragma pack(push, 1)

struct DosHeader {
    uint16_t e_magic;
    uint8_t e_reserved[58];
    uint32_t e_lfanew;
};

struct CoffHeader {
    uint16_t machine;
    uint16_t number_of_sections;
    uint32_t time_date_stamp;
    uint32_t pointer_to_symbol_table;
    uint32_t number_of_symbols;
    uint16_t size_of_optional_header;
    uint16_t characteristics;
};

struct DataDirectory {
    uint32_t virtual_address;
    uint32_t size;
};

struct SectionHeader {
    char name[8];
    uint32_t virtual_size;
    uint32_t virtual_address;
    uint32_t size_of_raw_data;
    uint32_t pointer_to_raw_data;
    uint32_t pointer_to_relocations;
    uint32_t pointer_to_line_numbers;
    uint16_t number_of_relocations;
    uint16_t number_of_line_numbers;
    uint32_t characteristics;
};

struct ImportDescriptor {
    uint32_t original_first_thunk;
    uint32_t time_date_stamp;
    uint32_t forwarder_chain;
    uint32_t name;
    uint32_t first_thunk;
};

struct DelayImportDescriptor {
    uint32_t attributes;
    uint32_t dll_name;
    uint32_t module_handle;
    uint32_t import_address_table;
    uint32_t import_name_table;
    uint32_t bound_import_address_table;
    uint32_t unload_information_table;
    uint32_t time_date_stamp;
};

#pragma pack(pop)

static_assert(sizeof(DosHeader) == 64, "DOS header layout");
static_assert(sizeof(CoffHeader) == 20, "COFF header layout");
static_assert(sizeof(SectionHeader) == 40, "section header layout");
static_assert(sizeof(ImportDescriptor) == 20, "import descriptor layout");
static_assert(sizeof(DelayImportDescriptor) == 32, "delay import descriptor layout");

constexpr uint16_t DOS_MAGIC = 0x5a4d;      // "MZ"
constexpr uint32_t PE_SIGNATURE = 0x00004550;  // "PE\0\0"
constexpr uint16_t PE32_MAGIC = 0x10b;
constexpr uint16_t PE32_PLUS_MAGIC = 0x20b;

constexpr uint32_t IMPORT_DIRECTORY = 1;
constexpr uint32_t DELAY_IMPORT_DIRECTORY = 13;

// Upper bound on descriptors walked per directory; guards against unterminated tables
constexpr size_t MAX_DESCRIPTORS = 4096;
constexpr size_t MAX_NAME_LENGTH = 256;

struct PeImage {
    const std::vector<uint8_t>* data = nullptr;
    const SectionHeader* sections = nullptr;
    uint16_t section_count = 0;
    uint64_t image_base = 0;
    std::vector<DataDirectory> directories;
};

bool in_bounds(const std::vector<uint8_t>& data, uint64_t offset, uint64_t size) {
    return offset <= data.size() && size <= data.size() - offset;
}

// Map a relative virtual address to a file offset through the section table
bool rva_to_offset(const PeImage& image, uint32_t rva, uint64_t& offset) {
    for (uint16_t i = 0; i < image.section_count; ++i) {
        const auto& s = image.sections[i];
        uint32_t span = s.virtual_size > s.size_of_raw_data ? s.virtual_size : s.size_of_raw_data;
        if (rva >= s.virtual_address && rva < static_cast<uint64_t>(s.virtual_address) + span) {
            uint64_t delta = rva - s.virtual_address;
            if (delta >= s.size_of_raw_data) return false;  // Lives in uninitialised data
            offset = static_cast<uint64_t>(s.pointer_to_raw_data) + delta;
            return offset < image.data->size();
        }
    }
    return false;
}

bool read_name(const PeImage& image, uint32_t rva, std::string& out) {
    uint64_t offset = 0;
    if (!rva_to_offset(image, rva, offset)) return false;

    const auto& data = *image.data;
    out.clear();
    while (offset < data.size() && out.size() < MAX_NAME_LENGTH) {
        char c = static_cast<char>(data[static_cast<size_t>(offset)]);
        if (c == '\0') return !out.empty();
        out.push_back(c);
        ++offset;
    }
    return false;
}

void read_import_directory(const PeImage& image, std::vector<std::string>& imports,
                           std::string& error) {
    if (image.directories.size() <= IMPORT_DIRECTORY) return;
    const auto& dir = image.directories[IMPORT_DIRECTORY];
    if (dir.virtual_address == 0) return;

    uint64_t offset = 0;
    if (!rva_to_offset(image, dir.virtual_address, offset)) {
        error = "import directory outside any section";
        return;
    }

    const auto& data = *image.data;
    for (size_t i = 0; i < MAX_DESCRIPTORS; ++i) {
        uint64_t at = offset + i * sizeof(ImportDescriptor);
        if (!in_bounds(data, at, sizeof(ImportDescriptor))) {
            error = "import descriptor out of bounds";
            return;
        }

        ImportDescriptor desc;
        std::memcpy(&desc, data.data() + at, sizeof(desc));
        if (desc.name == 0 && desc.first_thunk == 0 && desc.original_first_thunk == 0) {
            return;
        }

        std::string name;
        if (read_name(image, desc.name, name)) {
            imports.push_back(name);
        }
    }
}

void read_delay_import_directory(const PeImage& image, std::vector<std::string>& imports) {
    if (image.directories.size() <= DELAY_IMPORT_DIRECTORY) return;
    const auto& dir = image.directories[DELAY_IMPORT_DIRECTORY];
    if (dir.virtual_address == 0) return;

    uint64_t offset = 0;
    if (!rva_to_offset(image, dir.virtual_address, offset)) return;

    const auto& data = *image.data;
    for (size_t i = 0; i < MAX_DESCRIPTORS; ++i) {
        uint64_t at = offset + i * sizeof(DelayImportDescriptor);
        if (!in_bounds(data, at, sizeof(DelayImportDescriptor))) return;

        DelayImportDescriptor desc;
        std::memcpy(&desc, data.data() + at, sizeof(desc));
        if (desc.dll_name == 0) return;

        // Attribute bit 0 clear means the legacy VA-based layout
        uint64_t rva = desc.dll_name;
        if ((desc.attributes & 1) == 0) {
            if (rva < image.image_base) continue;
            rva -= image.image_base;
        }

        std::string name;
        if (rva <= UINT32_MAX && read_name(image, static_cast<uint32_t>(rva), name)) {
            imports.push_back(name);
        }
    }
}

ImportReadResult read_pe_imports_impl(const std::vector<uint8_t>& data) {
    ImportReadResult result;

    if (data.size() < sizeof(DosHeader)) {
        result.error = "file too small for DOS header";
        return result;
    }

    DosHeader dos;
    std::memcpy(&dos, data.data(), sizeof(dos));
    if (dos.e_magic != DOS_MAGIC) {
        result.error = "not a PE file";
        return result;
    }

    uint64_t pe_offset = dos.e_lfanew;
    if (!in_bounds(data, pe_offset, 4 + sizeof(CoffHeader))) {
        result.error = "PE header out of bounds";
        return result;
    }

    uint32_t signature;
    std::memcpy(&signature, data.data() + pe_offset, sizeof(signature));
    if (signature != PE_SIGNATURE) {
        result.error = "missing PE signature";
        return result;
    }

    CoffHeader coff;
    std::memcpy(&coff, data.data() + pe_offset + 4, sizeof(coff));

    uint64_t opt_offset = pe_offset + 4 + sizeof(CoffHeader);
    if (coff.size_of_optional_header < 2 ||
        !in_bounds(data, opt_offset, coff.size_of_optional_header)) {
        result.error = "optional header out of bounds";
        return result;
    }

    uint16_t magic;
    std::memcpy(&magic, data.data() + opt_offset, sizeof(magic));

    // Offsets of NumberOfRvaAndSizes and ImageBase within the optional header
    uint64_t count_offset = 0;
    PeImage image;
    image.data = &data;
    if (magic == PE32_MAGIC) {
        count_offset = 92;
        if (coff.size_of_optional_header < 96) {
            result.error = "optional header truncated";
            return result;
        }
        uint32_t base;
        std::memcpy(&base, data.data() + opt_offset + 28, sizeof(base));
        image.image_base = base;
    } else if (magic == PE32_PLUS_MAGIC) {
        count_offset = 108;
        if (coff.size_of_optional_header < 112) {
            result.error = "optional header truncated";
            return result;
        }
        std::memcpy(&image.image_base, data.data() + opt_offset + 24, sizeof(image.image_base));
    } else {
        result.error = "unknown optional header magic";
        return result;
    }

    uint32_t dir_count;
    std::memcpy(&dir_count, data.data() + opt_offset + count_offset, sizeof(dir_count));
    uint64_t dir_offset = opt_offset + count_offset + 4;
    uint64_t dir_bytes = static_cast<uint64_t>(dir_count) * sizeof(DataDirectory);
    if (dir_offset + dir_bytes > opt_offset + coff.size_of_optional_header) {
        result.error = "data directories out of bounds";
        return result;
    }
    for (uint32_t i = 0; i < dir_count; ++i) {
        DataDirectory dd;
        std::memcpy(&dd, data.data() + dir_offset + i * sizeof(DataDirectory), sizeof(dd));
        image.directories.push_back(dd);
    }

    uint64_t sections_offset = opt_offset + coff.size_of_optional_header;
    if (!in_bounds(data, sections_offset,
                   static_cast<uint64_t>(coff.number_of_sections) * sizeof(SectionHeader))) {
        result.error = "section headers out of bounds";
        return result;
    }
    image.sections = reinterpret_cast<const SectionHeader*>(data.data() + sections_offset);
    image.section_count = coff.number_of_sections;

    read_import_directory(image, result.imports, result.error);
    if (!result.error.empty()) {
        return result;
    }
    read_delay_import_directory(image, result.imports);

    result.ok = true;
    return result;
}

} // namespace

ImportReadResult read_pe_imports(const std::string& binary_path) {
    auto data = read_binary_file(binary_path);
    if (!data || data->empty()) {
        ImportReadResult result;
        result.error = "failed to read file";
        return result;
    }

    return read_pe_imports_impl(*data);
}

ImportReadResult read_pe_imports(const std::vector<uint8_t>& binary_data) {
    return read_pe_imports_impl(binary_data);
}

} // namespace cork
