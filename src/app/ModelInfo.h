#pragma once

#include <cstddef>
#include <ostream>
#include <span>
#include <string_view>

struct ModelInfo {
    std::string_view name;      // user facing, and used in output file names
    std::string_view id;        // stable, stored in the settings
    std::string_view filename;
    size_t size_mb{};           // approximate in megabytes
    std::string_view download_url; // If it ends with '/', the file name is appended for download
};

using model_list_t = std::span<const ModelInfo>; // NB: Non owning

std::ostream& operator<<(std::ostream &os, const ModelInfo& mi);
