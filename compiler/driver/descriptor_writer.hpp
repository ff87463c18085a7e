#pragma once

#include "../methods/method_descriptor.hpp"

#include <filesystem>
#include <string>

namespace sigcheck
{
    [[nodiscard]] std::string renderDescriptorTable(const methods::MethodTable& table);

    bool writeDescriptorTable(const std::filesystem::path& outputPath,
        const methods::MethodTable& table,
        std::string& errorMessage);
}
