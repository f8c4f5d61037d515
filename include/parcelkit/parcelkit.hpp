#pragma once

#include "assembler.hpp"
#include "batch.hpp"
#include "charset.hpp"
#include "crs.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include "history.hpp"
#include "logging.hpp"
#include "parser.hpp"
#include "types.hpp"
#include "writer.hpp"

#include <filesystem>
#include <string>

namespace parcelkit {

    // Raw bytes of a file. Throws std::runtime_error when it cannot be read.
    std::string read_bytes(const std::filesystem::path &file);

    // Reads, decodes and parses one export. A decode warning is logged, not thrown.
    ParsedDocument read(const std::filesystem::path &file);

    PreprocessResult convert_file(const std::filesystem::path &file, const GeometryOptions &opts = {});

} // namespace parcelkit

namespace pk = parcelkit;
