#include "parcelkit/parcelkit.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace parcelkit {

    std::string read_bytes(const std::filesystem::path &file) {
        std::ifstream ifs(file, std::ios::binary);
        if (!ifs)
            throw std::runtime_error("parcelkit::read(): cannot open \"" + file.string() + '"');

        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return buffer.str();
    }

    ParsedDocument read(const std::filesystem::path &file) {
        auto decoded = decode(read_bytes(file));
        if (!decoded.warning.empty())
            logger()->warn("{}: {}", file.string(), decoded.warning);
        logger()->debug("{}: decoded as {}", file.string(), decoded.encoding);
        return parse(decoded.text);
    }

    PreprocessResult convert_file(const std::filesystem::path &file, const GeometryOptions &opts) {
        return preprocess(read(file), opts);
    }

} // namespace parcelkit
