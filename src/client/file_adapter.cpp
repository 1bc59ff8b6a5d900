#include "bkc/client/file_adapter.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace bkc::client {
namespace fs = std::filesystem;

Result<std::vector<std::uint8_t>> LocalFileAdapter::read_all(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Fail<std::vector<std::uint8_t>>(ErrorKind::FileAccess, "Not a readable file: " + path);
    }

    const auto file_size = fs::file_size(path, ec);
    if (ec) {
        return Fail<std::vector<std::uint8_t>>(ErrorKind::FileAccess,
                                               "Failed to stat " + path + ": " + ec.message());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<std::vector<std::uint8_t>>(ErrorKind::FileAccess, "Failed to open source file: " + path);
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(file_size));
    if (!buffer.empty()) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (static_cast<std::uintmax_t>(input.gcount()) != file_size) {
            return Fail<std::vector<std::uint8_t>>(ErrorKind::FileAccess, "Short read from " + path);
        }
    }
    return Ok(std::move(buffer));
}

Result<void> LocalFileAdapter::write_all(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    const fs::path target(path);
    const auto parent = target.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return Fail<void>(ErrorKind::FileAccess, "Failed to create directory: " + parent.string());
        }
    }

    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Fail<void>(ErrorKind::FileAccess, "Failed to open destination file: " + path);
    }
    output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    output.flush();
    if (!output) {
        return Fail<void>(ErrorKind::FileAccess, "Failed to write " + path);
    }
    return Ok();
}

} // namespace bkc::client
