#pragma once

#include "bkc/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bkc::client {

/**
 * @brief The engine's only channel to local storage
 *
 * Failures are reported as ErrorKind::FileAccess.
 */
class FileAdapter {
public:
    virtual ~FileAdapter() = default;

    virtual Result<std::vector<std::uint8_t>> read_all(const std::string& path) = 0;
    virtual Result<void> write_all(const std::string& path, const std::vector<std::uint8_t>& bytes) = 0;
};

class LocalFileAdapter final : public FileAdapter {
public:
    Result<std::vector<std::uint8_t>> read_all(const std::string& path) override;
    Result<void> write_all(const std::string& path, const std::vector<std::uint8_t>& bytes) override;
};

} // namespace bkc::client
