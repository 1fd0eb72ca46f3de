#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <system_error>

namespace hovel::storage {

// Read/write handle on one `<db>/<table>` file. Every operation reports
// failures through std::error_code and leaves the stream usable afterwards.
class TableFile final {
public:
    TableFile() = default;
    TableFile(const TableFile&) = delete;
    TableFile& operator=(const TableFile&) = delete;
    TableFile(TableFile&&) = default;
    TableFile& operator=(TableFile&&) = default;

    // Opens the file read/write, creating it empty when it does not exist.
    [[nodiscard]] std::error_code open(const std::filesystem::path& path);
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return stream_.is_open(); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::error_code size(std::uint64_t& out);
    [[nodiscard]] std::error_code read_at(std::uint64_t offset, std::span<std::byte> out);
    [[nodiscard]] std::error_code write_at(std::uint64_t offset, std::span<const std::byte> bytes);
    [[nodiscard]] std::error_code append(std::span<const std::byte> bytes, std::uint64_t& offset);
    [[nodiscard]] std::error_code flush();

    // Closes the stream and cuts the file to zero bytes.
    [[nodiscard]] std::error_code truncate();

private:
    std::filesystem::path path_{};
    std::fstream stream_{};
};

}  // namespace hovel::storage
