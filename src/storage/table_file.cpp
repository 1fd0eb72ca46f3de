#include "hovel/storage/table_file.hpp"

namespace hovel::storage {

std::error_code TableFile::open(const std::filesystem::path& path)
{
    close();
    path_ = path;

    if (!std::filesystem::exists(path_)) {
        std::ofstream create(path_, std::ios::binary);
        if (!create) {
            return std::make_error_code(std::errc::io_error);
        }
    }

    stream_.open(path_, std::ios::binary | std::ios::in | std::ios::out);
    if (!stream_) {
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

void TableFile::close() noexcept
{
    if (stream_.is_open()) {
        stream_.close();
    }
    stream_.clear();
}

std::error_code TableFile::size(std::uint64_t& out)
{
    if (!stream_.is_open()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    stream_.clear();
    stream_.seekg(0, std::ios::end);
    const auto end = stream_.tellg();
    if (!stream_ || end < 0) {
        stream_.clear();
        return std::make_error_code(std::errc::io_error);
    }
    out = static_cast<std::uint64_t>(end);
    return {};
}

std::error_code TableFile::read_at(std::uint64_t offset, std::span<std::byte> out)
{
    if (!stream_.is_open()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (stream_.gcount() != static_cast<std::streamsize>(out.size())) {
        stream_.clear();
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::error_code TableFile::write_at(std::uint64_t offset, std::span<const std::byte> bytes)
{
    if (!stream_.is_open()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    stream_.clear();
    stream_.seekp(static_cast<std::streamoff>(offset));
    stream_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!stream_) {
        stream_.clear();
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::error_code TableFile::append(std::span<const std::byte> bytes, std::uint64_t& offset)
{
    if (auto ec = size(offset); ec) {
        return ec;
    }
    return write_at(offset, bytes);
}

std::error_code TableFile::flush()
{
    if (!stream_.is_open()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    stream_.flush();
    if (!stream_) {
        stream_.clear();
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::error_code TableFile::truncate()
{
    close();
    std::error_code ec;
    std::filesystem::resize_file(path_, 0U, ec);
    return ec;
}

}  // namespace hovel::storage
