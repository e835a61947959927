#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ft::engine
{

// Streams files into a ZIP container, deflating each entry at level 1.
// Switches to ZIP64 records when sizes or offsets outgrow 32 bits.
class ZipWriter
{
  public:
    explicit ZipWriter(std::filesystem::path const &target);
    ZipWriter(ZipWriter const &) = delete;
    ZipWriter &operator=(ZipWriter const &) = delete;

    // Throws std::runtime_error on any read, compress or write failure.
    void add_file(std::filesystem::path const &source,
                  std::string const &entry_name);
    void finish();

  private:
    struct Entry
    {
        std::string name;
        std::uint32_t crc = 0;
        std::uint64_t compressed_size = 0;
        std::uint64_t uncompressed_size = 0;
        std::uint64_t header_offset = 0;
        std::uint16_t dos_time = 0;
        std::uint16_t dos_date = 0;
        bool zip64 = false;
    };

    void put16(std::uint16_t value);
    void put32(std::uint32_t value);
    void put64(std::uint64_t value);
    void put_bytes(void const *data, std::size_t size);
    void check_stream(char const *what);

    std::ofstream out_;
    std::uint64_t offset_ = 0;
    std::vector<Entry> entries_;
    bool finished_ = false;
};

} // namespace ft::engine
