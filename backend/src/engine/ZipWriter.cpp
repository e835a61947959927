#include "engine/ZipWriter.hpp"

#include <zlib.h>

#include <array>
#include <chrono>
#include <ctime>
#include <limits>
#include <stdexcept>

namespace ft::engine
{

namespace
{
constexpr std::uint32_t kLocalHeaderSig = 0x04034b50;
constexpr std::uint32_t kDataDescriptorSig = 0x08074b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kEndOfCentralSig = 0x06054b50;
constexpr std::uint32_t kZip64EndSig = 0x06064b50;
constexpr std::uint32_t kZip64LocatorSig = 0x07064b50;
constexpr std::uint16_t kZip64ExtraTag = 0x0001;
constexpr std::uint16_t kFlagDataDescriptor = 0x0008;
constexpr std::uint16_t kFlagUtf8 = 0x0800;
constexpr std::uint16_t kMethodDeflate = 8;
constexpr std::uint16_t kVersionDefault = 20;
constexpr std::uint16_t kVersionZip64 = 45;
constexpr std::uint32_t kMax32 = std::numeric_limits<std::uint32_t>::max();
constexpr std::uint16_t kMax16 = std::numeric_limits<std::uint16_t>::max();
constexpr std::size_t kChunkSize = 256 * 1024;
// Entries whose source is this large are written with ZIP64 headers up
// front, leaving headroom for deflate expansion.
constexpr std::uint64_t kZip64Threshold = 0xFF000000ULL;

void dos_timestamp(std::uint16_t &dos_time, std::uint16_t &dos_date)
{
    auto const now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    int const year = tm.tm_year + 1900 < 1980 ? 1980 : tm.tm_year + 1900;
    dos_time = static_cast<std::uint16_t>((tm.tm_hour << 11) |
                                          (tm.tm_min << 5) | (tm.tm_sec / 2));
    dos_date = static_cast<std::uint16_t>(((year - 1980) << 9) |
                                          ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

struct DeflateStream
{
    z_stream zs{};
    bool initialized = false;

    DeflateStream()
    {
        // raw deflate, the ZIP entry carries its own framing
        if (deflateInit2(&zs, 1, Z_DEFLATED, -MAX_WBITS, 8,
                         Z_DEFAULT_STRATEGY) != Z_OK)
        {
            throw std::runtime_error("deflateInit2 failed");
        }
        initialized = true;
    }

    ~DeflateStream()
    {
        if (initialized)
        {
            deflateEnd(&zs);
        }
    }

    DeflateStream(DeflateStream const &) = delete;
    DeflateStream &operator=(DeflateStream const &) = delete;
};
} // namespace

ZipWriter::ZipWriter(std::filesystem::path const &target)
    : out_(target, std::ios::binary | std::ios::trunc)
{
    if (!out_)
    {
        throw std::runtime_error("cannot open archive for writing: " +
                                 target.string());
    }
}

void ZipWriter::put16(std::uint16_t value)
{
    std::array<unsigned char, 2> bytes{
        static_cast<unsigned char>(value & 0xFF),
        static_cast<unsigned char>((value >> 8) & 0xFF)};
    put_bytes(bytes.data(), bytes.size());
}

void ZipWriter::put32(std::uint32_t value)
{
    put16(static_cast<std::uint16_t>(value & 0xFFFF));
    put16(static_cast<std::uint16_t>((value >> 16) & 0xFFFF));
}

void ZipWriter::put64(std::uint64_t value)
{
    put32(static_cast<std::uint32_t>(value & 0xFFFFFFFFULL));
    put32(static_cast<std::uint32_t>(value >> 32));
}

void ZipWriter::put_bytes(void const *data, std::size_t size)
{
    out_.write(static_cast<char const *>(data),
               static_cast<std::streamsize>(size));
    offset_ += size;
}

void ZipWriter::check_stream(char const *what)
{
    if (!out_)
    {
        throw std::runtime_error(std::string("archive write failed: ") + what);
    }
}

void ZipWriter::add_file(std::filesystem::path const &source,
                         std::string const &entry_name)
{
    if (finished_)
    {
        throw std::runtime_error("archive already finished");
    }
    std::ifstream in(source, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("cannot read " + source.string());
    }
    std::error_code ec;
    auto const source_size = std::filesystem::file_size(source, ec);

    Entry entry;
    entry.name = entry_name;
    entry.header_offset = offset_;
    entry.zip64 = (!ec && source_size >= kZip64Threshold) ||
                  offset_ >= kZip64Threshold;
    dos_timestamp(entry.dos_time, entry.dos_date);

    put32(kLocalHeaderSig);
    put16(entry.zip64 ? kVersionZip64 : kVersionDefault);
    put16(kFlagDataDescriptor | kFlagUtf8);
    put16(kMethodDeflate);
    put16(entry.dos_time);
    put16(entry.dos_date);
    put32(0); // crc, sizes follow in the data descriptor
    put32(entry.zip64 ? kMax32 : 0);
    put32(entry.zip64 ? kMax32 : 0);
    put16(static_cast<std::uint16_t>(entry.name.size()));
    put16(entry.zip64 ? 20 : 0);
    put_bytes(entry.name.data(), entry.name.size());
    if (entry.zip64)
    {
        put16(kZip64ExtraTag);
        put16(16);
        put64(0);
        put64(0);
    }
    check_stream("local header");

    DeflateStream deflater;
    std::vector<unsigned char> input(kChunkSize);
    std::vector<unsigned char> output(kChunkSize);
    uLong crc = crc32(0L, Z_NULL, 0);
    int flush = Z_NO_FLUSH;
    while (flush != Z_FINISH)
    {
        in.read(reinterpret_cast<char *>(input.data()),
                static_cast<std::streamsize>(input.size()));
        auto const got = static_cast<std::size_t>(in.gcount());
        if (in.bad())
        {
            throw std::runtime_error("read failed for " + source.string());
        }
        flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;
        crc = crc32(crc, input.data(), static_cast<uInt>(got));
        entry.uncompressed_size += got;

        deflater.zs.next_in = input.data();
        deflater.zs.avail_in = static_cast<uInt>(got);
        do
        {
            deflater.zs.next_out = output.data();
            deflater.zs.avail_out = static_cast<uInt>(output.size());
            int const rc = deflate(&deflater.zs, flush);
            if (rc == Z_STREAM_ERROR)
            {
                throw std::runtime_error("deflate failed for " +
                                         source.string());
            }
            auto const produced = output.size() - deflater.zs.avail_out;
            put_bytes(output.data(), produced);
            entry.compressed_size += produced;
        } while (deflater.zs.avail_out == 0);
        check_stream("entry data");
    }
    entry.crc = static_cast<std::uint32_t>(crc);

    if (!entry.zip64 && (entry.compressed_size >= kMax32 ||
                         entry.uncompressed_size >= kMax32))
    {
        throw std::runtime_error("entry grew past 4 GiB while writing: " +
                                 entry.name);
    }

    put32(kDataDescriptorSig);
    put32(entry.crc);
    if (entry.zip64)
    {
        put64(entry.compressed_size);
        put64(entry.uncompressed_size);
    }
    else
    {
        put32(static_cast<std::uint32_t>(entry.compressed_size));
        put32(static_cast<std::uint32_t>(entry.uncompressed_size));
    }
    check_stream("data descriptor");
    entries_.push_back(std::move(entry));
}

void ZipWriter::finish()
{
    if (finished_)
    {
        return;
    }
    auto const central_offset = offset_;
    for (auto const &entry : entries_)
    {
        bool const wide = entry.zip64 || entry.header_offset >= kMax32;
        put32(kCentralHeaderSig);
        put16(wide ? kVersionZip64 : kVersionDefault); // made by
        put16(wide ? kVersionZip64 : kVersionDefault); // needed
        put16(kFlagDataDescriptor | kFlagUtf8);
        put16(kMethodDeflate);
        put16(entry.dos_time);
        put16(entry.dos_date);
        put32(entry.crc);
        put32(wide ? kMax32 : static_cast<std::uint32_t>(entry.compressed_size));
        put32(wide ? kMax32
                   : static_cast<std::uint32_t>(entry.uncompressed_size));
        put16(static_cast<std::uint16_t>(entry.name.size()));
        put16(wide ? 28 : 0);
        put16(0); // comment
        put16(0); // disk
        put16(0); // internal attributes
        put32(0); // external attributes
        put32(wide ? kMax32 : static_cast<std::uint32_t>(entry.header_offset));
        put_bytes(entry.name.data(), entry.name.size());
        if (wide)
        {
            put16(kZip64ExtraTag);
            put16(24);
            put64(entry.uncompressed_size);
            put64(entry.compressed_size);
            put64(entry.header_offset);
        }
    }
    auto const central_size = offset_ - central_offset;
    bool const zip64_end = entries_.size() >= kMax16 ||
                           central_offset >= kMax32 ||
                           central_size >= kMax32;
    if (zip64_end)
    {
        auto const zip64_end_offset = offset_;
        put32(kZip64EndSig);
        put64(44);
        put16(kVersionZip64);
        put16(kVersionZip64);
        put32(0);
        put32(0);
        put64(entries_.size());
        put64(entries_.size());
        put64(central_size);
        put64(central_offset);

        put32(kZip64LocatorSig);
        put32(0);
        put64(zip64_end_offset);
        put32(1);
    }
    auto const count16 = zip64_end ? kMax16
                                   : static_cast<std::uint16_t>(entries_.size());
    put32(kEndOfCentralSig);
    put16(0);
    put16(0);
    put16(count16);
    put16(count16);
    put32(zip64_end ? kMax32 : static_cast<std::uint32_t>(central_size));
    put32(zip64_end ? kMax32 : static_cast<std::uint32_t>(central_offset));
    put16(0);
    out_.flush();
    check_stream("central directory");
    out_.close();
    finished_ = true;
}

} // namespace ft::engine
