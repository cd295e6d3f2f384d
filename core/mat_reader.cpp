
#include "config.h"

#include "mat_reader.hpp"

#include <algorithm>
#include <cstddef>
#include <bit>
#include <fstream>
#include <iterator>
#include <optional>
#include <ranges>

#include "except.h"
#include "gsl/gsl"
#include "hfstring.h"
#include "logging.h"
#include "zlib.h"


namespace hf {

namespace {

using namespace std::string_view_literals;

enum ByteOrderT {
    BO_LITTLE,
    BO_BIG
};

/* Data element types. */
enum MatDataType : u32 {
    miINT8 = 1,
    miUINT8 = 2,
    miINT16 = 3,
    miUINT16 = 4,
    miINT32 = 5,
    miUINT32 = 6,
    miSINGLE = 7,
    miDOUBLE = 9,
    miINT64 = 12,
    miUINT64 = 13,
    miMATRIX = 14,
    miCOMPRESSED = 15,
    miUTF8 = 16,
    miUTF16 = 17,
    miUTF32 = 18
};

/* Array classes, from the low byte of the array flags. */
enum MatClass : u32 {
    mxCELL_CLASS = 1,
    mxSTRUCT_CLASS = 2,
    mxOBJECT_CLASS = 3,
    mxCHAR_CLASS = 4,
    mxSPARSE_CLASS = 5,
    mxDOUBLE_CLASS = 6,
    mxUINT64_CLASS = 15
};

constexpr auto HeaderSize = 128_uz;
constexpr auto HeaderTextSize = 116_uz;
constexpr auto ComplexFlag = 0x0800_u32;

struct Element {
    u32 type{};
    std::span<const std::byte> data;
};

/* Holds the state for reading the elements of one file. */
struct MatParser {
    ByteOrderT mOrder{BO_LITTLE};
    std::string_view mFilename;

    // Read an unsigned value of 1 to 8 bytes in the file's byte order.
    [[nodiscard]] auto readBin(std::span<const std::byte> const in) const -> u64
    {
        auto accum = u64{0};
        switch(mOrder)
        {
        case BO_LITTLE:
            for(auto i = 0_uz;i < in.size();++i)
                accum = (accum<<8) | std::to_integer<u64>(in[in.size() - i - 1]);
            break;
        case BO_BIG:
            for(auto i = 0_uz;i < in.size();++i)
                accum = (accum<<8) | std::to_integer<u64>(in[i]);
            break;
        }
        return accum;
    }

    [[nodiscard]] auto readBin4(std::span<const std::byte> const in, usize const offset) const
        -> u32
    { return gsl::narrow_cast<u32>(readBin(in.subspan(offset, 4))); }

    /* Reads the element at offset and advances past it, including padding
     * to the next 8-byte boundary.
     */
    auto readElement(std::span<const std::byte> const data, usize &offset) const -> Element
    {
        if(data.size() - offset < 8)
            throw_error<format_error>("mat: {}: truncated element tag at offset {}", mFilename,
                offset);

        auto const word0 = readBin4(data, offset);
        if((word0>>16) != 0)
        {
            /* Small data element, with up to 4 bytes packed into the tag. */
            auto const size = word0 >> 16;
            if(size > 4)
                throw_error<format_error>("mat: {}: bad small element size {} at offset {}",
                    mFilename, size, offset);
            auto ret = Element{word0 & 0xffff, data.subspan(offset+4, size)};
            offset += 8;
            return ret;
        }

        auto const size = usize{readBin4(data, offset+4)};
        offset += 8;
        if(size > data.size() - offset)
            throw_error<format_error>("mat: {}: element of {} bytes at offset {} exceeds the data",
                mFilename, size, offset-8);

        auto ret = Element{word0, data.subspan(offset, size)};
        /* Compressed elements are not padded. */
        if(word0 == miCOMPRESSED)
            offset += size;
        else
            offset = std::min((offset + size + 7) & ~7_uz, data.size());
        return ret;
    }

    template<typename T, typename U>
    void convert(std::span<const std::byte> const in, std::vector<f64> &out) const
    {
        static_assert(sizeof(T) == sizeof(U));
        if(in.size() % sizeof(T) != 0)
            throw_error<format_error>("mat: {}: {} bytes is not a multiple of the {}-byte type",
                mFilename, in.size(), sizeof(T));

        out.reserve(in.size() / sizeof(T));
        for(auto i = 0_uz;i < in.size();i += sizeof(T))
        {
            auto const bits = gsl::narrow_cast<U>(readBin(in.subspan(i, sizeof(T))));
            out.emplace_back(static_cast<f64>(std::bit_cast<T>(bits)));
        }
    }

    [[nodiscard]] auto toDoubles(const Element &elem) const -> std::vector<f64>
    {
        auto ret = std::vector<f64>{};
        switch(elem.type)
        {
        case miINT8: convert<i8,u8>(elem.data, ret); break;
        case miUINT8: convert<u8,u8>(elem.data, ret); break;
        case miINT16: convert<i16,u16>(elem.data, ret); break;
        case miUINT16: convert<u16,u16>(elem.data, ret); break;
        case miINT32: convert<i32,u32>(elem.data, ret); break;
        case miUINT32: convert<u32,u32>(elem.data, ret); break;
        case miSINGLE: convert<f32,u32>(elem.data, ret); break;
        case miDOUBLE: convert<f64,u64>(elem.data, ret); break;
        case miINT64: convert<i64,u64>(elem.data, ret); break;
        case miUINT64: convert<u64,u64>(elem.data, ret); break;
        default:
            throw_error<format_error>("mat: {}: unsupported numeric data type {}", mFilename,
                elem.type);
        }
        return ret;
    }

    [[nodiscard]] auto parseMatrix(const Element &elem) const -> std::optional<MatArray>
    {
        auto offset = 0_uz;

        auto const flags = readElement(elem.data, offset);
        if(flags.type != miUINT32 || flags.data.size() < 8)
            throw_error<format_error>("mat: {}: malformed array flags", mFilename);
        auto const flagword = readBin4(flags.data, 0);
        auto const arrayClass = flagword & 0xff;

        auto const dimselem = readElement(elem.data, offset);
        if(dimselem.type != miINT32 || dimselem.data.size() < 8 || dimselem.data.size()%4 != 0)
            throw_error<format_error>("mat: {}: malformed array dimensions", mFilename);

        auto ret = MatArray{};
        auto numel = 1_uz;
        for(auto i = 0_uz;i < dimselem.data.size();i += 4)
        {
            auto const dim = std::bit_cast<i32>(readBin4(dimselem.data, i));
            if(dim < 0)
                throw_error<format_error>("mat: {}: negative array dimension", mFilename);
            ret.dims.emplace_back(gsl::narrow_cast<usize>(dim));
            numel *= gsl::narrow_cast<usize>(dim);
        }

        auto const nameelem = readElement(elem.data, offset);
        if(nameelem.type != miINT8 && nameelem.type != miUINT8)
            throw_error<format_error>("mat: {}: malformed array name", mFilename);
        std::ranges::transform(nameelem.data, std::back_inserter(ret.name),
            [](const std::byte b) { return std::to_integer<char>(b); });

        if(arrayClass < mxDOUBLE_CLASS || arrayClass > mxUINT64_CLASS)
        {
            TRACE("{}: skipping non-numeric variable '{}' (class {})", mFilename, ret.name,
                arrayClass);
            return std::nullopt;
        }

        if(numel > 0)
        {
            auto const real = readElement(elem.data, offset);
            ret.values = toDoubles(real);
        }
        if(ret.values.size() != numel)
            throw_error<format_error>("mat: {}: variable '{}' has {} values, expected {}",
                mFilename, ret.name, ret.values.size(), numel);
        if((flagword&ComplexFlag))
            WARN("{}: using the real part of complex variable '{}'", mFilename, ret.name);

        return ret;
    }
};

/* Inflates the zlib stream held by a miCOMPRESSED element. */
auto Inflate(std::span<const std::byte> const in, std::string_view const filename)
    -> std::vector<std::byte>
{
    auto strm = z_stream{};
    auto status = inflateInit(&strm);
    if(status != Z_OK)
        throw_error<format_error>("mat: {}: failed to initialize zlib: {}", filename,
            zError(status));
    auto const cleanup = gsl::finally([&strm] { inflateEnd(&strm); });

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(in.data()));
    strm.avail_in = gsl::narrow<uInt>(in.size());

    auto ret = std::vector<std::byte>(std::max(in.size()*2, 1024_uz));
    do {
        auto const produced = gsl::narrow_cast<usize>(strm.total_out);
        if(produced == ret.size())
            ret.resize(ret.size()*2);
        strm.next_out = reinterpret_cast<Bytef*>(ret.data() + produced);
        strm.avail_out = gsl::narrow<uInt>(ret.size() - produced);
        status = inflate(&strm, Z_NO_FLUSH);
        if(status == Z_BUF_ERROR && strm.avail_in == 0)
            throw_error<format_error>("mat: {}: truncated compressed variable", filename);
    } while(status == Z_OK || status == Z_BUF_ERROR);

    if(status != Z_STREAM_END)
        throw_error<format_error>("mat: {}: bad compressed variable: {}", filename,
            strm.msg ? strm.msg : zError(status));

    ret.resize(gsl::narrow_cast<usize>(strm.total_out));
    return ret;
}

} // namespace

auto MatFile::Load(const std::filesystem::path &fname) -> MatFile
{
    auto const filename = std::string{hf::u8_as_char(fname.u8string())};
    auto istream = std::ifstream{fname, std::ios::binary};
    if(!istream.is_open())
        throw_error<format_error>("mat: could not open {}", filename);

    auto data = std::vector<std::byte>{};
    std::ranges::transform(std::istreambuf_iterator<char>{istream},
        std::istreambuf_iterator<char>{}, std::back_inserter(data),
        [](const char c) { return std::byte(static_cast<unsigned char>(c)); });
    if(istream.bad())
        throw_error<format_error>("mat: bad read from {}", filename);

    return Parse(data, filename);
}

auto MatFile::Parse(std::span<const std::byte> const data, std::string_view const name) -> MatFile
{
    if(data.size() < HeaderSize)
        throw_error<format_error>("mat: {}: file too small for a MAT-file header", name);

    auto text = std::string{};
    std::ranges::transform(data.first(HeaderTextSize), std::back_inserter(text),
        [](const std::byte b) { return std::to_integer<char>(b); });
    if(text.starts_with("MATLAB 7.3"sv))
        throw_error<format_error>("mat: {}: v7.3 (HDF5) MAT-files are not supported", name);

    auto parser = MatParser{BO_LITTLE, name};
    auto const endian0 = std::to_integer<char>(data[126]);
    auto const endian1 = std::to_integer<char>(data[127]);
    if(endian0 == 'I' && endian1 == 'M')
        parser.mOrder = BO_LITTLE;
    else if(endian0 == 'M' && endian1 == 'I')
        parser.mOrder = BO_BIG;
    else
        throw_error<format_error>("mat: {}: not a MATLAB 5.0 MAT-file", name);

    if(auto const version = parser.readBin(data.subspan(124, 2)); version != 0x0100)
        throw_error<format_error>("mat: {}: unsupported MAT-file version {:#06x}", name,
            version);

    auto ret = MatFile{};
    auto add_matrix = [&ret,&parser,name](const Element &elem)
    {
        if(elem.type != miMATRIX)
        {
            TRACE("{}: skipping top-level element type {}", name, elem.type);
            return;
        }
        if(auto arr = parser.parseMatrix(elem))
            ret.mArrays.emplace_back(std::move(*arr));
    };

    auto offset = HeaderSize;
    while(data.size() - offset >= 8)
    {
        auto const elem = parser.readElement(data, offset);
        if(elem.type != miCOMPRESSED)
        {
            add_matrix(elem);
            continue;
        }

        /* A compressed element inflates to one or more whole elements. */
        auto const inflated = Inflate(elem.data, name);
        auto const inner = std::span<const std::byte>{inflated};
        auto inneroffset = 0_uz;
        while(inner.size() - inneroffset >= 8)
            add_matrix(parser.readElement(inner, inneroffset));
    }

    TRACE("Parsed {}: {} numeric variables", name, ret.mArrays.size());
    return ret;
}

auto MatFile::find(std::string_view const name) const noexcept -> const MatArray*
{
    auto iter = std::ranges::find(mArrays, name, &MatArray::name);
    return (iter != mArrays.end()) ? &*iter : nullptr;
}

} // namespace hf
