// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <vector>

#include <boost/iostreams/filter/zlib.hpp>
namespace io = boost::iostreams;

#include <iostreams/filters.hh>

namespace scrub {
namespace iostreams {

std::string inflate(const std::string &src)
{
    return filter_input(src, io::zlib_decompressor());
}

std::string deflate(const std::string &src)
{
    std::string buf;

    {
        io::filtering_ostream str;

        str.push(io::zlib_compressor(io::zlib::best_compression));
        str.push(container_sink_t< std::string >(buf));

        str.write(src.data(), src.size());
        io::close(str);
    }

    return buf;
}

std::string lzw_decode(const std::string &src, bool early_change)
{
    std::string result;

    std::vector< std::string > table;
    table.reserve(4096);

    auto reset = [&]() {
        table.clear();

        for (int i = 0; i < 256; ++i)
            table.emplace_back(1UL, char(i));

        // clear-table and end-of-data markers
        table.emplace_back();
        table.emplace_back();
    };

    reset();

    size_t pos = 0;
    int bits = 9, prev = -1;

    auto read_code = [&]() {
        int code = 0;

        for (int i = 0; i < bits; ++i, ++pos) {
            if (pos / 8 >= src.size())
                return 257;

            const int bit = (static_cast< unsigned char >(src[pos / 8])
                             >> (7 - pos % 8)) & 1;

            code = (code << 1) | bit;
        }

        return code;
    };

    for (;;) {
        const int code = read_code();

        if (code == 257)
            break;

        if (code == 256) {
            reset();
            bits = 9;
            prev = -1;
            continue;
        }

        std::string entry;

        if (code < int(table.size()))
            entry = table[code];
        else if (prev >= 0 && code == int(table.size()))
            entry = table[prev] + table[prev][0];
        else
            break;

        result += entry;

        if (prev >= 0 && table.size() < 4096)
            table.emplace_back(table[prev] + entry[0]);

        prev = code;

        const size_t n = table.size() + (early_change ? 1 : 0);

        if (n >= 2048)
            bits = 12;
        else if (n >= 1024)
            bits = 11;
        else if (n >= 512)
            bits = 10;
    }

    return result;
}

std::string unpredict(const std::string &src, int predictor, int colors,
                      int bpc, int columns)
{
    if (predictor <= 1)
        return src;

    const int bpp = (std::max)(1, (colors * bpc + 7) / 8);
    const size_t row_size = (size_t(colors) * bpc * columns + 7) / 8;

    if (0 == row_size)
        return src;

    std::string data = src;

    if (predictor == 2) {
        //
        // TIFF predictor, 8 bits per component only:
        //
        if (bpc == 8) {
            for (size_t row = 0; (row + 1) * row_size <= data.size(); ++row) {
                auto p = reinterpret_cast< unsigned char * >(
                    &data[row * row_size]);

                for (size_t x = bpp; x < row_size; ++x)
                    p[x] = (p[x] + p[x - bpp]) & 0xFF;
            }
        }

        return data;
    }

    std::string out;
    out.reserve(data.size());

    std::vector< std::uint8_t > prev(row_size, 0), cur(row_size, 0);

    for (size_t i = 0; i < data.size();) {
        const int type = static_cast< unsigned char >(data[i++]);

        const size_t n = (std::min)(row_size, data.size() - i);
        auto row = reinterpret_cast< const unsigned char * >(data.data() + i);

        i += n;

        for (size_t x = 0; x < n; ++x) {
            const int left = x >= size_t(bpp) ? cur[x - bpp] : 0;
            const int up = prev[x];
            const int up_left = x >= size_t(bpp) ? prev[x - bpp] : 0;

            int value = row[x];

            switch (type) {
            case 1: value += left; break;
            case 2: value += up; break;
            case 3: value += (left + up) / 2; break;

            case 4: {
                const int p = left + up - up_left;

                const int pa = std::abs(p - left);
                const int pb = std::abs(p - up);
                const int pc = std::abs(p - up_left);

                value += (pa <= pb && pa <= pc) ? left : pb <= pc ? up : up_left;
            }
                break;

            default:
                break;
            }

            cur[x] = value & 0xFF;
        }

        out.append(reinterpret_cast< const char * >(cur.data()), n);
        std::swap(prev, cur);
    }

    return out;
}

} // namespace iostreams
} // namespace scrub
