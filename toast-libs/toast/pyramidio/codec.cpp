/**
 * Copyright (c) 2017 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */
#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>

#include <boost/format.hpp>
#include <boost/endian/conversion.hpp>

#include <opencv2/highgui/highgui.hpp>
#include <opencv2/imgproc/imgproc.hpp>

#include "dbglog/dbglog.hpp"

#include "../../storage/error.hpp"

#include "codec.hpp"

namespace fs = boost::filesystem;

namespace toastlibs { namespace toast {

namespace {

const int JpegQuality(92);

std::vector<unsigned char> encodeImage(const cv::Mat &image, Format format)
{
    std::vector<unsigned char> buf;
    bool ok(false);
    if (format == Format::jpg) {
        ok = cv::imencode(".jpg", image, buf
                          , { cv::IMWRITE_JPEG_QUALITY, JpegQuality });
    } else {
        ok = cv::imencode(".png", image, buf);
    }

    if (!ok) {
        LOGTHROW(err1, storage::FormatError)
            << "Unable to encode image as <" << format << ">.";
    }
    return buf;
}

TileImage decodeImage(const std::vector<unsigned char> &data
                      , const fs::path &path)
{
    auto image(cv::imdecode(data, cv::IMREAD_UNCHANGED));
    if (!image.data || (image.depth() != CV_8U)) {
        LOGTHROW(err1, storage::Corrupted)
            << "Cannot decode tile image from file " << path << ".";
    }

    cv::Mat out;
    switch (image.channels()) {
    case 1:
        cv::cvtColor(image, out, cv::COLOR_GRAY2RGB);
        return TileImage(ImageMode::rgb, out);

    case 3:
        cv::cvtColor(image, out, cv::COLOR_BGR2RGB);
        return TileImage(ImageMode::rgb, out);

    case 4:
        cv::cvtColor(image, out, cv::COLOR_BGRA2RGBA);
        return TileImage(ImageMode::rgba, out);
    }

    LOGTHROW(err1, storage::Corrupted)
        << "Unsupported number of channels (" << image.channels()
        << ") in tile image " << path << ".";
    throw;
}

/** Returns value of given key in NumPy header dictionary.
 */
std::string headerValue(const std::string &header, const std::string &key
                        , const fs::path &path)
{
    const auto quoted("'" + key + "'");
    auto pos(header.find(quoted));
    if (pos != std::string::npos) {
        pos = header.find(':', pos + quoted.size());
    }
    if (pos == std::string::npos) {
        LOGTHROW(err1, storage::Corrupted)
            << "NumPy header in " << path << " lacks key <" << key << ">.";
    }

    ++pos;
    while ((pos < header.size()) && (header[pos] == ' ')) { ++pos; }

    std::string::size_type end;
    if ((pos < header.size()) && (header[pos] == '(')) {
        end = header.find(')', pos);
        if (end != std::string::npos) { ++end; }
    } else {
        end = header.find_first_of(",}", pos);
    }

    if (end == std::string::npos) {
        LOGTHROW(err1, storage::Corrupted)
            << "Malformed NumPy header in " << path << ".";
    }

    return header.substr(pos, end - pos);
}

} // namespace

bool compatible(ImageMode mode, Format format)
{
    switch (format) {
    case Format::png: return mode != ImageMode::f32;
    case Format::jpg: return mode == ImageMode::rgb;
    case Format::npy: return mode == ImageMode::f32;
    }
    throw;
}

std::vector<unsigned char> encode(const TileImage &image, Format format)
{
    if (!compatible(image.mode(), format)) {
        LOGTHROW(err1, storage::FormatError)
            << "Image of mode <" << image.mode()
            << "> cannot be stored as <" << format << ">.";
    }

    cv::Mat tmp;
    switch (image.mode()) {
    case ImageMode::f32:
        return npy::write(image.data());

    case ImageMode::rgb:
        cv::cvtColor(image.data(), tmp, cv::COLOR_RGB2BGR);
        return encodeImage(tmp, format);

    case ImageMode::rgba:
        cv::cvtColor(image.data(), tmp, cv::COLOR_RGBA2BGRA);
        return encodeImage(tmp, format);
    }
    throw;
}

TileImage decode(const std::vector<unsigned char> &data, Format format
                 , const fs::path &path)
{
    switch (format) {
    case Format::png:
    case Format::jpg:
        return decodeImage(data, path);

    case Format::npy:
        return TileImage(ImageMode::f32, npy::read(data, path));
    }
    throw;
}

namespace npy {

namespace {

const char Magic[] = "\x93NUMPY";
const std::size_t MagicSize(6);

} // namespace

std::vector<unsigned char> write(const cv::Mat &data)
{
    if ((data.type() != CV_32FC1) || (data.dims != 2)) {
        LOGTHROW(err1, storage::FormatError)
            << "Only 2D float matrices can be stored as NumPy array.";
    }

    auto header(str(boost::format
                    ("{'descr': '<f4', 'fortran_order': False, "
                     "'shape': (%d, %d), }") % data.rows % data.cols));

    // magic + version + header length + header + newline aligned to 64
    const std::size_t prefix(MagicSize + 2 + 2);
    const auto total(prefix + header.size() + 1);
    header.append((64 - total % 64) % 64, ' ');
    header.push_back('\n');

    std::vector<unsigned char> out;
    out.reserve(prefix + header.size()
                + data.total() * sizeof(float));

    out.insert(out.end(), Magic, Magic + MagicSize);
    out.push_back(1);
    out.push_back(0);
    out.push_back(header.size() & 0xff);
    out.push_back((header.size() >> 8) & 0xff);
    out.insert(out.end(), header.begin(), header.end());

    // stored as little-endian regardless of host byte order
    for (int j(0); j < data.rows; ++j) {
        const auto *row(data.ptr<float>(j));
        for (int i(0); i < data.cols; ++i) {
            std::uint32_t bits;
            std::memcpy(&bits, row + i, sizeof(bits));
            boost::endian::native_to_little_inplace(bits);

            unsigned char bytes[sizeof(bits)];
            std::memcpy(bytes, &bits, sizeof(bits));
            out.insert(out.end(), bytes, bytes + sizeof(bits));
        }
    }

    return out;
}

cv::Mat read(const std::vector<unsigned char> &data, const fs::path &path)
{
    if ((data.size() < MagicSize + 4)
        || std::memcmp(data.data(), Magic, MagicSize))
    {
        LOGTHROW(err1, storage::Corrupted)
            << "File " << path << " is not a NumPy array.";
    }

    std::size_t headerSize(0);
    std::size_t offset(0);
    switch (data[MagicSize]) {
    case 1:
        headerSize = data[MagicSize + 2] | (data[MagicSize + 3] << 8);
        offset = MagicSize + 4;
        break;

    case 2:
    case 3:
        if (data.size() < MagicSize + 6) {
            LOGTHROW(err1, storage::Corrupted)
                << "Truncated NumPy header in " << path << ".";
        }
        headerSize = (std::size_t(data[MagicSize + 2])
                      | (std::size_t(data[MagicSize + 3]) << 8)
                      | (std::size_t(data[MagicSize + 4]) << 16)
                      | (std::size_t(data[MagicSize + 5]) << 24));
        offset = MagicSize + 6;
        break;

    default:
        LOGTHROW(err1, storage::Corrupted)
            << "Unsupported NumPy format version "
            << int(data[MagicSize]) << " in " << path << ".";
    }

    if (data.size() < offset + headerSize) {
        LOGTHROW(err1, storage::Corrupted)
            << "Truncated NumPy header in " << path << ".";
    }

    const std::string header(data.begin() + offset
                             , data.begin() + offset + headerSize);
    offset += headerSize;

    const auto descr(headerValue(header, "descr", path));
    bool bigEndian(false);
    if ((descr == "'>f4'") || (descr == "\">f4\"")) {
        bigEndian = true;
    } else if ((descr != "'<f4'") && (descr != "\"<f4\"")) {
        LOGTHROW(err1, storage::Corrupted)
            << "Unsupported NumPy data type " << descr << " in "
            << path << ".";
    }

    if (headerValue(header, "fortran_order", path) != "False") {
        LOGTHROW(err1, storage::Corrupted)
            << "Fortran ordered NumPy array in " << path
            << " is not supported.";
    }

    // shape: "(rows, cols)"
    int rows(0), cols(0);
    {
        std::istringstream is(headerValue(header, "shape", path));
        char open(0), comma(0), close(0);
        is >> open >> rows >> comma >> cols >> close;
        if (is.fail() || (open != '(') || (comma != ',') || (close != ')')
            || (rows <= 0) || (cols <= 0))
        {
            LOGTHROW(err1, storage::Corrupted)
                << "Unsupported NumPy array shape in " << path << ".";
        }
    }

    const auto size(std::size_t(rows) * cols * sizeof(float));
    if ((data.size() - offset) != size) {
        LOGTHROW(err1, storage::Corrupted)
            << "NumPy array in " << path << " has " << (data.size() - offset)
            << " bytes of data, expected " << size << ".";
    }

    cv::Mat out(rows, cols, CV_32FC1);
    const auto *in(data.data() + offset);
    for (int j(0); j < rows; ++j) {
        auto *row(out.ptr<float>(j));
        for (int i(0); i < cols; ++i, in += sizeof(std::uint32_t)) {
            std::uint32_t bits;
            std::memcpy(&bits, in, sizeof(bits));
            if (bigEndian) {
                boost::endian::big_to_native_inplace(bits);
            } else {
                boost::endian::little_to_native_inplace(bits);
            }
            std::memcpy(row + i, &bits, sizeof(bits));
        }
    }
    return out;
}

} // namespace npy

} } // namespace toastlibs::toast
