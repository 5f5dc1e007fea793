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
#include <fstream>

#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "jsoncpp/json.hpp"
#include "jsoncpp/as.hpp"
#include "jsoncpp/io.hpp"

#include "../../storage/error.hpp"
#include "../../storage/atomicfile.hpp"

#include "config.hpp"

namespace fs = boost::filesystem;

namespace toastlibs { namespace toast {

const char* extension(Format format)
{
    switch (format) {
    case Format::png: return ".png";
    case Format::jpg: return ".jpg";
    case Format::npy: return ".npy";
    }
    throw;
}

namespace pyramidio {

const char *ConfigName("toast-pyramid.json");

namespace detail {

const int CURRENT_JSON_FORMAT_VERSION(1);

template <typename Enum>
Enum parseEnum(const Json::Value &config, const char *name)
{
    std::string value;
    Json::get(value, config, name);
    try {
        return boost::lexical_cast<Enum>(value);
    } catch (const boost::bad_lexical_cast&) {
        LOGTHROW(err1, Json::Error)
            << "Invalid value <" << value << "> of " << name << ".";
    }
    throw;
}

PyramidConfig parse1(const Json::Value &config)
{
    PyramidConfig pc;

    pc.format = parseEnum<Format>(config, "format");
    pc.scheme = parseEnum<PathScheme>(config, "scheme");
    Json::get(pc.verticalParitySign, config, "verticalParitySign");
    Json::get(pc.tileSize, config, "tileSize");

    if ((pc.verticalParitySign != -1) && (pc.verticalParitySign != 1)) {
        LOGTHROW(err1, Json::Error)
            << "Vertical parity sign must be -1 or +1, got "
            << pc.verticalParitySign << ".";
    }

    if (pc.tileSize <= 0) {
        LOGTHROW(err1, Json::Error)
            << "Invalid tile size " << pc.tileSize << ".";
    }

    return pc;
}

void build(Json::Value &config, const PyramidConfig &pc)
{
    config["version"] = Json::Int64(CURRENT_JSON_FORMAT_VERSION);

    config["format"] = boost::lexical_cast<std::string>(pc.format);
    config["scheme"] = boost::lexical_cast<std::string>(pc.scheme);
    config["verticalParitySign"] = pc.verticalParitySign;
    config["tileSize"] = pc.tileSize;
}

} // namespace detail

PyramidConfig loadConfig(std::istream &in, const fs::path &path)
{
    // load json
    auto config(Json::read<storage::FormatError>
                (in, path, "pyramid config"));

    try {
        int version(0);
        Json::get(version, config, "version");

        switch (version) {
        case 1:
            return detail::parse1(config);
        }

        LOGTHROW(err1, storage::FormatError)
            << "Invalid pyramid config format: unsupported version "
            << version << ".";

    } catch (const Json::Error &e) {
        LOGTHROW(err1, storage::FormatError)
            << "Invalid pyramid config format (" << e.what()
            << "); Unable to work with this pyramid.";
    }
    throw;
}

void saveConfig(std::ostream &out, const PyramidConfig &config)
{
    Json::Value value;
    detail::build(value, config);
    Json::write(out, value);
}

PyramidConfig loadConfig(const fs::path &path)
{
    LOG(info1) << "Loading pyramid config from " << path  << ".";
    std::ifstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    try {
        f.open(path.string(), std::ios_base::in);
        f.peek();
    } catch (const std::exception &e) {
        LOGTHROW(err1, storage::NoSuchPyramid)
            << "Unable to load config file " << path << ".";
    }
    auto pc(loadConfig(f, path));
    f.close();
    return pc;
}

void saveConfig(const fs::path &path, const PyramidConfig &config)
{
    LOG(info1) << "Saving pyramid config to " << path  << ".";

    // safe save
    storage::AtomicFile af(path);
    std::ofstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    f.open(af.tmpPath().string(), std::ios_base::out);
    saveConfig(f, config);
    f.close();
    af.commit();
}

} // namespace pyramidio

} } // namespace toastlibs::toast
