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
#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "jsoncpp/json.hpp"
#include "jsoncpp/as.hpp"
#include "jsoncpp/io.hpp"

#include "../../storage/error.hpp"

#include "metadata.hpp"

namespace fs = boost::filesystem;

namespace toastlibs { namespace toast {

namespace detail {

const int CURRENT_JSON_FORMAT_VERSION(1);

TileMetadata parse1(const Json::Value &value)
{
    TileMetadata metadata;

    std::string provenance;
    Json::get(provenance, value, "provenance");
    try {
        metadata.provenance = boost::lexical_cast<Provenance>(provenance);
    } catch (const boost::bad_lexical_cast&) {
        LOGTHROW(err1, Json::Error)
            << "Invalid provenance <" << provenance << ">.";
    }

    if (value.isMember("dataRange")) {
        const auto &dataRange(value["dataRange"]);
        if (!dataRange.isArray() || (dataRange.size() != 2)) {
            LOGTHROW(err1, Json::Error)
                << "Type of dataRange is not a 2-element array.";
        }

        const auto &min(dataRange[Json::ArrayIndex(0)]);
        const auto &max(dataRange[Json::ArrayIndex(1)]);
        if (!min.isNumeric() || !max.isNumeric()) {
            LOGTHROW(err1, Json::Error)
                << "Type of dataRange element is not a number.";
        }
        metadata.dataRange.min = min.asDouble();
        metadata.dataRange.max = max.asDouble();
    }

    return metadata;
}

void build(Json::Value &value, const TileMetadata &metadata)
{
    value["version"] = Json::Int64(CURRENT_JSON_FORMAT_VERSION);
    value["provenance"] = boost::lexical_cast<std::string>
        (metadata.provenance);

    if (!metadata.dataRange.empty()) {
        auto &dataRange(value["dataRange"] = Json::arrayValue);
        dataRange.append(metadata.dataRange.min);
        dataRange.append(metadata.dataRange.max);
    }
}

} // namespace detail

TileMetadata loadMetadata(std::istream &in, const fs::path &path)
{
    auto value(Json::read<storage::Corrupted>(in, path, "tile metadata"));

    try {
        int version(0);
        Json::get(version, value, "version");

        switch (version) {
        case 1:
            return detail::parse1(value);
        }

        LOGTHROW(err1, storage::Corrupted)
            << "Invalid tile metadata format: unsupported version "
            << version << ".";

    } catch (const Json::Error &e) {
        LOGTHROW(err1, storage::Corrupted)
            << "Invalid tile metadata format in " << path << " ("
            << e.what() << ").";
    }
    throw;
}

void saveMetadata(std::ostream &out, const TileMetadata &metadata)
{
    Json::Value value;
    detail::build(value, metadata);
    out.precision(15);
    Json::write(out, value);
}

} } // namespace toastlibs::toast
