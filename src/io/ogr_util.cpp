#include "io/ogr_util.hpp"
#include <cpl_conv.h>
#include <ogr_feature.h>
#include <ogr_spatialref.h>

namespace tidemark::io {

std::string crs_string(const OGRSpatialReference* srs) {
    if (!srs) return {};

    OGRSpatialReference copy(*srs);
    copy.AutoIdentifyEPSG();
    const char* authority = copy.GetAuthorityName(nullptr);
    const char* code = copy.GetAuthorityCode(nullptr);
    if (authority && code) {
        return std::string(authority) + ":" + code;
    }

    char* wkt = nullptr;
    std::string result;
    if (copy.exportToWkt(&wkt) == OGRERR_NONE && wkt) {
        result = wkt;
    }
    CPLFree(wkt);
    return result;
}

Value field_value(const OGRFeature& feature, int index) {
    if (!feature.IsFieldSetAndNotNull(index)) return Value();

    switch (feature.GetFieldDefnRef(index)->GetType()) {
        case OFTInteger:
        case OFTInteger64:
            return static_cast<int64_t>(feature.GetFieldAsInteger64(index));
        case OFTReal:
            return feature.GetFieldAsDouble(index);
        default:
            return std::string(feature.GetFieldAsString(index));
    }
}

} // namespace tidemark::io
