#pragma once

#include "model/Track.hpp"
#include <string_view>

namespace cadence::util {

/**
 * Derives track identifiers from file paths.
 *
 * RFC 4122 version 5 UUID in the DNS namespace: SHA-1 over the namespace
 * bytes followed by the path bytes, truncated to 16 bytes with the version
 * and variant bits stamped in. Pure function of the path.
 */
class PathHasher {
public:
    static model::TrackId track_id(std::string_view path);

    // 6ba7b810-9dad-11d1-80b4-00c04fd430c8
    static const model::TrackId& dns_namespace();

    static model::TrackId uuid_v5(const model::TrackId& ns, std::string_view name);
};

}  // namespace cadence::util
