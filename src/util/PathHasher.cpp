#include "util/PathHasher.hpp"
#include <openssl/sha.h>
#include <cstring>
#include <vector>

namespace cadence::util {

const model::TrackId& PathHasher::dns_namespace() {
    static const model::TrackId ns{{
        0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
    }};
    return ns;
}

model::TrackId PathHasher::uuid_v5(const model::TrackId& ns, std::string_view name) {
    std::vector<unsigned char> input(ns.bytes.size() + name.size());
    std::memcpy(input.data(), ns.bytes.data(), ns.bytes.size());
    if (!name.empty()) {
        std::memcpy(input.data() + ns.bytes.size(), name.data(), name.size());
    }

    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(input.data(), input.size(), digest);

    model::TrackId id;
    std::memcpy(id.bytes.data(), digest, id.bytes.size());
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | 0x50);
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);
    return id;
}

model::TrackId PathHasher::track_id(std::string_view path) {
    return uuid_v5(dns_namespace(), path);
}

}  // namespace cadence::util
