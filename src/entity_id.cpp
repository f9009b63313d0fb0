#include "entity_id.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cctype>
#include <random>

namespace engram {

static constexpr const char* CROCKFORD = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

static int crockford_value(char c) {
    for (int i = 0; i < 32; ++i) {
        if (CROCKFORD[i] == c) return i;
    }
    return -1;
}

static std::string encode_time(uint64_t millis) {
    std::string out(ID_TIME_CHARS, '0');
    for (size_t i = ID_TIME_CHARS; i-- > 0;) {
        out[i] = CROCKFORD[millis & 31];
        millis >>= 5;
    }
    return out;
}

static std::string encode_random() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 31);
    std::string out(ID_RANDOM_CHARS, '0');
    for (auto& c : out) {
        c = CROCKFORD[dist(gen)];
    }
    return out;
}

std::string generate_id(const std::string& prefix) {
    return generate_id_at(prefix, epoch_millis());
}

std::string generate_id_at(const std::string& prefix, uint64_t millis) {
    std::string body = encode_time(millis) + encode_random();
    if (prefix.empty()) return body;
    return prefix + "_" + body;
}

uint64_t timestamp_of(const std::string& id) {
    std::string body = id;
    auto sep = id.rfind('_');
    if (sep != std::string::npos) {
        body = id.substr(sep + 1);
    }
    for (auto& c : body) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (body.size() < ID_TIME_CHARS) {
        throw EngramError(ErrorCode::InvalidIdentifier,
                          "identifier '" + id + "' is too short to carry a timestamp");
    }

    uint64_t millis = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        int v = crockford_value(body[i]);
        if (v < 0) {
            throw EngramError(ErrorCode::InvalidIdentifier,
                              "identifier '" + id + "' contains invalid character '" +
                              std::string(1, body[i]) + "'");
        }
        if (i < ID_TIME_CHARS) {
            millis = (millis << 5) | static_cast<uint64_t>(v);
        }
    }
    return millis;
}

} // namespace engram
