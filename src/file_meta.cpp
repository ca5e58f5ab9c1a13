#include "protocol/file_meta.hpp"
#include <ctime>
#include <cstdio>

namespace protocol {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    auto since_epoch = tp.time_since_epoch();
    auto secs = duration_cast<seconds>(since_epoch);
    auto nanos = duration_cast<nanoseconds>(since_epoch - secs).count();
    if (nanos < 0) {
        secs -= seconds(1);
        nanos += 1000000000;
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char frac[16] = "";
    if (nanos != 0) {
        if (nanos % 1000000 == 0) {
            std::snprintf(frac, sizeof(frac), ".%03lld", static_cast<long long>(nanos / 1000000));
        } else if (nanos % 1000 == 0) {
            std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(nanos / 1000));
        } else {
            std::snprintf(frac, sizeof(frac), ".%09lld", static_cast<long long>(nanos));
        }
    }
    return std::string(base) + frac + "Z";
}

void to_json(nlohmann::json& j, const FileRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"name", record.name},
        {"path", record.path},
        {"size", record.size},
        {"size_human", record.size_human},
        {"modified", format_timestamp(record.modified)},
        {"mime_type", record.mime_type}
    };
}

} // namespace protocol
