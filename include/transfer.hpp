#pragma once

#include <string>
#include <stdexcept>
#include <filesystem>

namespace transfer {

enum class TransferStage {
    CREATE,
    WRITE,
    FLUSH,
    SYNC
};

const char* stage_name(TransferStage stage);

class TransferError : public std::runtime_error {
public:
    TransferError(TransferStage stage, const std::string& what)
        : std::runtime_error(what), stage_(stage) {}

    TransferStage stage() const { return stage_; }

private:
    TransferStage stage_;
};

// Creates or truncates `filepath`, writes `data`, then fsyncs before returning.
// Last writer wins when two uploads target the same name.
void write_file(const std::filesystem::path& filepath, const std::string& data);

} // namespace transfer
