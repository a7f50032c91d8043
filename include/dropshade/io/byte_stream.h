#pragma once

#include <dropshade/core/error.h>

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace dropshade::io {

struct ReadResult {
    bool ok = false;
    std::vector<std::uint8_t> bytes;
    core::Error error;
};

ReadResult read_file(const std::string& path);

// Reads until EOF. An empty stream is an EmptyInput error.
ReadResult read_stream(std::istream& in);

// Both return an Error with code None on success.
core::Error write_file(const std::string& path, const std::vector<std::uint8_t>& bytes);
core::Error write_stream(std::ostream& out, const std::vector<std::uint8_t>& bytes);

}  // namespace dropshade::io
