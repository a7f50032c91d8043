#include <dropshade/io/byte_stream.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace dropshade::io {

namespace {

std::string errno_text() {
    return errno != 0 ? std::strerror(errno) : "unknown error";
}

ReadResult read_all(std::istream& in, const std::string& source) {
    ReadResult result;
    result.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        result.bytes.clear();
        result.error = {core::ErrorCode::ReadFailed, "error reading " + source};
        return result;
    }
    if (result.bytes.empty()) {
        result.error = {core::ErrorCode::EmptyInput,
                        "no input data received from " + source};
        return result;
    }
    result.ok = true;
    return result;
}

}  // namespace

ReadResult read_file(const std::string& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        ReadResult result;
        result.error = {core::ErrorCode::ReadFailed,
                        "cannot open " + path + ": " + errno_text()};
        return result;
    }
    return read_all(file, path);
}

ReadResult read_stream(std::istream& in) {
    return read_all(in, "standard input");
}

core::Error write_file(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return {core::ErrorCode::WriteFailed, "cannot open " + path + ": " + errno_text()};
    }
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        return {core::ErrorCode::WriteFailed, "failed to write " + path};
    }
    return {};
}

core::Error write_stream(std::ostream& out, const std::vector<std::uint8_t>& bytes) {
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        return {core::ErrorCode::WriteFailed, "failed to write to standard output"};
    }
    return {};
}

}  // namespace dropshade::io
