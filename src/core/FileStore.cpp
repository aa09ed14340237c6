#include "core/FileStore.hpp"

#include <fstream>
#include <iterator>

#include "util/Checksum.hpp"

namespace fs = std::filesystem;

namespace havc {

Expected<std::string> LocalFileStore::read(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) return Error{ErrorCode::IoError, "Cannot stat " + path.string() + ": " + ec.message()};
        return Error{ErrorCode::NotFound, "No such file: " + path.string()};
    }
    if (fs::is_directory(path, ec)) {
        return Error{ErrorCode::IoError, "Is a directory: " + path.string()};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) return Error{ErrorCode::IoError, "Failed to open " + path.string() + " for reading"};
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return Error{ErrorCode::IoError, "Failed to read " + path.string()};
    return bytes;
}

Expected<void> LocalFileStore::write(const fs::path& path, const std::string& bytes) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) return Error{ErrorCode::IoError, "Failed to open " + path.string() + " for writing"};
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) return Error{ErrorCode::IoError, "Failed to write " + path.string()};
        out.close();
        if (out.fail()) return Error{ErrorCode::IoError, "Failed to close " + path.string()};
    }

    auto written = read(path);
    if (!written) {
        return Error{ErrorCode::IoError, "Cannot verify " + path.string() + ": " + written.error().message};
    }
    Checksum expected = Checksum::of(bytes);
    Checksum actual = Checksum::of(written.value());
    if (actual != expected) {
        return Error{ErrorCode::IoError, "Short or corrupted write to " + path.string()
            + " (expected " + expected.toString() + ", found " + actual.toString() + ")"};
    }
    return {};
}

Expected<void> LocalFileStore::ensureParentDirectory(const fs::path& path) {
    fs::path dir = path.parent_path();
    if (dir.empty()) return {};
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return {};
    fs::create_directories(dir, ec);
    if (ec) return Error{ErrorCode::IoError, "Failed to create directory " + dir.string() + ": " + ec.message()};
    return {};
}

}
