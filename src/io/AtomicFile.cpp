// src/io/AtomicFile.cpp
#include "blockworld/io/AtomicFile.hpp"

#include <fstream>
#include <system_error>

namespace {

bool write_stream(const std::filesystem::path& path, const std::string& bytes, std::string* err)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (err) *err = "cannot open " + path.string() + " for writing";
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        if (err) *err = "write to " + path.string() + " failed";
        return false;
    }
    out.close();
    if (out.fail()) {
        if (err) *err = "closing " + path.string() + " failed";
        return false;
    }
    return true;
}

} // namespace

namespace blockworld::io {

bool write_direct(const fs::path& path, const std::string& bytes, std::string* err)
{
    return write_stream(path, bytes, err);
}

bool write_atomic(const fs::path& final_path, const std::string& bytes, std::string* err, bool make_backup)
{
    std::error_code ec;
    if (fs::is_directory(final_path, ec)) {
        if (err) *err = final_path.string() + " is a directory";
        return false;
    }

    auto tmp = final_path;
    tmp += ".tmp";

    if (!write_stream(tmp, bytes, err)) {
        fs::remove(tmp, ec);
        return false;
    }

    if (make_backup && fs::exists(final_path, ec)) {
        fs::copy_file(final_path, default_backup_path(final_path), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            if (err) *err = "backup of " + final_path.string() + " failed: " + ec.message();
            std::error_code rec;
            fs::remove(tmp, rec);
            return false;
        }
    }

    fs::rename(tmp, final_path, ec);
    if (ec) {
        if (err) *err = "rename to " + final_path.string() + " failed: " + ec.message();
        std::error_code rec;
        fs::remove(tmp, rec);
        return false;
    }
    return true;
}

} // namespace blockworld::io
