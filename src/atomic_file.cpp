#include "atomic_file.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace quarry {

void write_file_atomically(const std::string& path,
                           const std::function<void(std::ostream&)>& writer,
                           bool binary) {
    fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + target.parent_path().string() +
                                     ": " + ec.message());
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ios::openmode mode = std::ios::out | std::ios::trunc;
        if (binary) {
            mode |= std::ios::binary;
        }
        std::ofstream file(tmp, mode);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
        }

        try {
            writer(file);
        } catch (const std::exception&) {
            file.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw;
        }
        file.flush();
        if (!file.good()) {
            file.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw std::runtime_error("Write to " + tmp.string() + " failed");
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Cannot replace " + target.string() + ": " + ec.message());
    }
}

} // namespace quarry
