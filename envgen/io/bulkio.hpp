#pragma once

// Read or write the contents of a file in toto.

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace io {

struct bulkio_error: std::runtime_error {
    bulkio_error(std::string what): std::runtime_error(std::move(what)) {}
};

inline std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string read_all(const std::string& filename) {
    try {
        std::ifstream fs;
        fs.exceptions(std::ios::failbit);
        fs.open(filename);
        return read_all(fs);
    }
    catch (const std::exception&) {
        throw bulkio_error("failure reading "+filename);
    }
}

inline void write_all(const std::string& data, std::ostream& out) {
    auto end = std::copy(data.begin(), data.end(), std::ostreambuf_iterator<char>(out));
    if (end.failed() || !out.flush()) {
        throw bulkio_error("short write");
    }
}

inline void write_all(const std::string& data, const std::string& filename) {
    try {
        std::ofstream fs;
        fs.exceptions(std::ios::failbit | std::ios::badbit);
        fs.open(filename);
        write_all(data, fs);
        fs.close();
    }
    catch (const std::exception&) {
        throw bulkio_error("failure writing "+filename);
    }
}

// Write data to filename unless the file already holds exactly that
// content, leaving its timestamp untouched. Returns true if written.

inline bool write_if_changed(const std::string& data, const std::string& filename) {
    std::ifstream existing(filename, std::ios::binary);
    if (existing && read_all(existing)==data) return false;
    existing.close();

    write_all(data, filename);
    return true;
}

} // namespace io
