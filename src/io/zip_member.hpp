// ============================================================================
// io/zip_member.hpp - Buffered sequential reads of a member inside a zip archive
// ============================================================================
#pragma once
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <zip.h>
#include "read_error.hpp"

namespace accelio {

struct ZipArchiveCloser {
    void operator()(zip_t* archive) const {
        if (archive) zip_discard(archive);
    }
};

struct ZipFileCloser {
    void operator()(zip_file_t* file) const {
        if (file) zip_fclose(file);
    }
};

using ZipArchivePtr = std::unique_ptr<zip_t, ZipArchiveCloser>;
using ZipFilePtr = std::unique_ptr<zip_file_t, ZipFileCloser>;

inline ZipArchivePtr open_zip_archive(const std::string& path, int& error) {
    error = 0;
    return ZipArchivePtr(zip_open(path.c_str(), ZIP_RDONLY, &error));
}

inline bool zip_has_member(zip_t* archive, const std::string& name) {
    return zip_name_locate(archive, name.c_str(), 0) >= 0;
}

// Forward-only reader over one archive member. Members are usually deflated,
// so there is no seeking: callers that need two passes reopen the member.
class ZipMemberStream {
private:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;

    ZipFilePtr file;
    std::string name;
    std::vector<uint8_t> buffer;
    size_t pos = 0;
    size_t end = 0;
    bool at_end = false;

public:
    bool open(zip_t* archive, const std::string& member) {
        close();
        file.reset(zip_fopen(archive, member.c_str(), 0));
        if (!file) return false;
        name = member;
        buffer.resize(BUFFER_SIZE);
        return true;
    }

    void close() {
        file.reset();
        std::vector<uint8_t>().swap(buffer);
        pos = end = 0;
        at_end = false;
    }

    bool is_open() const { return bool(file); }

    // Copies up to n bytes; fewer only when the member ends.
    size_t read(uint8_t* dst, size_t n) {
        size_t copied = 0;
        while (copied < n) {
            if (pos == end && !fill()) break;
            size_t chunk = std::min(n - copied, end - pos);
            std::memcpy(dst + copied, buffer.data() + pos, chunk);
            pos += chunk;
            copied += chunk;
        }
        return copied;
    }

    bool read_byte(uint8_t& b) { return read(&b, 1) == 1; }

    // Reads the rest of the member.
    std::string read_all() {
        std::string out;
        uint8_t chunk[4096];
        size_t got;
        while ((got = read(chunk, sizeof(chunk))) > 0) {
            out.append(reinterpret_cast<const char*>(chunk), got);
        }
        return out;
    }

private:
    bool fill() {
        if (at_end || !file) return false;
        zip_int64_t got = zip_fread(file.get(), buffer.data(), buffer.size());
        if (got < 0) {
            throw ReadError(ErrorCode::Io, "reading " + name + " from archive: "
                            + zip_error_strerror(zip_file_get_error(file.get())));
        }
        if (got == 0) {
            at_end = true;
            return false;
        }
        pos = 0;
        end = size_t(got);
        return true;
    }
};

} // namespace accelio
