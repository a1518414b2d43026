// mmap_file.hpp - read-only memory mapped input files
// schneller als fread, kein kopieren vom kernel in userspace
#pragma once

#include <cstddef>
#include <cstdint>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace imgshrink::mmapfile {

class MappedFile {
public:
    MappedFile() = default;
    ~MappedFile() { close(); }

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    MappedFile(MappedFile&& other) noexcept
        : data_(other.data_), size_(other.size_), fd_(other.fd_) {
        other.data_ = nullptr;
        other.size_ = 0;
        other.fd_ = -1;
    }

    MappedFile& operator=(MappedFile&& other) noexcept {
        if (this != &other) {
            close();
            data_ = other.data_;
            size_ = other.size_;
            fd_ = other.fd_;
            other.data_ = nullptr;
            other.size_ = 0;
            other.fd_ = -1;
        }
        return *this;
    }

    // false wenn das file nicht lesbar ist. leere files gehen auf, size() == 0
    bool open(const char* path) {
        close();

        fd_ = ::open(path, O_RDONLY);
        if (fd_ < 0) return false;

        struct stat st;
        if (fstat(fd_, &st) < 0 || !S_ISREG(st.st_mode)) {
            close();
            return false;
        }
        size_ = static_cast<size_t>(st.st_size);

        // mmap mit länge 0 geht nicht
        if (size_ == 0) return true;

        void* mapped = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (mapped == MAP_FAILED) {
            close();
            return false;
        }
        data_ = mapped;

        // decoder liest eh von vorne nach hinten
        madvise(data_, size_, MADV_SEQUENTIAL);
        return true;
    }

    void close() {
        if (data_) {
            munmap(data_, size_);
            data_ = nullptr;
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        size_ = 0;
    }

    const uint8_t* data() const { return static_cast<const uint8_t*>(data_); }
    size_t size() const { return size_; }
    bool is_open() const { return fd_ >= 0; }

private:
    void* data_ = nullptr;
    size_t size_ = 0;
    int fd_ = -1;
};

} // namespace imgshrink::mmapfile
