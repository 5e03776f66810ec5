#include "lostore/bindings/spool.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <string>

#include <unistd.h>

namespace lostore::bindings::http {

using namespace lostore::core;

static Status io_error() {
    return make_status(StatusDomain::Http, StatusCode::Io, static_cast<u32>(errno));
}

static Status write_fully(int fd, const u8* data, u64 len) {
    u64 done = 0;
    while (done < len) {
        ssize_t n = ::write(fd, data + done, len - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error();
        }
        done += static_cast<u64>(n);
    }
    return ok_status();
}

SpoolBuffer::SpoolBuffer(u64 max_memory) noexcept : max_memory_(max_memory) {}

SpoolBuffer::~SpoolBuffer() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Status SpoolBuffer::spill() noexcept {
    const char* dir = std::getenv("TMPDIR");
    std::string tmpl = (dir && *dir) ? dir : "/tmp";
    tmpl += "/lostore-spool-XXXXXX";

    int fd = ::mkstemp(tmpl.data());
    if (fd < 0) {
        return io_error();
    }
    // The file lives only as long as the descriptor.
    ::unlink(tmpl.c_str());

    Status s = write_fully(fd, mem_.data(), mem_.size());
    if (!is_ok(s)) {
        ::close(fd);
        return s;
    }
    fd_ = fd;
    mem_.clear();
    mem_.shrink_to_fit();
    return ok_status();
}

Status SpoolBuffer::write(const u8* data, u64 len) noexcept {
    if (len == 0) {
        return ok_status();
    }
    if (!data) {
        return make_status(StatusDomain::Http, StatusCode::Invalid);
    }
    if (fd_ < 0 && size_ + len > max_memory_) {
        Status s = spill();
        if (!is_ok(s)) {
            return s;
        }
    }
    if (fd_ >= 0) {
        Status s = write_fully(fd_, data, len);
        if (!is_ok(s)) {
            return s;
        }
    } else {
        mem_.insert(mem_.end(), data, data + len);
    }
    size_ += len;
    return ok_status();
}

Status SpoolBuffer::rewind() noexcept {
    read_pos_ = 0;
    return ok_status();
}

Status SpoolBuffer::read(u64 n, Bytes* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Http, StatusCode::Invalid);
    }
    const u64 take = std::min(n, size_ - read_pos_);
    out->resize(take);
    if (take == 0) {
        return ok_status();
    }

    if (fd_ < 0) {
        std::copy_n(mem_.data() + read_pos_, take, out->data());
        read_pos_ += take;
        return ok_status();
    }

    u64 got = 0;
    while (got < take) {
        ssize_t r = ::pread(fd_, out->data() + got, take - got, static_cast<off_t>(read_pos_ + got));
        if (r < 0) {
            if (errno == EINTR) continue;
            return io_error();
        }
        if (r == 0) {
            return make_status(StatusDomain::Http, StatusCode::Corrupt);
        }
        got += static_cast<u64>(r);
    }
    read_pos_ += take;
    return ok_status();
}

Status SpoolBuffer::read_all(Bytes* out) noexcept {
    return read(size_ - read_pos_, out);
}

} // namespace lostore::bindings::http
