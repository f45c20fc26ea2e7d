#include "respkv/net/io.hpp"

#include <sys/socket.h>
#include <sys/types.h>

#include <cerrno>
#include <cstring>

namespace respkv::net {

namespace {

void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace

// STREAM -----------------------------------------------------------------------------------------

std::optional<std::string> StreamReader::read_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        if (in_.bad()) {
            throw IoError("stream read failed");
        }
        return std::nullopt;
    }
    // getline succeeded but hit eof: the last line had no terminator
    if (in_.eof()) {
        throw IoError("stream ended mid-line");
    }
    strip_cr(line);
    return line;
}

std::string StreamReader::read_exact(std::size_t n) {
    std::string data(n, '\0');
    in_.read(data.data(), static_cast<std::streamsize>(n));
    if (static_cast<std::size_t>(in_.gcount()) != n) {
        throw IoError("stream ended after " + std::to_string(in_.gcount()) + " of " +
                      std::to_string(n) + " bytes");
    }
    return data;
}

void StreamWriter::write(std::string_view data) {
    out_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out_) {
        throw IoError("stream write failed");
    }
}

// SOCKET -----------------------------------------------------------------------------------------

bool SocketReader::fill() {
    char chunk[kChunkSize];
    while (true) {
        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
            return true;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // SO_RCVTIMEO expired
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw IoError("read timed out");
        }
        throw IoError("read failed: " + std::string(strerror(errno)));
    }
}

std::optional<std::string> SocketReader::read_line() {
    std::size_t scanned = 0;
    while (true) {
        std::size_t pos = buffer_.find('\n', scanned);
        if (pos != std::string::npos) {
            std::string line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            strip_cr(line);
            return line;
        }
        if (buffer_.size() > kMaxLineLength) {
            throw IoError("line exceeds " + std::to_string(kMaxLineLength) + " bytes");
        }
        scanned = buffer_.size();
        if (!fill()) {
            if (buffer_.empty()) {
                return std::nullopt;
            }
            throw IoError("connection closed mid-line");
        }
    }
}

std::string SocketReader::read_exact(std::size_t n) {
    while (buffer_.size() < n) {
        if (!fill()) {
            throw IoError("connection closed mid-message");
        }
    }
    std::string data = buffer_.substr(0, n);
    buffer_.erase(0, n);
    return data;
}

void SocketWriter::write(std::string_view data) {
    std::size_t total_sent = 0;
    while (total_sent < data.size()) {
        // MSG_NOSIGNAL: a dead peer gives EPIPE instead of killing the process with SIGPIPE
        ssize_t sent = send(fd_, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IoError("write failed: " + std::string(strerror(errno)));
        }
        total_sent += static_cast<std::size_t>(sent);
    }
}

}  // namespace respkv::net
