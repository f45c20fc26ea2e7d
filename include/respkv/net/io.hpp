#ifndef RESPKV_NET_IO_HPP
#define RESPKV_NET_IO_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace respkv::net {

// transport / decode failure. fatal to the connection it happened on, never turned into a reply
class IoError : public std::runtime_error {
   public:
    explicit IoError(const std::string& msg) : std::runtime_error(msg) {}
};

class ByteReader {
   public:
    virtual ~ByteReader() = default;

    /*
        next line without its terminator. lines end at LF, a CR right before it is dropped.
        returns nullopt when the input is exhausted before any byte of a new line,
        throws IoError when it ends in the middle of one.
    */
    [[nodiscard]] virtual std::optional<std::string> read_line() = 0;

    // exactly n bytes or IoError
    [[nodiscard]] virtual std::string read_exact(std::size_t n) = 0;
};

class ByteWriter {
   public:
    virtual ~ByteWriter() = default;
    virtual void write(std::string_view data) = 0;
};

class StreamReader : public ByteReader {
   public:
    explicit StreamReader(std::istream& in) : in_(in) {}

    [[nodiscard]] std::optional<std::string> read_line() override;
    [[nodiscard]] std::string read_exact(std::size_t n) override;

   private:
    std::istream& in_;
};

class StreamWriter : public ByteWriter {
   public:
    explicit StreamWriter(std::ostream& out) : out_(out) {}

    void write(std::string_view data) override;

   private:
    std::ostream& out_;
};

// does not own the descriptor
class SocketReader : public ByteReader {
   public:
    explicit SocketReader(int fd) : fd_(fd) {}

    [[nodiscard]] std::optional<std::string> read_line() override;
    [[nodiscard]] std::string read_exact(std::size_t n) override;

   private:
    // appends one recv() worth of data to buffer_, false on orderly shutdown by the peer
    bool fill();

    static constexpr std::size_t kChunkSize = 4096;
    // bulk payloads go through read_exact and are not bound by this
    static constexpr std::size_t kMaxLineLength = 64 * 1024;

    int fd_;
    std::string buffer_;
};

class SocketWriter : public ByteWriter {
   public:
    explicit SocketWriter(int fd) : fd_(fd) {}

    void write(std::string_view data) override;

   private:
    int fd_;
};

}  // namespace respkv::net

#endif
