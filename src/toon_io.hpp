#ifndef TOONPP_IO_HPP
#define TOONPP_IO_HPP

#include <string>
#include <string_view>
#include <fstream>
#include <vector>
#include <cstddef>

namespace toonpp {

// Producer of physical lines. A returned view stays valid until the next
// call to next_line().
class LineReader {
public:
    virtual ~LineReader() = default;

    // Returns false when no more lines available
    virtual bool next_line(std::string_view& out_line, size_t& out_line_no) = 0;

    // File path for error messages (empty if not reading from a file)
    virtual const std::string& filepath() const;
};

// Lines of an in-memory document. The text must outlive the reader.
class StringReader : public LineReader {
public:
    explicit StringReader(std::string_view text) : text_(text) {}

    bool next_line(std::string_view& out_line, size_t& out_line_no) override;

private:
    std::string_view text_;
    size_t pos_ = 0;
    size_t line_no_ = 0;
};

// Chunked file reader. Only the unread tail of the current chunk and the
// line being returned are kept in memory.
class FileReader : public LineReader {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024; // 4MB chunks

    explicit FileReader(const std::string& filepath, size_t chunk_size = DEFAULT_CHUNK_SIZE);

    bool next_line(std::string_view& out_line, size_t& out_line_no) override;

    const std::string& filepath() const override { return filepath_; }

    // Check for errors
    bool has_error() const { return has_error_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool read_chunk();

    std::ifstream file_;
    std::string filepath_;
    size_t chunk_size_;
    std::string buffer_;
    size_t pos_ = 0;
    size_t line_no_ = 0;
    bool eof_reached_ = false;
    bool has_error_ = false;
    std::string error_message_;
};

// Write buffer for efficient output
class WriteBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64 * 1024;

    WriteBuffer(size_t initial_capacity = DEFAULT_CAPACITY);

    void append(const char* data, size_t len);
    void append(std::string_view sv);
    void append_char(char c);
    void append_repeat(char c, size_t count);

    std::string str() const { return std::string(data_.begin(), data_.end()); }
    size_t size() const { return data_.size(); }
    void clear() { data_.clear(); }

    // Returns false if the file cannot be written
    bool write_to_file(const std::string& filepath) const;

private:
    std::vector<char> data_;
};

} // namespace toonpp

#endif // TOONPP_IO_HPP
