#include "toon_io.hpp"

namespace toonpp {

namespace {

// CRLF input
void strip_cr(std::string_view& line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
}

} // namespace

const std::string& LineReader::filepath() const {
    static const std::string empty;
    return empty;
}

bool StringReader::next_line(std::string_view& out_line, size_t& out_line_no) {
    if (pos_ >= text_.size()) {
        return false;
    }

    size_t newline = text_.find('\n', pos_);
    if (newline == std::string_view::npos) {
        out_line = text_.substr(pos_);
        pos_ = text_.size();
    } else {
        out_line = text_.substr(pos_, newline - pos_);
        pos_ = newline + 1;
    }

    strip_cr(out_line);
    out_line_no = ++line_no_;
    return true;
}

FileReader::FileReader(const std::string& filepath, size_t chunk_size)
    : filepath_(filepath), chunk_size_(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE) {
    file_.open(filepath, std::ios::binary);
    if (!file_.is_open()) {
        has_error_ = true;
        error_message_ = "Cannot open file: " + filepath;
    }
}

bool FileReader::read_chunk() {
    if (eof_reached_ || !file_.is_open()) {
        return false;
    }

    // Drop consumed lines before appending
    buffer_.erase(0, pos_);
    pos_ = 0;

    size_t old_size = buffer_.size();
    buffer_.resize(old_size + chunk_size_);
    file_.read(&buffer_[old_size], static_cast<std::streamsize>(chunk_size_));
    size_t bytes_read = static_cast<size_t>(file_.gcount());
    buffer_.resize(old_size + bytes_read);

    if (bytes_read == 0 || file_.eof()) {
        eof_reached_ = true;
    }
    return bytes_read > 0;
}

bool FileReader::next_line(std::string_view& out_line, size_t& out_line_no) {
    if (has_error_) {
        return false;
    }

    size_t newline = buffer_.find('\n', pos_);
    while (newline == std::string::npos) {
        size_t searched = buffer_.size() - pos_;
        if (!read_chunk()) {
            break;
        }
        newline = buffer_.find('\n', searched);
    }

    if (newline == std::string::npos) {
        // Final line without a trailing newline
        if (pos_ >= buffer_.size()) {
            return false;
        }
        out_line = std::string_view(buffer_).substr(pos_);
        pos_ = buffer_.size();
    } else {
        out_line = std::string_view(buffer_).substr(pos_, newline - pos_);
        pos_ = newline + 1;
    }

    strip_cr(out_line);
    out_line_no = ++line_no_;
    return true;
}

// WriteBuffer implementation
WriteBuffer::WriteBuffer(size_t initial_capacity) {
    data_.reserve(initial_capacity);
}

void WriteBuffer::append(const char* data, size_t len) {
    data_.insert(data_.end(), data, data + len);
}

void WriteBuffer::append(std::string_view sv) {
    append(sv.data(), sv.size());
}

void WriteBuffer::append_char(char c) {
    data_.push_back(c);
}

void WriteBuffer::append_repeat(char c, size_t count) {
    data_.insert(data_.end(), count, c);
}

bool WriteBuffer::write_to_file(const std::string& filepath) const {
    std::ofstream out(filepath, std::ios::binary);
    if (!out.is_open()) {
        return false;
    }
    out.write(data_.data(), static_cast<std::streamsize>(data_.size()));
    return out.good();
}

} // namespace toonpp
