#include <mender/html/char_source.h>
#include <mender/core/config.h>
#include <mender/core/error.h>
#include <algorithm>
#include <stdexcept>

namespace mender::html {

namespace {

constexpr std::size_t kReadChunk = 8192;
constexpr std::size_t kCompactThreshold = 1 << 16;
constexpr std::size_t kMaxCharBytes = 4;

} // namespace

CharSource::CharSource(std::string bytes, const CharSourceOptions& options)
    : bytes_(std::move(bytes)), bytes_eof_(true) {
    init(options);
}

CharSource::CharSource(std::istream& in, const CharSourceOptions& options)
    : stream_(&in) {
    init(options);
}

void CharSource::init(const CharSourceOptions& options) {
    normalize_newlines_ = options.normalize_newlines;
    fill_bytes(core::config::kEncodingSniffLimit);
    std::string_view prefix(bytes_);
    prefix = prefix.substr(0, std::min(prefix.size(), core::config::kEncodingSniffLimit));
    decision_ = determine_encoding(prefix, options.default_encoding,
                                   options.ignore_declared_charset);
    byte_pos_ = decision_.bom_length;
}

void CharSource::fill_bytes(std::size_t wanted) {
    while (!bytes_eof_ && bytes_.size() - byte_pos_ < wanted) {
        if (byte_pos_ > kCompactThreshold) {
            bytes_.erase(0, byte_pos_);
            byte_pos_ = 0;
        }
        char chunk[kReadChunk];
        stream_->read(chunk, static_cast<std::streamsize>(sizeof(chunk)));
        if (stream_->bad()) {
            throw core::IoError("failed to read from input stream");
        }
        auto count = stream_->gcount();
        bytes_.append(chunk, static_cast<std::size_t>(count));
        if (count == 0 || stream_->eof()) {
            bytes_eof_ = true;
        }
    }
}

std::int32_t CharSource::decode_next() {
    fill_bytes(kMaxCharBytes * 2);
    if (byte_pos_ >= bytes_.size()) {
        return kEof;
    }
    std::string_view view(bytes_);
    auto decoded = decode_char(decision_.encoding, view, byte_pos_);
    byte_pos_ += decoded.length;

    if (normalize_newlines_ && decoded.code_point == '\r') {
        if (byte_pos_ < bytes_.size()) {
            auto next = decode_char(decision_.encoding, view, byte_pos_);
            if (next.code_point == '\n') {
                byte_pos_ += next.length;
            }
        }
        return '\n';
    }
    return static_cast<std::int32_t>(decoded.code_point);
}

std::int32_t CharSource::read() {
    Entry entry;
    if (!pushback_.empty()) {
        entry = pushback_.back();
        pushback_.pop_back();
    } else {
        std::int32_t c = decode_next();
        if (c == kEof) {
            return kEof;
        }
        entry.c = static_cast<char32_t>(c);
        entry.before = position_;
    }

    position_ = entry.before;
    ++position_.offset;
    if (entry.c == '\n') {
        ++position_.line;
        position_.column = 1;
    } else {
        ++position_.column;
    }

    history_.push_back(entry);
    if (history_.size() > core::config::kMaxRewind) {
        history_.pop_front();
    }
    return static_cast<std::int32_t>(entry.c);
}

std::int32_t CharSource::peek() {
    std::int32_t c = read();
    if (c != kEof) {
        rewind(1);
    }
    return c;
}

bool CharSource::at_end() {
    return peek() == kEof;
}

void CharSource::rewind(std::size_t count) {
    if (count > history_.size()) {
        throw std::logic_error("rewind past the retained character window");
    }
    for (std::size_t i = 0; i < count; ++i) {
        Entry entry = history_.back();
        history_.pop_back();
        position_ = entry.before;
        pushback_.push_back(entry);
    }
}

} // namespace mender::html
