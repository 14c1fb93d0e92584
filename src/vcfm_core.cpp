#include "vcfm_core.h"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>
#include <zlib.h>

namespace vcfm {

void rtrim(std::string &str) {
    auto last = str.find_last_not_of(" \t\n\r\f\v");
    if (last == std::string::npos) {
        str.clear();
    } else {
        str.erase(last + 1);
    }
}

bool flag_present(int argc, char *argv[], const char *long_flag, const char *short_flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], long_flag) == 0 || (short_flag && std::strcmp(argv[i], short_flag) == 0)) {
            return true;
        }
    }
    return false;
}

void print_error(const std::string &msg, std::ostream &os) { os << "Error: " << msg << '\n'; }

void print_warning(const std::string &msg, std::ostream &os) { os << "Warning: " << msg << '\n'; }

void print_version(const std::string &tool, const std::string &version, std::ostream &os) {
    os << tool << " version " << version << '\n';
}

// ------------------------------------------------------------
// StreamingGzipReader Implementation
// ------------------------------------------------------------

StreamingGzipReader::StreamingGzipReader(std::istream &in)
    : in_(in), inBuf_(new char[CHUNK_SIZE]), outBuf_(new char[CHUNK_SIZE]) {
    // Check for gzip magic bytes
    int c1 = in_.get();
    if (c1 == EOF) {
        eof_ = true;
        return;
    }
    int c2 = in_.get();
    if (c2 == EOF) {
        // Single byte input: clear eofbit so the byte can be read back
        in_.clear();
        in_.putback(static_cast<char>(c1));
        isCompressed_ = false;
        return;
    }

    isCompressed_ = (static_cast<unsigned char>(c1) == 0x1f && static_cast<unsigned char>(c2) == 0x8b);

    in_.putback(static_cast<char>(c2));
    in_.putback(static_cast<char>(c1));

    if (isCompressed_) {
        if (!initZlib()) {
            error_ = true;
        }
    }
}

StreamingGzipReader::~StreamingGzipReader() {
    if (zstrm_) {
        z_stream *strm = static_cast<z_stream *>(zstrm_);
        inflateEnd(strm);
        delete strm;
        zstrm_ = nullptr;
    }
}

bool StreamingGzipReader::initZlib() {
    z_stream *strm = new z_stream;
    std::memset(strm, 0, sizeof(z_stream));

    // 15 + 32 enables gzip decoding with automatic header detection
    if (inflateInit2(strm, 15 + 32) != Z_OK) {
        delete strm;
        return false;
    }

    zstrm_ = strm;
    return true;
}

int StreamingGzipReader::decompressChunk() {
    if (!zstrm_ || error_) {
        return -1;
    }

    z_stream *strm = static_cast<z_stream *>(zstrm_);

    if (strm->avail_in == 0) {
        size_t got = 0;
        if (!in_.eof()) {
            in_.read(inBuf_.get(), CHUNK_SIZE);
            got = static_cast<size_t>(in_.gcount());
        }
        if (got == 0 || in_.bad()) {
            if (memberEnded_ && !in_.bad()) {
                eof_ = true;
                return 0;
            }
            // Input ended in the middle of a gzip member
            error_ = true;
            return -1;
        }
        strm->avail_in = static_cast<uInt>(got);
        strm->next_in = reinterpret_cast<Bytef *>(inBuf_.get());
    }

    strm->avail_out = CHUNK_SIZE;
    strm->next_out = reinterpret_cast<Bytef *>(outBuf_.get());

    int ret = inflate(strm, Z_NO_FLUSH);

    if (ret == Z_STREAM_ERROR || ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
        error_ = true;
        return -1;
    }

    size_t have = CHUNK_SIZE - strm->avail_out;

    memberEnded_ = (ret == Z_STREAM_END);
    if (memberEnded_) {
        // Concatenated gzip members (BGZF): reset for the next one
        inflateReset(strm);
    }

    return static_cast<int>(have);
}

bool StreamingGzipReader::readUncompressed() {
    if (in_.eof()) {
        eof_ = true;
        return false;
    }

    in_.read(outBuf_.get(), CHUNK_SIZE);
    size_t bytesRead = static_cast<size_t>(in_.gcount());

    if (bytesRead == 0) {
        eof_ = true;
        return false;
    }

    lineBuffer_.append(outBuf_.get(), bytesRead);
    return true;
}

bool StreamingGzipReader::getline(std::string &line) {
    line.clear();

    if (error_) {
        return false;
    }

    while (true) {
        size_t newlinePos = lineBuffer_.find('\n');
        if (newlinePos != std::string::npos) {
            if (newlinePos > 0 && lineBuffer_[newlinePos - 1] == '\r') {
                line = lineBuffer_.substr(0, newlinePos - 1);
            } else {
                line = lineBuffer_.substr(0, newlinePos);
            }
            lineBuffer_.erase(0, newlinePos + 1);
            return true;
        }

        if (eof_) {
            // Return remaining data as last line
            if (!lineBuffer_.empty()) {
                line = std::move(lineBuffer_);
                lineBuffer_.clear();
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                return true;
            }
            return false;
        }

        if (isCompressed_) {
            int bytesDecompressed = decompressChunk();
            if (bytesDecompressed < 0) {
                return false;
            }
            if (bytesDecompressed > 0) {
                lineBuffer_.append(outBuf_.get(), static_cast<size_t>(bytesDecompressed));
            }
        } else if (!readUncompressed() && lineBuffer_.empty()) {
            return false;
        }
    }
}

// ------------------------------------------------------------
// LineSource
// ------------------------------------------------------------

bool LineSource::getline(std::string &line) {
    if (hasPending_) {
        line = std::move(pending_);
        pending_.clear();
        hasPending_ = false;
        return true;
    }
    return readLine(line);
}

void LineSource::unget(std::string line) {
    pending_ = std::move(line);
    hasPending_ = true;
}

ReaderLineSource::ReaderLineSource(std::istream &in) : reader_(in) {
    if (reader_.error()) {
        throw InputError("failed to initialise decompression");
    }
}

ReaderLineSource::ReaderLineSource(std::unique_ptr<std::istream> in) : owned_(std::move(in)), reader_(*owned_) {
    if (reader_.error()) {
        throw InputError("failed to initialise decompression");
    }
}

bool ReaderLineSource::readLine(std::string &line) {
    if (reader_.getline(line)) {
        return true;
    }
    if (reader_.error()) {
        throw InputError("corrupt or truncated compressed input");
    }
    return false;
}

std::unique_ptr<LineSource> open_line_source(const std::string &path) {
    if (path == "-") {
        return std::make_unique<ReaderLineSource>(std::cin);
    }
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        throw InputError("cannot open file: " + path);
    }
    return std::make_unique<ReaderLineSource>(std::move(file));
}

} // namespace vcfm
