#ifndef VCFM_CORE_H
#define VCFM_CORE_H

#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace vcfm {

// Malformed VCF content (metadata or data line)
class ParseError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Input could not be opened or decoded
class InputError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Remove trailing whitespace in place
void rtrim(std::string &str);

// Convenience helpers for printing common messages
void print_error(const std::string &msg, std::ostream &os = std::cerr);
void print_warning(const std::string &msg, std::ostream &os = std::cerr);
void print_version(const std::string &tool, const std::string &version, std::ostream &os = std::cout);

inline std::string get_version() {
#ifdef VCFM_VERSION
    return VCFM_VERSION;
#else
    return "unknown";
#endif
}

inline bool handle_version_flag(int argc, char *argv[], const std::string &tool, std::ostream &os = std::cout) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--version") == 0 || std::strcmp(argv[i], "-v") == 0) {
            print_version(tool, get_version(), os);
            return true;
        }
    }
    return false;
}

// Check if a specific flag (long or short form) is present
bool flag_present(int argc, char *argv[], const char *long_flag, const char *short_flag = nullptr);

// Handle the --help flag using the provided callback. Returns true if the flag
// was found and handled.
inline bool handle_help_flag(int argc, char *argv[], void (*print_help)()) {
    if (flag_present(argc, argv, "--help", "-h")) {
        if (print_help)
            print_help();
        return true;
    }
    return false;
}

// Handle both --help and --version flags. Returns true if either flag was found
// and processed (in which case the caller should exit).
inline bool handle_common_flags(int argc, char *argv[], const std::string &tool, void (*print_help)(),
                                std::ostream &os = std::cout) {
    if (handle_help_flag(argc, argv, print_help))
        return true;
    return handle_version_flag(argc, argv, tool, os);
}

// ------------------------------------------------------------
// StreamingGzipReader: Line-by-line reading with bounded memory
// ------------------------------------------------------------
// Streams gzip/BGZF (or plain) input one line at a time without loading the
// entire file into memory. Memory usage: O(chunk_size + line_length).
//
// Usage:
//   std::ifstream file("data.vcf.gz", std::ios::binary);
//   vcfm::StreamingGzipReader reader(file);
//   std::string line;
//   while (reader.getline(line)) {
//       // process line
//   }
//
class StreamingGzipReader {
  public:
    // The stream should be opened in binary mode
    explicit StreamingGzipReader(std::istream &in);

    ~StreamingGzipReader();

    StreamingGzipReader(const StreamingGzipReader &) = delete;
    StreamingGzipReader &operator=(const StreamingGzipReader &) = delete;

    // Read the next line (without newline character)
    // Returns true if a line was read, false on EOF or error
    bool getline(std::string &line);

    bool error() const { return error_; }

    // Check if the input was actually gzip compressed
    bool is_compressed() const { return isCompressed_; }

  private:
    static constexpr size_t CHUNK_SIZE = 65536; // 64KB chunks

    std::istream &in_;
    bool isCompressed_ = false;
    bool eof_ = false;
    bool error_ = false;
    // True between the end of one gzip member and the start of the next
    bool memberEnded_ = false;

    // zlib stream (opaque pointer to avoid exposing zlib in header)
    void *zstrm_ = nullptr;

    std::unique_ptr<char[]> inBuf_;
    std::unique_ptr<char[]> outBuf_;

    // Line buffer for accumulating partial lines
    std::string lineBuffer_;

    bool initZlib();

    // Returns number of bytes decompressed, 0 on EOF, -1 on error
    int decompressChunk();

    bool readUncompressed();
};

// ------------------------------------------------------------
// LineSource: ordered sequence of decoded text lines
// ------------------------------------------------------------
// One line of pushback lets a header parser hand the first data line over to
// whoever reads the records next.
class LineSource {
  public:
    virtual ~LineSource() = default;

    // Next line without its newline; false once the input is exhausted.
    // Throws InputError if the underlying input cannot be decoded.
    bool getline(std::string &line);

    // Push a line back; the next getline() returns it
    void unget(std::string line);

  protected:
    virtual bool readLine(std::string &line) = 0;

  private:
    bool hasPending_ = false;
    std::string pending_;
};

// LineSource over any istream, decompressing gzip/BGZF transparently
class ReaderLineSource : public LineSource {
  public:
    // Borrows 'in', which must outlive this object
    explicit ReaderLineSource(std::istream &in);
    // Takes ownership of 'in'
    explicit ReaderLineSource(std::unique_ptr<std::istream> in);

    bool is_compressed() const { return reader_.is_compressed(); }

  protected:
    bool readLine(std::string &line) override;

  private:
    std::unique_ptr<std::istream> owned_;
    StreamingGzipReader reader_;
};

// Open a path ("-" for standard input) as a LineSource.
// Throws InputError if the file cannot be opened.
std::unique_ptr<LineSource> open_line_source(const std::string &path);

} // namespace vcfm

#endif // VCFM_CORE_H
