#ifndef VCFM_OUTPUT_SINK_H
#define VCFM_OUTPUT_SINK_H

#include "../VCFM_header_extractor/VCFM_header_extractor.h"
#include "../VCFM_record_stream/VCFM_record_stream.h"
#include <iostream>
#include <string>
#include <vector>

// Buffered VCF text writer. Output is flushed when the buffer fills, on
// flush() and on destruction.
class VcfWriter {
  public:
    explicit VcfWriter(std::ostream &out);
    ~VcfWriter();

    VcfWriter(const VcfWriter &) = delete;
    VcfWriter &operator=(const VcfWriter &) = delete;

    // ##fileformat, other lines, FORMAT, INFO, contig, FILTER, #CHROM line
    void writeHeader(const VcfHeader &header);

    // One tab-joined data line
    void writeRecord(const MergeRecord &record);

    void flush();

    size_t recordsWritten() const { return records_; }

  private:
    static constexpr size_t BUFFER_SIZE = 1024 * 1024; // 1MB buffer

    void writeLine(const std::string &line);
    void writeDefinitions(const DefinitionMap &defs);

    std::ostream &out_;
    std::string buffer_;
    size_t records_ = 0;
};

#endif // VCFM_OUTPUT_SINK_H
