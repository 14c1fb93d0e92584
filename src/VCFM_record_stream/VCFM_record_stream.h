#ifndef VCFM_RECORD_STREAM_H
#define VCFM_RECORD_STREAM_H

#include "vcfm_core.h"
#include <iostream>
#include <string>
#include <vector>

// A data line ready for output, keyed for the merge
struct MergeRecord {
    std::string chrom;
    long pos = 0;
    size_t rank = 0; // index of the input it came from
    std::vector<std::string> fields;

    // Comparator for min-heap (smallest first, so use > for priority_queue)
    bool operator>(const MergeRecord &other) const;
};

// Pull-based producer of records
class RecordSource {
  public:
    virtual ~RecordSource() = default;

    // Fill 'record' with the next record; false when exhausted
    virtual bool next(MergeRecord &record) = 0;
};

// Genotype is one of ".", "./.", "0/0", ".|.", "0|0"
bool isUninformativeGenotype(const std::string &gt);

// True if the leading (pre-':') genotype of every sample column in
// fields[first, end) is uninformative. Vacuously true with no samples.
bool allSamplesUninformative(const std::vector<std::string> &fields, size_t first);

class RecordStream : public RecordSource {
  public:
    // 'in' must outlive the stream and be positioned past the header.
    // 'headerSamples' is the number of samples the header declares; every
    // data line must carry that many sample columns.
    // 'name' labels the input in diagnostics.
    RecordStream(vcfm::LineSource &in, size_t headerSamples, std::vector<size_t> projection, size_t rank,
                 bool removeRef, std::string name, std::ostream &diag = std::cerr);

    // Throws vcfm::ParseError on a malformed data line
    bool next(MergeRecord &record) override;

    // Data lines read so far
    size_t total() const { return total_; }
    // Data lines dropped by the remove-ref filter
    size_t skipped() const { return skipped_; }

  private:
    // Split, project and repair one data line
    void decodeLine(const std::string &line, MergeRecord &record);
    void checkOrder(const MergeRecord &record);

    vcfm::LineSource &in_;
    size_t headerSamples_;
    std::vector<size_t> projection_;
    size_t rank_;
    bool removeRef_;
    std::string name_;
    std::ostream &diag_;

    size_t total_ = 0;
    size_t skipped_ = 0;
    bool finished_ = false;
    size_t lineNumber_ = 0;

    std::string line_;
    std::vector<std::string> columns_;

    std::string lastChrom_;
    long lastPos_ = 0;
    bool unsortedReported_ = false;
};

#endif // VCFM_RECORD_STREAM_H
